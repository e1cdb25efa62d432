#include "escrow.hpp"

#include <limits>
#include <stdexcept>

namespace ud {

EscrowScope::EscrowScope(Escrow& escrow)
    : escrow_(escrow) {
    escrow_.beginAtomic();
}

EscrowScope::~EscrowScope() {
    if (!finished_) {
        escrow_.rollbackAtomic();
    }
}

void EscrowScope::commit() {
    if (finished_) {
        throw std::logic_error("Escrow scope already finished");
    }
    escrow_.commitAtomic();
    finished_ = true;
}

void InMemoryEscrow::credit(const std::string& account, std::uint64_t amount) {
    if (account.empty()) {
        throw std::invalid_argument("Cannot credit an empty account id");
    }
    std::uint64_t& balance = balances_[account];
    if (balance > std::numeric_limits<std::uint64_t>::max() - amount) {
        throw std::overflow_error("Balance overflow crediting " + account);
    }
    balance += amount;
}

std::uint64_t InMemoryEscrow::balanceOf(const std::string& account) const {
    auto it = balances_.find(account);
    if (it == balances_.end()) {
        return 0;
    }
    return it->second;
}

bool InMemoryEscrow::transfer(std::uint64_t amount, const std::string& from, const std::string& to) {
    if (from.empty() || to.empty()) {
        return false;
    }
    if (amount == 0 || from == to) {
        return true;
    }
    auto src = balances_.find(from);
    if (src == balances_.end() || src->second < amount) {
        return false;
    }
    std::uint64_t destBalance = balanceOf(to);
    if (destBalance > std::numeric_limits<std::uint64_t>::max() - amount) {
        return false;
    }
    src->second -= amount;
    balances_[to] = destBalance + amount;
    return true;
}

void InMemoryEscrow::beginAtomic() {
    if (snapshot_) {
        throw std::logic_error("Escrow atomic section already open");
    }
    snapshot_ = balances_;
}

void InMemoryEscrow::commitAtomic() {
    if (!snapshot_) {
        throw std::logic_error("Escrow commit without an open atomic section");
    }
    snapshot_.reset();
}

void InMemoryEscrow::rollbackAtomic() noexcept {
    if (!snapshot_) {
        return;
    }
    balances_.swap(*snapshot_);
    snapshot_.reset();
}

} // namespace ud
