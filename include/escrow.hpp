#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace ud {

// Asset-transfer substrate. The engine never holds funds itself; it computes amounts
// and asks the escrow to move them. Everything between beginAtomic() and
// commitAtomic() must apply together or not at all.
class Escrow {
public:
    virtual ~Escrow() = default;

    virtual std::uint64_t balanceOf(const std::string& account) const = 0;
    // Returns false, with no effect, if the transfer cannot be performed.
    virtual bool transfer(std::uint64_t amount, const std::string& from, const std::string& to) = 0;

    virtual void beginAtomic() = 0;
    virtual void commitAtomic() = 0;
    virtual void rollbackAtomic() noexcept = 0;
};

using EscrowPtr = std::shared_ptr<Escrow>;

// Rolls the escrow back unless commit() was reached.
class EscrowScope {
public:
    explicit EscrowScope(Escrow& escrow);
    ~EscrowScope();

    EscrowScope(const EscrowScope&) = delete;
    EscrowScope& operator=(const EscrowScope&) = delete;

    void commit();

private:
    Escrow& escrow_;
    bool finished_ = false;
};

class InMemoryEscrow : public Escrow {
public:
    // Mints collateral into an account. Hosts use this to seed balances.
    void credit(const std::string& account, std::uint64_t amount);

    std::uint64_t balanceOf(const std::string& account) const override;
    bool transfer(std::uint64_t amount, const std::string& from, const std::string& to) override;

    void beginAtomic() override;
    void commitAtomic() override;
    void rollbackAtomic() noexcept override;

    bool inAtomicSection() const { return snapshot_.has_value(); }

private:
    std::map<std::string, std::uint64_t> balances_;
    std::optional<std::map<std::string, std::uint64_t>> snapshot_;
};

} // namespace ud
