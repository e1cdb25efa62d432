#pragma once

#include "fixed_point.hpp"
#include "market.hpp"
#include "prediction_ledger.hpp"

#include <cstdint>

namespace ud {

struct SettlementQuote {
    Direction winningSide = Direction::Down;
    std::uint64_t winnings = 0;
    std::uint64_t fee = 0;
    std::uint64_t payout = 0;
};

struct MarketOdds {
    // Gross multipliers: the whole pool over one side's stake.
    Fixed64 upGross;
    Fixed64 downGross;
    // Same multipliers after the protocol fee.
    Fixed64 upNet;
    Fixed64 downNet;
};

// Up wins only on a strict rise; an unchanged price settles Down.
Direction winningDirection(const Market& market);

// floor(stake * totalStake / winningStake) in 128-bit precision.
// Throws SettlementError(InconsistentLedger) for an empty winning side or a result
// that does not fit 64 bits.
std::uint64_t proportionalShare(std::uint64_t stake, std::uint64_t totalStake, std::uint64_t winningStake);

// floor(winnings * feePercent / 100).
std::uint64_t protocolFee(std::uint64_t winnings, std::uint32_t feePercent);

// Pure settlement of one ledger entry. Does not look at the claimed flag.
SettlementQuote quoteClaim(const Market& market, const Prediction& prediction, std::uint32_t feePercent);

MarketOdds quoteOdds(const Market& market, std::uint32_t feePercent);

} // namespace ud
