#include "settlement.hpp"

#include "errors.hpp"
#include "protocol_config.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <limits>
#include <sstream>

namespace ud {

namespace mp = boost::multiprecision;

namespace {

std::uint64_t narrowAmount(const mp::uint128_t& value, const char* what) {
    if (value > mp::uint128_t(std::numeric_limits<std::uint64_t>::max())) {
        throw SettlementError(ErrorKind::InconsistentLedger,
                              std::string(what) + " exceeds the 64-bit amount range");
    }
    return value.convert_to<std::uint64_t>();
}

void checkFeePercent(std::uint32_t feePercent) {
    if (feePercent > kMaxFeePercent) {
        std::ostringstream oss;
        oss << "fee percent " << feePercent << " exceeds " << kMaxFeePercent;
        throw SettlementError(ErrorKind::InvalidParameter, oss.str());
    }
}

} // namespace

Direction winningDirection(const Market& market) {
    return market.endPrice > market.startPrice ? Direction::Up : Direction::Down;
}

std::uint64_t proportionalShare(std::uint64_t stake, std::uint64_t totalStake, std::uint64_t winningStake) {
    if (winningStake == 0) {
        throw SettlementError(ErrorKind::InconsistentLedger,
                              "winning side has no recorded stake to divide the pool by");
    }
    mp::uint128_t wide = mp::uint128_t(stake) * totalStake;
    wide /= winningStake;
    return narrowAmount(wide, "winnings");
}

std::uint64_t protocolFee(std::uint64_t winnings, std::uint32_t feePercent) {
    checkFeePercent(feePercent);
    mp::uint128_t wide = mp::uint128_t(winnings) * feePercent;
    wide /= kMaxFeePercent;
    return narrowAmount(wide, "fee");
}

SettlementQuote quoteClaim(const Market& market, const Prediction& prediction, std::uint32_t feePercent) {
    if (!market.resolved) {
        std::ostringstream oss;
        oss << "market " << market.id << " has not been resolved";
        throw SettlementError(ErrorKind::MarketNotResolved, oss.str());
    }

    SettlementQuote quote;
    quote.winningSide = winningDirection(market);
    if (prediction.direction != quote.winningSide) {
        std::ostringstream oss;
        oss << "prediction " << directionName(prediction.direction) << " lost; market " << market.id
            << " settled " << directionName(quote.winningSide);
        throw SettlementError(ErrorKind::InvalidPrediction, oss.str());
    }

    std::uint64_t winningStake = market.stakeOn(quote.winningSide);
    if (prediction.stake > winningStake) {
        throw SettlementError(ErrorKind::InconsistentLedger,
                              "prediction stake exceeds its side's recorded total");
    }
    quote.winnings = proportionalShare(prediction.stake, market.totalStake(), winningStake);
    quote.fee = protocolFee(quote.winnings, feePercent);
    quote.payout = quote.winnings - quote.fee;
    return quote;
}

MarketOdds quoteOdds(const Market& market, std::uint32_t feePercent) {
    checkFeePercent(feePercent);
    MarketOdds odds;
    std::uint64_t total = market.totalStake();
    odds.upGross = Fixed64::fromRatio(total, market.totalUpStake);
    odds.downGross = Fixed64::fromRatio(total, market.totalDownStake);
    Fixed64 retained = Fixed64::fromRatio(kMaxFeePercent - feePercent, kMaxFeePercent);
    odds.upNet = odds.upGross * retained;
    odds.downNet = odds.downGross * retained;
    return odds;
}

} // namespace ud
