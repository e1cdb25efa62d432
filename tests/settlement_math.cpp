#include "settlement.hpp"
#include "test_support.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <vector>

namespace {

ud::Market resolvedMarket(std::uint64_t startPrice,
                          std::uint64_t endPrice,
                          std::uint64_t up,
                          std::uint64_t down) {
    ud::Market market;
    market.startPrice = startPrice;
    market.endPrice = endPrice;
    market.totalUpStake = up;
    market.totalDownStake = down;
    market.startBlock = 10;
    market.endBlock = 20;
    market.resolved = true;
    return market;
}

ud::Prediction predicted(ud::Direction direction, std::uint64_t stake) {
    ud::Prediction prediction;
    prediction.direction = direction;
    prediction.stake = stake;
    return prediction;
}

} // namespace

int main() {
    using namespace ud;
    using namespace ud::testing;
    suiteName() = "settlement_math";

    check(winningDirection(resolvedMarket(100, 101, 1, 1)) == Direction::Up, "strict rise settles up");
    check(winningDirection(resolvedMarket(100, 100, 1, 1)) == Direction::Down, "tie settles down");
    check(winningDirection(resolvedMarket(100, 99, 1, 1)) == Direction::Down, "fall settles down");

    check(proportionalShare(1'000'000, 4'000'000, 1'000'000) == 4'000'000, "sole winner takes the pool");
    check(proportionalShare(1, 3, 2) == 1, "share truncates toward zero");
    check(proportionalShare(2, 3, 2) == 3, "full side takes the pool");
    expectError(ErrorKind::InconsistentLedger,
                [] { proportionalShare(1, 10, 0); },
                "empty winning side");

    constexpr std::uint64_t big = std::uint64_t{ 1 } << 62;
    check(proportionalShare(big, big * 2, big) == big * 2, "products above 64 bits stay exact");
    constexpr std::uint64_t maxU64 = std::numeric_limits<std::uint64_t>::max();
    expectError(ErrorKind::InconsistentLedger,
                [&] { proportionalShare(maxU64, maxU64, 1); },
                "winnings beyond 64 bits");

    check(protocolFee(4'000'000, 2) == 80'000, "two percent fee");
    check(protocolFee(99, 2) == 1, "fee truncates");
    check(protocolFee(49, 2) == 0, "small winnings carry no fee");
    check(protocolFee(12'345, 0) == 0, "zero fee");
    check(protocolFee(12'345, 100) == 12'345, "full fee");
    check(protocolFee(maxU64, 100) == maxU64, "fee on the largest amount");
    expectError(ErrorKind::InvalidParameter, [] { protocolFee(100, 101); }, "fee above 100");

    // Reference scenario: A 1,000,000 up, B 3,000,000 down, price rises.
    Market scenario = resolvedMarket(50'000, 60'000, 1'000'000, 3'000'000);
    SettlementQuote quote = quoteClaim(scenario, predicted(Direction::Up, 1'000'000), 2);
    check(quote.winningSide == Direction::Up, "scenario winner");
    check(quote.winnings == 4'000'000, "scenario winnings");
    check(quote.fee == 80'000, "scenario fee");
    check(quote.payout == 3'920'000, "scenario payout");
    expectError(ErrorKind::InvalidPrediction,
                [&] { quoteClaim(scenario, predicted(Direction::Down, 3'000'000), 2); },
                "losing side");

    Market open = scenario;
    open.resolved = false;
    expectError(ErrorKind::MarketNotResolved,
                [&] { quoteClaim(open, predicted(Direction::Up, 1'000'000), 2); },
                "unresolved market");

    Market hollow = resolvedMarket(50'000, 60'000, 0, 3'000'000);
    expectError(ErrorKind::InconsistentLedger,
                [&] { quoteClaim(hollow, predicted(Direction::Up, 1'000'000), 2); },
                "winner without a recorded side total");

    // Conservation across uneven pools: every winner claiming never pays out more
    // than was staked.
    std::uint64_t seed = 0x9E3779B97F4A7C15ULL;
    auto nextStake = [&]() {
        seed = seed * 6364136223846793005ULL + 1442695040888963407ULL;
        return 1'000'000 + (seed >> 33) % 7'000'003;
    };
    for (int round = 0; round < 50; ++round) {
        std::vector<std::uint64_t> upStakes;
        std::vector<std::uint64_t> downStakes;
        const int upCount = 1 + round % 7;
        const int downCount = 1 + (round * 3) % 5;
        Market market = resolvedMarket(1'000, (round % 3 == 0) ? 1'000 : 2'000, 0, 0);
        for (int i = 0; i < upCount; ++i) {
            upStakes.push_back(nextStake());
            market.totalUpStake += upStakes.back();
        }
        for (int i = 0; i < downCount; ++i) {
            downStakes.push_back(nextStake());
            market.totalDownStake += downStakes.back();
        }
        const std::uint32_t fee = static_cast<std::uint32_t>(round % 11);
        Direction winner = winningDirection(market);
        const auto& winners = (winner == Direction::Up) ? upStakes : downStakes;

        std::uint64_t disbursed = 0;
        for (std::uint64_t stake : winners) {
            SettlementQuote q = quoteClaim(market, predicted(winner, stake), fee);
            check(q.payout + q.fee == q.winnings, "payout and fee split the winnings");
            check(q.winnings >= stake, "winners never receive less than their stake gross");
            disbursed += q.winnings;
        }
        check(disbursed <= market.totalStake(), "payouts plus fees exceed the pool");
        check(market.totalStake() - disbursed < winners.size(),
              "rounding dust must stay below one unit per winner");
    }

    MarketOdds odds = quoteOdds(scenario, 2);
    check(odds.upGross.toString() == "4.000000", "up gross odds");
    check(odds.downGross.raw() == 1'333'333, "down gross odds");
    check(odds.upNet.toString() == "3.920000", "up net odds");
    check(odds.downNet.raw() == 1'306'666, "down net odds");

    MarketOdds empty = quoteOdds(resolvedMarket(1, 2, 0, 0), 2);
    check(empty.upGross.raw() == 0 && empty.downGross.raw() == 0, "empty pool quotes zero odds");
    MarketOdds extreme = quoteOdds(resolvedMarket(1, 2, 1, maxU64 - 1), 0);
    check(extreme.upGross.raw() == std::numeric_limits<std::int64_t>::max(),
          "odds clamp to the fixed-point range");

    std::cout << "settlement_math passed" << std::endl;
    return 0;
}
