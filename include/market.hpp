#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ud {

using MarketId = std::uint64_t;

enum class Direction : std::uint8_t { Up = 0, Down = 1 };

// An enum class can still carry an out-of-range value cast in from the wire.
bool isKnownDirection(Direction direction);
const char* directionName(Direction direction);

struct Market {
    MarketId id = 0;
    std::uint64_t startPrice = 0;
    std::uint64_t endPrice = 0;
    std::uint64_t totalUpStake = 0;
    std::uint64_t totalDownStake = 0;
    std::uint64_t startBlock = 0;
    std::uint64_t endBlock = 0;
    bool resolved = false;

    // MarketRegistry::addStake keeps this sum within 64 bits.
    std::uint64_t totalStake() const { return totalUpStake + totalDownStake; }
    std::uint64_t stakeOn(Direction direction) const {
        return direction == Direction::Up ? totalUpStake : totalDownStake;
    }
    bool acceptsPredictionsAt(std::uint64_t height) const {
        return !resolved && height >= startBlock && height < endBlock;
    }
};

// Arena of market records; the id is the index.
class MarketRegistry {
public:
    MarketId create(std::uint64_t startPrice, std::uint64_t startBlock, std::uint64_t endBlock);

    const Market* find(MarketId id) const;
    // Throws SettlementError(NotFound).
    const Market& get(MarketId id) const;

    void resolve(MarketId id, std::uint64_t endPrice, std::uint64_t height);

    // Throws SettlementError(InvalidParameter) if the side total would overflow.
    void checkStakeCapacity(MarketId id, Direction direction, std::uint64_t amount) const;
    void addStake(MarketId id, Direction direction, std::uint64_t amount);

    MarketId nextId() const { return static_cast<MarketId>(markets_.size()); }
    std::size_t size() const { return markets_.size(); }

private:
    Market& mutableMarket(MarketId id);

    std::vector<Market> markets_;
};

} // namespace ud
