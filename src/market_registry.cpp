#include "market.hpp"

#include "errors.hpp"

#include <limits>
#include <sstream>

namespace ud {

namespace {

std::string marketLabel(MarketId id) {
    std::ostringstream oss;
    oss << "market " << id;
    return oss.str();
}

} // namespace

bool isKnownDirection(Direction direction) {
    return direction == Direction::Up || direction == Direction::Down;
}

const char* directionName(Direction direction) {
    switch (direction) {
    case Direction::Up:
        return "up";
    case Direction::Down:
        return "down";
    }
    return "invalid";
}

MarketId MarketRegistry::create(std::uint64_t startPrice,
                                std::uint64_t startBlock,
                                std::uint64_t endBlock) {
    if (startPrice == 0) {
        throw SettlementError(ErrorKind::InvalidParameter, "start price must be positive");
    }
    if (endBlock <= startBlock) {
        std::ostringstream oss;
        oss << "end block (" << endBlock << ") must be after start block (" << startBlock << ")";
        throw SettlementError(ErrorKind::InvalidParameter, oss.str());
    }

    Market market;
    market.id = nextId();
    market.startPrice = startPrice;
    market.startBlock = startBlock;
    market.endBlock = endBlock;
    markets_.push_back(market);
    return market.id;
}

const Market* MarketRegistry::find(MarketId id) const {
    if (id >= markets_.size()) {
        return nullptr;
    }
    return &markets_[static_cast<std::size_t>(id)];
}

const Market& MarketRegistry::get(MarketId id) const {
    const Market* market = find(id);
    if (market == nullptr) {
        throw SettlementError(ErrorKind::NotFound, marketLabel(id) + " does not exist");
    }
    return *market;
}

Market& MarketRegistry::mutableMarket(MarketId id) {
    get(id);
    return markets_[static_cast<std::size_t>(id)];
}

void MarketRegistry::resolve(MarketId id, std::uint64_t endPrice, std::uint64_t height) {
    Market& market = mutableMarket(id);
    if (height < market.endBlock) {
        std::ostringstream oss;
        oss << marketLabel(id) << " closes at block " << market.endBlock << ", current height "
            << height;
        throw SettlementError(ErrorKind::MarketClosed, oss.str());
    }
    if (market.resolved) {
        throw SettlementError(ErrorKind::AlreadyResolved, marketLabel(id) + " is already resolved");
    }
    if (endPrice == 0) {
        throw SettlementError(ErrorKind::InvalidParameter, "end price must be positive");
    }
    market.endPrice = endPrice;
    market.resolved = true;
}

void MarketRegistry::checkStakeCapacity(MarketId id, Direction direction, std::uint64_t amount) const {
    const Market& market = get(id);
    constexpr std::uint64_t maxTotal = std::numeric_limits<std::uint64_t>::max();
    // Both sides together must stay addressable so totalStake() cannot wrap.
    if (market.totalUpStake > maxTotal - market.totalDownStake ||
        market.totalStake() > maxTotal - amount) {
        throw SettlementError(ErrorKind::InvalidParameter,
                              std::string("stake would overflow the ") + directionName(direction) +
                                  " pool of " + marketLabel(id));
    }
}

void MarketRegistry::addStake(MarketId id, Direction direction, std::uint64_t amount) {
    checkStakeCapacity(id, direction, amount);
    Market& market = mutableMarket(id);
    if (direction == Direction::Up) {
        market.totalUpStake += amount;
    } else {
        market.totalDownStake += amount;
    }
}

} // namespace ud
