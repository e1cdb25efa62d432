#pragma once

#include "market.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ud {

struct Prediction {
    Direction direction = Direction::Up;
    std::uint64_t stake = 0;
    bool claimed = false;
};

// One entry per (market, participant). A second write for the same key replaces the
// first; stake totals are the registry's concern.
class PredictionLedger {
public:
    // Returns true when an existing entry was replaced.
    bool record(MarketId marketId, const std::string& participant, Direction direction, std::uint64_t stake);

    const Prediction* find(MarketId marketId, const std::string& participant) const;
    // Throws SettlementError(NotFound).
    void markClaimed(MarketId marketId, const std::string& participant);

    std::vector<std::pair<std::string, Prediction>> entriesFor(MarketId marketId) const;
    std::size_t size() const { return entries_.size(); }

private:
    using Key = std::pair<MarketId, std::string>;

    std::map<Key, Prediction> entries_;
};

} // namespace ud
