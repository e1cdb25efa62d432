#include "prediction_ledger.hpp"

#include "errors.hpp"

#include <sstream>

namespace ud {

bool PredictionLedger::record(MarketId marketId,
                              const std::string& participant,
                              Direction direction,
                              std::uint64_t stake) {
    Prediction entry;
    entry.direction = direction;
    entry.stake = stake;
    entry.claimed = false;

    return !entries_.insert_or_assign(Key{ marketId, participant }, entry).second;
}

const Prediction* PredictionLedger::find(MarketId marketId, const std::string& participant) const {
    auto it = entries_.find(Key{ marketId, participant });
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

void PredictionLedger::markClaimed(MarketId marketId, const std::string& participant) {
    auto it = entries_.find(Key{ marketId, participant });
    if (it == entries_.end()) {
        std::ostringstream oss;
        oss << "no prediction by \"" << participant << "\" in market " << marketId;
        throw SettlementError(ErrorKind::NotFound, oss.str());
    }
    it->second.claimed = true;
}

std::vector<std::pair<std::string, Prediction>> PredictionLedger::entriesFor(MarketId marketId) const {
    std::vector<std::pair<std::string, Prediction>> out;
    for (auto it = entries_.lower_bound(Key{ marketId, std::string() });
         it != entries_.end() && it->first.first == marketId;
         ++it) {
        out.emplace_back(it->first.second, it->second);
    }
    return out;
}

} // namespace ud
