#pragma once

#include "escrow.hpp"
#include "market.hpp"
#include "prediction_ledger.hpp"
#include "protocol_config.hpp"
#include "settlement.hpp"
#include "transcript_log.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace ud {

// Who is calling and at which block height. Identity is already authenticated by
// the host; height comes from the host's monotonic block counter.
struct CallContext {
    std::string caller;
    std::uint64_t height = 0;
};

struct LiabilityProof {
    std::string merkleRoot;
    std::uint64_t totalLiability = 0;
    std::size_t entries = 0;
};

// Up/down prediction markets settled from a single oracle price.
//
// Every mutating call either applies completely (records, escrow transfers and one
// transcript event) or throws SettlementError and leaves nothing behind. The object
// is not synchronized; the host serializes calls.
class PredictionMarket {
public:
    PredictionMarket(ProtocolConfig config, EscrowPtr escrow);

    MarketId createMarket(const CallContext& ctx,
                          std::uint64_t startPrice,
                          std::uint64_t startBlock,
                          std::uint64_t endBlock);
    void submitPrediction(const CallContext& ctx, MarketId marketId, Direction direction, std::uint64_t stake);
    void resolveMarket(const CallContext& ctx, MarketId marketId, std::uint64_t endPrice);
    // Returns the payout sent to the caller, net of fee.
    std::uint64_t claimWinnings(const CallContext& ctx, MarketId marketId);

    void setOracleAddress(const CallContext& ctx, const std::string& oracleId);
    void setMinimumStake(const CallContext& ctx, std::uint64_t minimumStake);
    void setFeePercentage(const CallContext& ctx, std::uint32_t feePercent);
    // Pays out of the shared pool without regard to unclaimed winnings.
    void withdrawFees(const CallContext& ctx, std::uint64_t amount);

    std::optional<Market> getMarket(MarketId marketId) const;
    std::optional<Prediction> getUserPrediction(MarketId marketId, const std::string& participant) const;
    std::uint64_t getPoolBalance() const;

    MarketId getMarketCount() const { return registry_.nextId(); }
    const ProtocolConfig& getConfig() const { return config_; }
    std::optional<SettlementQuote> previewClaim(MarketId marketId, const std::string& participant) const;
    std::optional<MarketOdds> getMarketOdds(MarketId marketId) const;
    LiabilityProof snapshotLiabilities(MarketId marketId) const;

    std::string getTranscriptRoot() const { return auditLog_.merkleRoot(); }
    const TranscriptLog& getTranscript() const { return auditLog_; }

private:
    ProtocolConfig config_;
    EscrowPtr escrow_;
    MarketRegistry registry_;
    PredictionLedger ledger_;
    TranscriptLog auditLog_;
};

} // namespace ud
