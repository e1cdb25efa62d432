#include "prediction_market.hpp"

#include "errors.hpp"
#include "role_guard.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace ud {

namespace {

struct AuditWireRecord {
    std::string action;
    std::string actor;
    std::uint64_t height = 0;
    MarketId marketId = 0;
    std::uint64_t first = 0;
    std::uint64_t second = 0;
    std::uint64_t third = 0;
    std::string detail;
};

std::string encodeAuditWire(const AuditWireRecord& record) {
    // Little-endian layout:
    // | height u64 | marketId u64 | first u64 | second u64 | third u64 |
    // | len-prefixed strings: action, actor, detail |
    auto writeU64 = [](std::string& out, std::uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
        }
    };
    auto writeString = [&](std::string& out, const std::string& s) {
        writeU64(out, static_cast<std::uint64_t>(s.size()));
        out.append(s);
    };

    std::string out;
    out.reserve(64 + record.action.size() + record.actor.size() + record.detail.size());
    writeU64(out, record.height);
    writeU64(out, record.marketId);
    writeU64(out, record.first);
    writeU64(out, record.second);
    writeU64(out, record.third);
    writeString(out, record.action);
    writeString(out, record.actor);
    writeString(out, record.detail);
    return out;
}

AuditWireRecord auditRecord(const char* action, const CallContext& ctx, MarketId marketId = 0) {
    AuditWireRecord record;
    record.action = action;
    record.actor = ctx.caller;
    record.height = ctx.height;
    record.marketId = marketId;
    return record;
}

// Escrow backends report commit failures however they like; callers see one kind.
void commitTransfers(EscrowScope& scope, const char* operation) {
    try {
        scope.commit();
    } catch (const std::exception& ex) {
        throw SettlementError(ErrorKind::InsufficientBalance,
                              std::string(operation) + ": escrow did not commit the transfers (" + ex.what() + ")");
    }
}

std::string predictionLabel(MarketId marketId, const std::string& participant) {
    std::ostringstream oss;
    oss << "no prediction by \"" << participant << "\" in market " << marketId;
    return oss.str();
}

} // namespace

PredictionMarket::PredictionMarket(ProtocolConfig config, EscrowPtr escrow)
    : config_(std::move(config))
    , escrow_(std::move(escrow)) {
    config_.validate();
    if (!escrow_) {
        throw std::invalid_argument("Prediction market requires an escrow backend");
    }
}

MarketId PredictionMarket::createMarket(const CallContext& ctx,
                                        std::uint64_t startPrice,
                                        std::uint64_t startBlock,
                                        std::uint64_t endBlock) {
    requireRole(config_, ctx.caller, Role::Owner);
    MarketId id = registry_.create(startPrice, startBlock, endBlock);

    auto record = auditRecord("create", ctx, id);
    record.first = startPrice;
    record.second = startBlock;
    record.third = endBlock;
    auditLog_.append(encodeAuditWire(record));
    return id;
}

void PredictionMarket::submitPrediction(const CallContext& ctx,
                                        MarketId marketId,
                                        Direction direction,
                                        std::uint64_t stake) {
    if (ctx.caller == config_.poolAccount) {
        throw SettlementError(ErrorKind::Unauthorized, "the pool account cannot place predictions");
    }
    const Market& market = registry_.get(marketId);
    if (!market.acceptsPredictionsAt(ctx.height)) {
        std::ostringstream oss;
        oss << "market " << marketId << " accepts predictions in [" << market.startBlock << ", "
            << market.endBlock << "), current height " << ctx.height;
        throw SettlementError(ErrorKind::MarketClosed, oss.str());
    }
    if (!isKnownDirection(direction)) {
        throw SettlementError(ErrorKind::InvalidPrediction, "direction must be up or down");
    }
    if (stake < config_.minimumStake) {
        std::ostringstream oss;
        oss << "stake " << stake << " is below the minimum of " << config_.minimumStake;
        throw SettlementError(ErrorKind::InvalidPrediction, oss.str());
    }
    if (escrow_->balanceOf(ctx.caller) < stake) {
        throw SettlementError(ErrorKind::InsufficientBalance,
                              "caller \"" + ctx.caller + "\" cannot cover the stake");
    }
    registry_.checkStakeCapacity(marketId, direction, stake);

    const Prediction* previous = ledger_.find(marketId, ctx.caller);
    std::uint64_t previousStake = previous ? previous->stake : 0;

    {
        EscrowScope scope(*escrow_);
        if (!escrow_->transfer(stake, ctx.caller, config_.poolAccount)) {
            throw SettlementError(ErrorKind::InsufficientBalance, "stake transfer into the pool failed");
        }
        commitTransfers(scope, "submit prediction");
    }

    // Records change only once the funds have moved. A repeat submission replaces
    // the ledger entry but the earlier stake stays in the side total and in the pool.
    bool overwrote = ledger_.record(marketId, ctx.caller, direction, stake);
    registry_.addStake(marketId, direction, stake);

    auto record = auditRecord(overwrote ? "overwrite" : "predict", ctx, marketId);
    record.first = static_cast<std::uint64_t>(direction);
    record.second = stake;
    record.third = previousStake;
    auditLog_.append(encodeAuditWire(record));
}

void PredictionMarket::resolveMarket(const CallContext& ctx, MarketId marketId, std::uint64_t endPrice) {
    requireRole(config_, ctx.caller, Role::Oracle);
    registry_.resolve(marketId, endPrice, ctx.height);

    const Market& market = registry_.get(marketId);
    auto record = auditRecord("resolve", ctx, marketId);
    record.first = market.startPrice;
    record.second = endPrice;
    record.third = market.totalStake();
    record.detail = directionName(winningDirection(market));
    auditLog_.append(encodeAuditWire(record));
}

std::uint64_t PredictionMarket::claimWinnings(const CallContext& ctx, MarketId marketId) {
    const Market& market = registry_.get(marketId);
    if (!market.resolved) {
        std::ostringstream oss;
        oss << "market " << marketId << " has not been resolved";
        throw SettlementError(ErrorKind::MarketNotResolved, oss.str());
    }
    const Prediction* prediction = ledger_.find(marketId, ctx.caller);
    if (prediction == nullptr) {
        throw SettlementError(ErrorKind::NotFound, predictionLabel(marketId, ctx.caller));
    }
    if (prediction->claimed) {
        std::ostringstream oss;
        oss << "\"" << ctx.caller << "\" already claimed market " << marketId;
        throw SettlementError(ErrorKind::AlreadyClaimed, oss.str());
    }

    SettlementQuote quote = quoteClaim(market, *prediction, config_.feePercent);

    {
        EscrowScope scope(*escrow_);
        if (quote.payout > 0 && !escrow_->transfer(quote.payout, config_.poolAccount, ctx.caller)) {
            throw SettlementError(ErrorKind::InsufficientBalance, "pool cannot cover the payout");
        }
        if (quote.fee > 0 && !escrow_->transfer(quote.fee, config_.poolAccount, config_.ownerId)) {
            throw SettlementError(ErrorKind::InsufficientBalance, "pool cannot cover the protocol fee");
        }
        commitTransfers(scope, "claim winnings");
    }
    ledger_.markClaimed(marketId, ctx.caller);

    auto record = auditRecord("claim", ctx, marketId);
    record.first = quote.winnings;
    record.second = quote.fee;
    record.third = quote.payout;
    auditLog_.append(encodeAuditWire(record));
    return quote.payout;
}

void PredictionMarket::setOracleAddress(const CallContext& ctx, const std::string& oracleId) {
    requireRole(config_, ctx.caller, Role::Owner);
    if (oracleId.empty()) {
        throw SettlementError(ErrorKind::InvalidParameter, "oracle identity must not be empty");
    }
    config_.oracleId = oracleId;

    auto record = auditRecord("set-oracle", ctx);
    record.detail = oracleId;
    auditLog_.append(encodeAuditWire(record));
}

void PredictionMarket::setMinimumStake(const CallContext& ctx, std::uint64_t minimumStake) {
    requireRole(config_, ctx.caller, Role::Owner);
    if (minimumStake == 0) {
        throw SettlementError(ErrorKind::InvalidParameter, "minimum stake must be positive");
    }
    config_.minimumStake = minimumStake;

    auto record = auditRecord("set-min-stake", ctx);
    record.first = minimumStake;
    auditLog_.append(encodeAuditWire(record));
}

void PredictionMarket::setFeePercentage(const CallContext& ctx, std::uint32_t feePercent) {
    requireRole(config_, ctx.caller, Role::Owner);
    if (feePercent > kMaxFeePercent) {
        std::ostringstream oss;
        oss << "fee percent " << feePercent << " exceeds " << kMaxFeePercent;
        throw SettlementError(ErrorKind::InvalidParameter, oss.str());
    }
    config_.feePercent = feePercent;

    auto record = auditRecord("set-fee", ctx);
    record.first = feePercent;
    auditLog_.append(encodeAuditWire(record));
}

void PredictionMarket::withdrawFees(const CallContext& ctx, std::uint64_t amount) {
    requireRole(config_, ctx.caller, Role::Owner);
    if (amount == 0) {
        throw SettlementError(ErrorKind::InvalidParameter, "withdrawal amount must be positive");
    }
    std::uint64_t poolBalance = getPoolBalance();
    if (amount > poolBalance) {
        std::ostringstream oss;
        oss << "withdrawal of " << amount << " exceeds pool balance " << poolBalance;
        throw SettlementError(ErrorKind::InsufficientBalance, oss.str());
    }

    {
        EscrowScope scope(*escrow_);
        if (!escrow_->transfer(amount, config_.poolAccount, config_.ownerId)) {
            throw SettlementError(ErrorKind::InsufficientBalance, "fee withdrawal transfer failed");
        }
        commitTransfers(scope, "withdraw fees");
    }

    auto record = auditRecord("withdraw", ctx);
    record.first = amount;
    record.second = poolBalance;
    auditLog_.append(encodeAuditWire(record));
}

std::optional<Market> PredictionMarket::getMarket(MarketId marketId) const {
    const Market* market = registry_.find(marketId);
    if (market == nullptr) {
        return std::nullopt;
    }
    return *market;
}

std::optional<Prediction> PredictionMarket::getUserPrediction(MarketId marketId,
                                                              const std::string& participant) const {
    const Prediction* prediction = ledger_.find(marketId, participant);
    if (prediction == nullptr) {
        return std::nullopt;
    }
    return *prediction;
}

std::uint64_t PredictionMarket::getPoolBalance() const {
    return escrow_->balanceOf(config_.poolAccount);
}

std::optional<SettlementQuote> PredictionMarket::previewClaim(MarketId marketId,
                                                              const std::string& participant) const {
    const Market* market = registry_.find(marketId);
    const Prediction* prediction = ledger_.find(marketId, participant);
    if (market == nullptr || prediction == nullptr || prediction->claimed || !market->resolved) {
        return std::nullopt;
    }
    if (prediction->direction != winningDirection(*market)) {
        return std::nullopt;
    }
    return quoteClaim(*market, *prediction, config_.feePercent);
}

std::optional<MarketOdds> PredictionMarket::getMarketOdds(MarketId marketId) const {
    const Market* market = registry_.find(marketId);
    if (market == nullptr) {
        return std::nullopt;
    }
    return quoteOdds(*market, config_.feePercent);
}

LiabilityProof PredictionMarket::snapshotLiabilities(MarketId marketId) const {
    struct Node {
        std::string hash;
        std::uint64_t sum = 0;
    };

    registry_.get(marketId);
    std::vector<Node> layer;
    for (const auto& [participant, prediction] : ledger_.entriesFor(marketId)) {
        Node leaf;
        leaf.sum = prediction.stake;
        std::ostringstream oss;
        oss << marketId << ":" << participant << ":" << directionName(prediction.direction) << ":"
            << prediction.stake << ":" << (prediction.claimed ? 1 : 0);
        leaf.hash = sha256Hex(oss.str());
        layer.push_back(std::move(leaf));
    }

    LiabilityProof proof;
    proof.entries = layer.size();
    if (layer.empty()) {
        return proof;
    }

    auto combine = [](const Node& left, const Node& right) {
        Node out;
        out.sum = left.sum + right.sum;
        std::ostringstream oss;
        oss << left.hash << "|" << right.hash << "|" << out.sum;
        out.hash = sha256Hex(oss.str());
        return out;
    };

    while (layer.size() > 1) {
        std::vector<Node> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            if (i + 1 < layer.size()) {
                next.push_back(combine(layer[i], layer[i + 1]));
            } else {
                // Carried up unchanged so the root sum counts each stake once.
                next.push_back(layer[i]);
            }
        }
        layer = std::move(next);
    }

    proof.merkleRoot = layer.front().hash;
    proof.totalLiability = layer.front().sum;
    return proof;
}

} // namespace ud
