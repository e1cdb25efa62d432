#include "errors.hpp"

namespace ud {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Unauthorized:
        return "Unauthorized";
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::InvalidParameter:
        return "InvalidParameter";
    case ErrorKind::InvalidPrediction:
        return "InvalidPrediction";
    case ErrorKind::MarketClosed:
        return "MarketClosed";
    case ErrorKind::MarketNotResolved:
        return "MarketNotResolved";
    case ErrorKind::AlreadyResolved:
        return "AlreadyResolved";
    case ErrorKind::AlreadyClaimed:
        return "AlreadyClaimed";
    case ErrorKind::InsufficientBalance:
        return "InsufficientBalance";
    case ErrorKind::InconsistentLedger:
        return "InconsistentLedger";
    }
    return "Unknown";
}

SettlementError::SettlementError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(errorKindName(kind)) + ": " + message)
    , kind_(kind) {}

} // namespace ud
