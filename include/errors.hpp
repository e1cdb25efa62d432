#pragma once

#include <stdexcept>
#include <string>

namespace ud {

enum class ErrorKind {
    Unauthorized,
    NotFound,
    InvalidParameter,
    InvalidPrediction,
    MarketClosed,
    MarketNotResolved,
    AlreadyResolved,
    AlreadyClaimed,
    InsufficientBalance,
    InconsistentLedger
};

const char* errorKindName(ErrorKind kind);

// Every rejected engine operation surfaces as exactly one of these.
class SettlementError : public std::runtime_error {
public:
    SettlementError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace ud
