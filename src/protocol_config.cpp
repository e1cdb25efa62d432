#include "protocol_config.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace ud {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::optional<std::string> readEnv(const char* name) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return std::nullopt;
    }
    std::string value = trim(env);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::uint64_t parseUnsigned(const char* name, const std::string& value, std::uint64_t maxValue) {
    for (unsigned char ch : value) {
        if (std::isdigit(ch) == 0) {
            throw std::runtime_error(std::string(name) + " must be an unsigned integer, got \"" +
                                     value + "\"");
        }
    }
    std::uint64_t parsed = 0;
    try {
        parsed = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::runtime_error(std::string(name) + " is out of range");
    }
    if (parsed > maxValue) {
        std::ostringstream oss;
        oss << name << " must not exceed " << maxValue;
        throw std::runtime_error(oss.str());
    }
    return parsed;
}

} // namespace

ProtocolConfig ProtocolConfig::fromEnvironment() {
    ProtocolConfig cfg;
    auto owner = readEnv("UD_OWNER_ID");
    if (!owner) {
        throw std::runtime_error(
            "Protocol configuration requires an owner identity (set UD_OWNER_ID)");
    }
    cfg.ownerId = *owner;
    cfg.oracleId = readEnv("UD_ORACLE_ID").value_or(cfg.ownerId);
    if (auto pool = readEnv("UD_POOL_ACCOUNT")) {
        cfg.poolAccount = *pool;
    }
    if (auto minStake = readEnv("UD_MIN_STAKE")) {
        cfg.minimumStake =
            parseUnsigned("UD_MIN_STAKE", *minStake, std::numeric_limits<std::uint64_t>::max());
    }
    if (auto fee = readEnv("UD_FEE_PERCENT")) {
        cfg.feePercent = static_cast<std::uint32_t>(parseUnsigned("UD_FEE_PERCENT", *fee, kMaxFeePercent));
    }
    cfg.validate();
    return cfg;
}

void ProtocolConfig::validate() const {
    if (ownerId.empty()) {
        throw std::invalid_argument("Owner identity must not be empty");
    }
    if (oracleId.empty()) {
        throw std::invalid_argument("Oracle identity must not be empty");
    }
    if (poolAccount.empty()) {
        throw std::invalid_argument("Pool account must not be empty");
    }
    if (poolAccount == ownerId) {
        throw std::invalid_argument("Pool account must differ from the owner treasury");
    }
    if (minimumStake == 0) {
        throw std::invalid_argument("Minimum stake must be positive");
    }
    if (feePercent > kMaxFeePercent) {
        std::ostringstream oss;
        oss << "Fee percent (" << feePercent << ") exceeds " << kMaxFeePercent;
        throw std::invalid_argument(oss.str());
    }
}

} // namespace ud
