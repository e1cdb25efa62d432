#pragma once

#include <cstdint>
#include <string>

namespace ud {

constexpr std::uint32_t kMaxFeePercent = 100;

struct ProtocolConfig {
    std::string ownerId;
    std::string oracleId;
    // Escrow account that holds every market's pooled collateral.
    std::string poolAccount = "pool";
    std::uint64_t minimumStake = 1'000'000;
    std::uint32_t feePercent = 2;

    // Reads UD_OWNER_ID (required), UD_ORACLE_ID, UD_POOL_ACCOUNT, UD_MIN_STAKE and
    // UD_FEE_PERCENT. Unset optional variables keep the defaults above.
    static ProtocolConfig fromEnvironment();

    void validate() const;
};

} // namespace ud
