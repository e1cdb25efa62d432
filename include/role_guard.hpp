#pragma once

#include "protocol_config.hpp"

#include <string>

namespace ud {

enum class Role { Owner, Oracle };

const char* roleName(Role role);

bool holdsRole(const ProtocolConfig& cfg, const std::string& caller, Role role);

// Throws SettlementError(Unauthorized) when the caller does not hold the role.
void requireRole(const ProtocolConfig& cfg, const std::string& caller, Role role);

} // namespace ud
