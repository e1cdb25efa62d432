#include "role_guard.hpp"

#include "errors.hpp"

namespace ud {

const char* roleName(Role role) {
    switch (role) {
    case Role::Owner:
        return "owner";
    case Role::Oracle:
        return "oracle";
    }
    return "unknown";
}

bool holdsRole(const ProtocolConfig& cfg, const std::string& caller, Role role) {
    if (caller.empty()) {
        return false;
    }
    switch (role) {
    case Role::Owner:
        return caller == cfg.ownerId;
    case Role::Oracle:
        return caller == cfg.oracleId;
    }
    return false;
}

void requireRole(const ProtocolConfig& cfg, const std::string& caller, Role role) {
    if (!holdsRole(cfg, caller, role)) {
        throw SettlementError(ErrorKind::Unauthorized,
                              "caller \"" + caller + "\" does not hold the " + roleName(role) +
                                  " role");
    }
}

} // namespace ud
