#pragma once

#include "errors.hpp"
#include "escrow.hpp"
#include "prediction_market.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace ud::testing {

inline std::string& suiteName() {
    static std::string name = "test";
    return name;
}

[[noreturn]] inline void fail(const std::string& msg) {
    std::cerr << suiteName() << " failure: " << msg << std::endl;
    std::exit(1);
}

inline void check(bool condition, const std::string& msg) {
    if (!condition) {
        fail(msg);
    }
}

template <typename Fn>
void expectError(ErrorKind expected, Fn&& fn, const std::string& what) {
    try {
        fn();
    } catch (const SettlementError& ex) {
        if (ex.kind() != expected) {
            fail(what + ": expected " + errorKindName(expected) + ", got " + errorKindName(ex.kind()) +
                 " (" + ex.what() + ")");
        }
        return;
    }
    fail(what + ": expected " + errorKindName(expected) + ", call succeeded");
}

inline ProtocolConfig defaultConfig() {
    ProtocolConfig cfg;
    cfg.ownerId = "owner";
    cfg.oracleId = "oracle";
    cfg.poolAccount = "pool";
    cfg.minimumStake = 1'000'000;
    cfg.feePercent = 2;
    return cfg;
}

inline CallContext as(const std::string& caller, std::uint64_t height) {
    CallContext ctx;
    ctx.caller = caller;
    ctx.height = height;
    return ctx;
}

} // namespace ud::testing
