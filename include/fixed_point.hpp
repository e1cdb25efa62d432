#pragma once

#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>

namespace ud {

// Deterministic 6-decimal fixed point for quoting payout multipliers.
class Fixed64 {
public:
    static constexpr std::int64_t kScale = 1'000'000; // microunits

    Fixed64() : raw_(0) {}

    // numerator / denominator, truncated toward zero and clamped to the representable
    // range. A zero denominator yields zero.
    static Fixed64 fromRatio(std::uint64_t numerator, std::uint64_t denominator) {
        if (denominator == 0) {
            return Fixed64();
        }
        unsigned __int128 wide = static_cast<unsigned __int128>(numerator) *
                                 static_cast<unsigned __int128>(kScale);
        wide /= denominator;
        constexpr unsigned __int128 maxRaw =
            static_cast<unsigned __int128>(std::numeric_limits<std::int64_t>::max());
        if (wide > maxRaw) {
            return Fixed64(std::numeric_limits<std::int64_t>::max());
        }
        return Fixed64(static_cast<std::int64_t>(wide));
    }

    std::int64_t raw() const { return raw_; }

    std::string toString() const {
        std::int64_t whole = raw_ / kScale;
        std::int64_t frac = raw_ % kScale;
        if (frac < 0) {
            frac = -frac;
        }
        std::ostringstream oss;
        if (raw_ < 0 && whole == 0) {
            oss << '-';
        }
        oss << whole << '.' << std::setw(6) << std::setfill('0') << frac;
        return oss.str();
    }

    Fixed64 operator*(Fixed64 other) const {
        __int128 wide = static_cast<__int128>(raw_) * static_cast<__int128>(other.raw_);
        wide /= kScale;
        if (wide > std::numeric_limits<std::int64_t>::max()) {
            return Fixed64(std::numeric_limits<std::int64_t>::max());
        }
        if (wide < std::numeric_limits<std::int64_t>::min()) {
            return Fixed64(std::numeric_limits<std::int64_t>::min());
        }
        return Fixed64(static_cast<std::int64_t>(wide));
    }

private:
    explicit Fixed64(std::int64_t raw) : raw_(raw) {}

    std::int64_t raw_;
};

} // namespace ud
