// bar_types.hpp
// Bar Record and Field Definitions for the barvault Time-Series Core
// One OHLCV (+buy volume) observation, per-field access and indicator readings

#pragma once

#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include "branch_hints.hpp"
#include "exceptions.hpp"

namespace barvault {

// ============================================================================
// Bar - one market observation (HOT PATH)
// ============================================================================

struct Bar {
    std::int64_t timestamp;  // milliseconds
    double open, high, low, close, volume;
    double buy_volume;

    Bar() : timestamp(0), open(0), high(0), low(0), close(0), volume(0), buy_volume(0) {}

    Bar(std::int64_t ts, double o, double h, double l, double c, double v, double bv = 0.0)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v), buy_volume(bv) {}

    // All numeric fields finite
    BARVAULT_HOT_FUNCTION
    bool isFinite() const {
        return BARVAULT_LIKELY(FastValidation::is_finite(open) &&
                               FastValidation::is_finite(high) &&
                               FastValidation::is_finite(low) &&
                               FastValidation::is_finite(close) &&
                               FastValidation::is_finite(volume) &&
                               FastValidation::is_finite(buy_volume));
    }

    // Price envelope and non-negative volumes
    bool isConsistent() const {
        return FastValidation::validate_ohlc(open, high, low, close) &&
               FastValidation::is_non_negative(volume) &&
               FastValidation::is_non_negative(buy_volume);
    }

    bool operator==(const Bar& other) const {
        return timestamp == other.timestamp &&
               open == other.open && high == other.high &&
               low == other.low && close == other.close &&
               volume == other.volume && buy_volume == other.buy_volume;
    }

    bool operator!=(const Bar& other) const { return !(*this == other); }
};

// ============================================================================
// Field Selection
// ============================================================================

enum class BarField : std::uint8_t {
    Timestamp = 0,
    Open = 1,
    High = 2,
    Low = 3,
    Close = 4,
    Volume = 5,
    BuyVolume = 6
};

constexpr std::size_t kBarFieldCount = 7;

constexpr std::array<BarField, kBarFieldCount> kAllBarFields = {
    BarField::Timestamp, BarField::Open, BarField::High, BarField::Low,
    BarField::Close, BarField::Volume, BarField::BuyVolume
};

inline const char* barFieldName(BarField field) {
    switch (field) {
        case BarField::Timestamp: return "timestamp";
        case BarField::Open:      return "open";
        case BarField::High:      return "high";
        case BarField::Low:       return "low";
        case BarField::Close:     return "close";
        case BarField::Volume:    return "volume";
        case BarField::BuyVolume: return "buy_volume";
    }
    return "unknown";
}

inline BarField parseBarField(const std::string& name) {
    for (BarField field : kAllBarFields) {
        if (name == barFieldName(field)) return field;
    }
    if (name == "buy" || name == "buyvolume") return BarField::BuyVolume;
    throw InvalidArgumentException("unknown bar field '" + name + "'");
}

// Numeric value of a field; the timestamp is widened to double
inline double barFieldValue(const Bar& bar, BarField field) {
    switch (field) {
        case BarField::Timestamp: return static_cast<double>(bar.timestamp);
        case BarField::Open:      return bar.open;
        case BarField::High:      return bar.high;
        case BarField::Low:       return bar.low;
        case BarField::Close:     return bar.close;
        case BarField::Volume:    return bar.volume;
        case BarField::BuyVolume: return bar.buy_volume;
    }
    return std::numeric_limits<double>::quiet_NaN();
}

// ============================================================================
// Indicator Reading
// ============================================================================

// Unavailable readings carry NaN so a consumer ignoring the flag still sees "no value"
struct IndicatorValue {
    double value;
    bool available;

    IndicatorValue() : value(std::numeric_limits<double>::quiet_NaN()), available(false) {}
    IndicatorValue(double v, bool avail) : value(v), available(avail) {}

    static IndicatorValue unavailable() { return IndicatorValue(); }
};

} // namespace barvault
