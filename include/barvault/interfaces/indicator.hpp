// indicator.hpp
// Indicator Interface for the barvault Time-Series Core

#pragma once

#include <cstddef>
#include <string>

namespace barvault {

// Forward declarations only for types used in interfaces
struct Bar;
struct IndicatorValue;

// ============================================================================
// Indicator Interface (Clean, Dependency-Free)
// ============================================================================

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Sizes the retained output history; called once before the first add()
    virtual void setMaxHistoryLength(std::size_t n) = 0;

    // Incorporates a new, final observation
    virtual void add(const Bar& bar) = 0;

    // Replaces the effect of the most recent add() as if it had seen `bar`
    virtual void updateLast(const Bar& bar) = 0;

    // Reading at a logical index of the retained outputs (0 = oldest)
    virtual IndicatorValue getValue(std::size_t logical_index, std::size_t output = 0) const = 0;

    virtual std::size_t size() const = 0;
    virtual std::size_t outputCount() const { return 1; }
    virtual std::size_t warmupPeriod() const = 0;
    virtual std::string getName() const { return "UnnamedIndicator"; }
    virtual void reset() = 0;
};

} // namespace barvault
