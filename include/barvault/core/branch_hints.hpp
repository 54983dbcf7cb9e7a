// branch_hints.hpp
// Branch Prediction Hints and Hot Path Validation
// Compiler-specific hints for the push/amend write path

#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>

namespace barvault {

// ============================================================================
// Branch Prediction Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define BARVAULT_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define BARVAULT_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define BARVAULT_LIKELY(x)   (x)
    #define BARVAULT_UNLIKELY(x) (x)
#endif

// Force inline for hot path functions
#if defined(__GNUC__) || defined(__clang__)
    #define BARVAULT_FORCE_INLINE __attribute__((always_inline)) inline
#elif defined(_MSC_VER)
    #define BARVAULT_FORCE_INLINE __forceinline
#else
    #define BARVAULT_FORCE_INLINE inline
#endif

// Prevent inlining for cold path functions
#if defined(__GNUC__) || defined(__clang__)
    #define BARVAULT_NO_INLINE __attribute__((noinline))
#elif defined(_MSC_VER)
    #define BARVAULT_NO_INLINE __declspec(noinline)
#else
    #define BARVAULT_NO_INLINE
#endif

#if defined(__GNUC__) || defined(__clang__)
    #define BARVAULT_HOT_FUNCTION __attribute__((hot))
    #define BARVAULT_COLD_FUNCTION __attribute__((cold))
#else
    #define BARVAULT_HOT_FUNCTION
    #define BARVAULT_COLD_FUNCTION
#endif

// Cache line size used to keep the writer's sequence counter off the reader-shared lines
constexpr std::size_t kCacheLineSize = 64;

// ============================================================================
// Hot Path Validation (Optimized for Common Case)
// ============================================================================

class FastValidation {
public:
    static BARVAULT_FORCE_INLINE bool is_finite(double value) {
        if (BARVAULT_UNLIKELY(!std::isfinite(value))) {
            return false;
        }
        return true;
    }

    static BARVAULT_FORCE_INLINE bool is_non_negative(double value) {
        return BARVAULT_LIKELY(value >= 0.0);
    }

    // Typically valid: high bounds every price, low is bounded by every price
    static BARVAULT_FORCE_INLINE bool validate_ohlc(double open, double high, double low, double close) {
        if (BARVAULT_LIKELY(high >= low && high >= open && high >= close &&
                            low <= open && low <= close)) {
            return true;
        }
        return false;
    }
};

} // namespace barvault
