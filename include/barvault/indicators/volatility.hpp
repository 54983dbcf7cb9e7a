// volatility.hpp
// Volatility Indicators: Standard Deviation, Bollinger Bands, Average True Range

#pragma once

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include "indicator_base.hpp"

namespace barvault {

namespace detail {

// Two-pass population moments over a full window; O(window) but free of
// the cancellation a running sum of squares accumulates
struct WindowMoments {
    double mean = 0.0;
    double std_dev = 0.0;
};

inline WindowMoments windowMoments(const InputWindow& window) {
    WindowMoments m;
    const std::size_t n = window.size();
    if (n == 0) return m;

    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) sum += window.get(i);
    m.mean = sum / static_cast<double>(n);

    double ss = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double d = window.get(i) - m.mean;
        ss += d * d;
    }
    m.std_dev = std::sqrt(std::max(0.0, ss / static_cast<double>(n)));
    return m;
}

} // namespace detail

// ============================================================================
// Rolling Standard Deviation (population)
// ============================================================================

class StandardDeviation : public IndicatorBase {
private:
    BarField field_;
    InputWindow window_;

protected:
    void compute(const Bar& bar, bool amending, Outputs& out) override {
        window_.observe(barFieldValue(bar, field_), amending);
        out[0] = window_.full() ? detail::windowMoments(window_).std_dev : nan();
    }

    void resetState() override { window_.clear(); }

public:
    StandardDeviation(BarField field, std::size_t period)
        : IndicatorBase("STDDEV(" + std::string(barFieldName(field)) + "," +
                        std::to_string(period) + ")",
                        1, requirePeriod(period, "STDDEV")),
          field_(field), window_(period) {}

    BarField field() const { return field_; }
    std::size_t period() const { return window_.period(); }
};

// ============================================================================
// Bollinger Bands: mid = SMA(close), upper/lower = mid +/- k * stddev
// ============================================================================

class BollingerBands : public IndicatorBase {
public:
    enum Output : std::size_t { Mid = 0, Upper = 1, Lower = 2 };

private:
    double k_;
    InputWindow window_;

    static std::string makeName(std::size_t period, double k) {
        std::ostringstream ss;
        ss << "BOLL(" << period << "," << k << ")";
        return ss.str();
    }

protected:
    void compute(const Bar& bar, bool amending, Outputs& out) override {
        window_.observe(bar.close, amending);
        if (!window_.full()) return;
        const auto m = detail::windowMoments(window_);
        out[Mid] = m.mean;
        out[Upper] = m.mean + k_ * m.std_dev;
        out[Lower] = m.mean - k_ * m.std_dev;
    }

    void resetState() override { window_.clear(); }

public:
    BollingerBands(std::size_t period, double k)
        : IndicatorBase(makeName(period, k), 3, requirePeriod(period, "BOLL")),
          k_(k), window_(period) {
        if (!std::isfinite(k) || k < 0.0) {
            throw InvalidArgumentException("BOLL multiplier must be finite and >= 0");
        }
    }

    std::size_t period() const { return window_.period(); }
    double multiplier() const { return k_; }
};

// ============================================================================
// Average True Range - simple mean of true range over the window
// ============================================================================

namespace detail {
struct AtrState {
    double sum = 0.0;
    double prev_close = 0.0;
    bool has_prev = false;
};
} // namespace detail

class AverageTrueRange : public CheckpointedIndicator<detail::AtrState> {
private:
    InputWindow window_;

    static double trueRange(const Bar& bar, const detail::AtrState& state) {
        const double range = bar.high - bar.low;
        if (!state.has_prev) return range;
        return std::max({range,
                         std::fabs(bar.high - state.prev_close),
                         std::fabs(bar.low - state.prev_close)});
    }

protected:
    void compute(const Bar& bar, bool amending, Outputs& out) override {
        const double tr = trueRange(bar, state_);
        window_.observe(tr, amending);
        state_.sum += tr;
        if (window_.didEvict()) state_.sum -= window_.evicted();
        state_.prev_close = bar.close;
        state_.has_prev = true;
        out[0] = window_.full() ? state_.sum / static_cast<double>(window_.period()) : nan();
    }

    void resetState() override {
        CheckpointedIndicator::resetState();
        window_.clear();
    }

public:
    explicit AverageTrueRange(std::size_t period)
        : CheckpointedIndicator("ATR(" + std::to_string(period) + ")", 1,
                                requirePeriod(period, "ATR")),
          window_(period) {}

    std::size_t period() const { return window_.period(); }
};

} // namespace barvault
