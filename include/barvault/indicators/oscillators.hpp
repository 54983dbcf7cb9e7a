// oscillators.hpp
// Oscillators: Relative Strength Index, MACD, Volume Ratio

#pragma once

#include <cmath>
#include <string>
#include "indicator_base.hpp"

namespace barvault {

// ============================================================================
// Relative Strength Index (Wilder smoothing of close-to-close changes)
// ============================================================================

namespace detail {
struct RsiState {
    double prev_close = 0.0;
    bool has_prev = false;
    std::size_t changes = 0;
    double seed_gain = 0.0;   // sums over the first `period` changes
    double seed_loss = 0.0;
    double avg_gain = 0.0;
    double avg_loss = 0.0;
};
} // namespace detail

class RelativeStrengthIndex : public CheckpointedIndicator<detail::RsiState> {
private:
    std::size_t period_;

    static double fromAverages(double avg_gain, double avg_loss) {
        if (avg_gain == 0.0 && avg_loss == 0.0) return 50.0;
        if (avg_loss == 0.0) return 100.0;
        const double rs = avg_gain / avg_loss;
        return 100.0 - (100.0 / (1.0 + rs));
    }

protected:
    void compute(const Bar& bar, bool /*amending*/, Outputs& out) override {
        auto& s = state_;
        if (!s.has_prev) {
            s.prev_close = bar.close;
            s.has_prev = true;
            return;
        }

        const double change = bar.close - s.prev_close;
        const double gain = change > 0.0 ? change : 0.0;
        const double loss = change < 0.0 ? -change : 0.0;
        const double p = static_cast<double>(period_);
        s.prev_close = bar.close;
        ++s.changes;

        if (s.changes < period_) {
            s.seed_gain += gain;
            s.seed_loss += loss;
            return;
        }
        if (s.changes == period_) {
            s.seed_gain += gain;
            s.seed_loss += loss;
            s.avg_gain = s.seed_gain / p;
            s.avg_loss = s.seed_loss / p;
        } else {
            s.avg_gain = (s.avg_gain * (p - 1.0) + gain) / p;
            s.avg_loss = (s.avg_loss * (p - 1.0) + loss) / p;
        }
        out[0] = fromAverages(s.avg_gain, s.avg_loss);
    }

public:
    explicit RelativeStrengthIndex(std::size_t period)
        : CheckpointedIndicator("RSI(" + std::to_string(period) + ")", 1,
                                requirePeriod(period, "RSI") + 1),
          period_(period) {}

    std::size_t period() const { return period_; }
};

// ============================================================================
// MACD: macd = EMA(fast) - EMA(slow), signal = EMA(macd), histogram = macd - signal
// ============================================================================

namespace detail {
struct MacdState {
    double ema_fast = 0.0;
    double ema_slow = 0.0;
    double signal = 0.0;
    bool seeded = false;
};
} // namespace detail

class MovingAverageConvergenceDivergence : public CheckpointedIndicator<detail::MacdState> {
public:
    enum Output : std::size_t { Macd = 0, Signal = 1, Histogram = 2 };

private:
    std::size_t fast_, slow_, signal_;
    double alpha_fast_, alpha_slow_, alpha_signal_;

    static double alphaFor(std::size_t period) {
        return 2.0 / (static_cast<double>(period) + 1.0);
    }

protected:
    void compute(const Bar& bar, bool /*amending*/, Outputs& out) override {
        auto& s = state_;
        const double price = bar.close;
        if (!s.seeded) {
            s.ema_fast = price;
            s.ema_slow = price;
            s.signal = 0.0;
            s.seeded = true;
        } else {
            s.ema_fast += alpha_fast_ * (price - s.ema_fast);
            s.ema_slow += alpha_slow_ * (price - s.ema_slow);
            s.signal += alpha_signal_ * ((s.ema_fast - s.ema_slow) - s.signal);
        }
        const double macd = s.ema_fast - s.ema_slow;
        out[Macd] = macd;
        out[Signal] = s.signal;
        out[Histogram] = macd - s.signal;
    }

public:
    MovingAverageConvergenceDivergence(std::size_t fast, std::size_t slow, std::size_t signal)
        : CheckpointedIndicator("MACD(" + std::to_string(fast) + "," + std::to_string(slow) +
                                "," + std::to_string(signal) + ")",
                                3, 1),
          fast_(requirePeriod(fast, "MACD fast")),
          slow_(requirePeriod(slow, "MACD slow")),
          signal_(requirePeriod(signal, "MACD signal")),
          alpha_fast_(alphaFor(fast)),
          alpha_slow_(alphaFor(slow)),
          alpha_signal_(alphaFor(signal)) {}

    std::size_t fastPeriod() const { return fast_; }
    std::size_t slowPeriod() const { return slow_; }
    std::size_t signalPeriod() const { return signal_; }
};

// ============================================================================
// Volume Ratio: volume / mean volume of the preceding bars in the window
// ============================================================================

class VolumeRatio : public IndicatorBase {
private:
    InputWindow window_;

protected:
    void compute(const Bar& bar, bool amending, Outputs& out) override {
        window_.observe(bar.volume, amending);
        const std::size_t n = window_.size();
        if (n < 2) return;

        double preceding = 0.0;
        for (std::size_t i = 0; i + 1 < n; ++i) preceding += window_.get(i);
        const double avg = preceding / static_cast<double>(n - 1);
        if (avg > 0.0) out[0] = bar.volume / avg;
    }

    void resetState() override { window_.clear(); }

public:
    explicit VolumeRatio(std::size_t period)
        : IndicatorBase("VRI(" + std::to_string(period) + ")", 1, 2),
          window_(requirePeriod(period, "VRI")) {
        if (period < 2) {
            throw InvalidArgumentException("VRI period must be >= 2");
        }
    }

    std::size_t period() const { return window_.period(); }
};

} // namespace barvault
