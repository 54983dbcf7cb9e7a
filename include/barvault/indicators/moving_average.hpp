// moving_average.hpp
// Simple and Exponential Moving Averages

#pragma once

#include <string>
#include "indicator_base.hpp"

namespace barvault {

// ============================================================================
// Simple Moving Average - O(1) rolling sum
// ============================================================================

namespace detail {
struct RollingSumState {
    double sum = 0.0;
};
} // namespace detail

class SimpleMovingAverage : public CheckpointedIndicator<detail::RollingSumState> {
private:
    BarField field_;
    std::size_t period_;
    InputWindow window_;

protected:
    void compute(const Bar& bar, bool amending, Outputs& out) override {
        const double value = barFieldValue(bar, field_);
        window_.observe(value, amending);
        state_.sum += value;
        if (window_.didEvict()) state_.sum -= window_.evicted();
        out[0] = window_.full() ? state_.sum / static_cast<double>(period_) : nan();
    }

    void resetState() override {
        CheckpointedIndicator::resetState();
        window_.clear();
    }

public:
    SimpleMovingAverage(BarField field, std::size_t period)
        : CheckpointedIndicator("SMA(" + std::string(barFieldName(field)) + "," +
                                std::to_string(period) + ")",
                                1, requirePeriod(period, "SMA")),
          field_(field), period_(period), window_(period) {}

    BarField field() const { return field_; }
    std::size_t period() const { return period_; }
};

// ============================================================================
// Exponential Moving Average - seeded with the first observation
// ============================================================================

namespace detail {
struct EmaState {
    double ema = 0.0;
    bool seeded = false;
};
} // namespace detail

class ExponentialMovingAverage : public CheckpointedIndicator<detail::EmaState> {
private:
    BarField field_;
    std::size_t period_;
    double alpha_;

protected:
    void compute(const Bar& bar, bool /*amending*/, Outputs& out) override {
        const double value = barFieldValue(bar, field_);
        if (!state_.seeded) {
            state_.ema = value;
            state_.seeded = true;
        } else {
            state_.ema += alpha_ * (value - state_.ema);
        }
        out[0] = state_.ema;
    }

public:
    ExponentialMovingAverage(BarField field, std::size_t period)
        : CheckpointedIndicator("EMA(" + std::string(barFieldName(field)) + "," +
                                std::to_string(period) + ")",
                                1, 1),
          field_(field), period_(requirePeriod(period, "EMA")),
          alpha_(2.0 / (static_cast<double>(period) + 1.0)) {}

    BarField field() const { return field_; }
    std::size_t period() const { return period_; }
    double alpha() const { return alpha_; }
};

} // namespace barvault
