// indicator_base.hpp
// Shared Indicator Machinery
// Output history, warm-up accounting and exact rewind of the latest observation

#pragma once

#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>
#include "../core/bar_types.hpp"
#include "../core/branch_hints.hpp"
#include "../core/exceptions.hpp"
#include "../interfaces/indicator.hpp"
#include "../storage/ring_column.hpp"

namespace barvault {

// ============================================================================
// Indicator Base
// ============================================================================

// Derived classes implement compute(). add() checkpoints the accumulator state
// before computing; updateLast() restores that checkpoint and recomputes, so
// amending with the original bar reproduces the original outputs bit-for-bit.
class IndicatorBase : public IIndicator {
public:
    static constexpr std::size_t kMaxOutputs = 3;
    static constexpr std::size_t kDefaultHistory = 120;

private:
    std::string name_;
    std::size_t output_count_;
    std::size_t warmup_;
    std::vector<RingColumn<double>> outputs_;
    std::uint64_t total_added_ = 0;

    void ensureConfigured() {
        if (BARVAULT_UNLIKELY(outputs_.empty())) {
            setMaxHistoryLength(kDefaultHistory);
        }
    }

protected:
    using Outputs = std::array<double, kMaxOutputs>;

    static double nan() { return std::numeric_limits<double>::quiet_NaN(); }

    IndicatorBase(std::string name, std::size_t output_count, std::size_t warmup)
        : name_(std::move(name)), output_count_(output_count), warmup_(warmup) {
        if (output_count_ == 0 || output_count_ > kMaxOutputs) {
            throw InvalidArgumentException("indicator output count must be in [1, 3]");
        }
    }

    static std::size_t requirePeriod(std::size_t period, const char* what) {
        if (period == 0) {
            throw InvalidArgumentException(std::string(what) + " period must be > 0");
        }
        return period;
    }

    // amending is true when `bar` replaces the most recent observation
    virtual void compute(const Bar& bar, bool amending, Outputs& out) = 0;

    virtual void saveCheckpoint() {}
    virtual void restoreCheckpoint() {}
    virtual void resetState() {}

public:
    void setMaxHistoryLength(std::size_t n) override {
        if (n == 0) {
            throw InvalidArgumentException("max history length must be > 0");
        }
        outputs_.assign(output_count_, RingColumn<double>(n));
        total_added_ = 0;
        resetState();
    }

    BARVAULT_HOT_FUNCTION
    void add(const Bar& bar) override {
        ensureConfigured();
        saveCheckpoint();
        Outputs out;
        out.fill(nan());
        compute(bar, false, out);
        for (std::size_t k = 0; k < output_count_; ++k) {
            outputs_[k].push(out[k]);
        }
        ++total_added_;
    }

    void updateLast(const Bar& bar) override {
        if (BARVAULT_UNLIKELY(total_added_ == 0 || outputs_.empty())) {
            throw EmptyBufferAmendException(name_ + ": update_last before any add");
        }
        restoreCheckpoint();
        Outputs out;
        out.fill(nan());
        compute(bar, true, out);
        for (std::size_t k = 0; k < output_count_; ++k) {
            outputs_[k].updateLast(out[k]);
        }
    }

    IndicatorValue getValue(std::size_t logical_index, std::size_t output = 0) const override {
        if (output >= output_count_) {
            throw InvalidArgumentException(name_ + ": output " + std::to_string(output) +
                                           " out of " + std::to_string(output_count_));
        }
        const std::size_t retained = size();
        if (BARVAULT_UNLIKELY(logical_index >= retained)) {
            throw IndexOutOfRangeException(static_cast<std::int64_t>(logical_index), retained);
        }
        const double value = outputs_[output].get(logical_index);
        // Observations seen up to and including this index, evicted ones included
        const std::uint64_t seen = total_added_ - retained + logical_index + 1;
        const bool available = seen >= warmup_ && !std::isnan(value);
        return IndicatorValue(available ? value : nan(), available);
    }

    IndicatorValue lastValue(std::size_t output = 0) const {
        if (size() == 0) return IndicatorValue::unavailable();
        return getValue(size() - 1, output);
    }

    std::size_t size() const override { return outputs_.empty() ? 0 : outputs_.front().size(); }
    std::size_t outputCount() const override { return output_count_; }
    std::size_t warmupPeriod() const override { return warmup_; }
    std::string getName() const override { return name_; }
    std::size_t maxHistoryLength() const { return outputs_.empty() ? 0 : outputs_.front().capacity(); }
    std::uint64_t observations() const { return total_added_; }

    void reset() override {
        for (auto& column : outputs_) column.clear();
        total_added_ = 0;
        resetState();
    }
};

// ============================================================================
// Checkpointed accumulator state
// ============================================================================

template<typename State>
class CheckpointedIndicator : public IndicatorBase {
protected:
    State state_{};
    State checkpoint_{};

    CheckpointedIndicator(std::string name, std::size_t output_count, std::size_t warmup)
        : IndicatorBase(std::move(name), output_count, warmup) {}

    void saveCheckpoint() override { checkpoint_ = state_; }
    void restoreCheckpoint() override { state_ = checkpoint_; }
    void resetState() override {
        state_ = State{};
        checkpoint_ = State{};
    }
};

// ============================================================================
// Sliding window of inputs
// ============================================================================

// Keeps the last `period` inputs; remembers what the latest push evicted so
// an amendment can undo the eviction arithmetic exactly
class InputWindow {
private:
    RingColumn<double> values_;
    double evicted_ = 0.0;
    bool did_evict_ = false;

public:
    explicit InputWindow(std::size_t period) : values_(period) {}

    void observe(double value, bool amending) {
        if (amending) {
            values_.updateLast(value);
            return;
        }
        did_evict_ = values_.full();
        evicted_ = did_evict_ ? values_.get(0) : 0.0;
        values_.push(value);
    }

    // Value pushed out by the most recent non-amending observe()
    double evicted() const { return evicted_; }
    bool didEvict() const { return did_evict_; }

    bool full() const { return values_.full(); }
    std::size_t size() const { return values_.size(); }
    std::size_t period() const { return values_.capacity(); }
    double get(std::size_t i) const { return values_.get(i); }
    double newest() const { return values_.last(); }

    void clear() {
        values_.clear();
        evicted_ = 0.0;
        did_evict_ = false;
    }
};

} // namespace barvault
