// bar_aggregator.hpp
// Multi-Period Bar Aggregator
// Folds a stream of base bars into candles for several periods at once and
// reports each change as an updated (forming) or closed candle

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <deque>
#include <limits>
#include <string>
#include <vector>
#include "../core/bar_types.hpp"
#include "../core/branch_hints.hpp"
#include "../core/exceptions.hpp"

namespace barvault {

// ============================================================================
// Period
// ============================================================================

class Period {
private:
    std::int64_t ms_;

    explicit Period(std::int64_t ms) : ms_(ms) {}

public:
    static Period fromMs(std::int64_t ms) {
        if (ms <= 0) {
            throw InvalidArgumentException("period must be > 0 ms, got " + std::to_string(ms));
        }
        return Period(ms);
    }

    // "<n><unit>" with unit one of ms, s, m, h, d (case-insensitive), e.g. "15m", "500ms"
    static Period parse(const std::string& text) {
        std::string s = text;
        s.erase(0, s.find_first_not_of(" \t\r\n"));
        s.erase(s.find_last_not_of(" \t\r\n") + 1);
        if (s.empty()) {
            throw InvalidArgumentException("empty period");
        }

        const std::size_t digits_end = s.find_first_not_of("0123456789");
        if (digits_end == 0) {
            throw InvalidArgumentException("period '" + text + "' is missing a number");
        }
        const std::string digits = s.substr(0, digits_end);
        std::string unit = digits_end == std::string::npos ? "" : s.substr(digits_end);
        unit.erase(0, unit.find_first_not_of(" \t"));
        std::transform(unit.begin(), unit.end(), unit.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        std::int64_t scale = 0;
        if (unit == "ms") scale = 1;
        else if (unit == "s") scale = 1000;
        else if (unit == "m") scale = 60 * 1000;
        else if (unit == "h") scale = 60 * 60 * 1000;
        else if (unit == "d") scale = 24 * 60 * 60 * 1000;
        else {
            throw InvalidArgumentException("period '" + text + "' has unsupported unit (use ms/s/m/h/d)");
        }

        std::int64_t n = 0;
        try {
            n = static_cast<std::int64_t>(std::stoll(digits));
        } catch (const std::exception&) {
            throw InvalidArgumentException("period '" + text + "' is out of range");
        }
        if (n <= 0) {
            throw InvalidArgumentException("period '" + text + "' must be > 0");
        }
        if (n > std::numeric_limits<std::int64_t>::max() / scale) {
            throw InvalidArgumentException("period '" + text + "' is out of range");
        }
        return Period(n * scale);
    }

    std::int64_t asMs() const { return ms_; }

    // Start of the bucket containing ts; floors for timestamps before the epoch as well
    std::int64_t bucketStart(std::int64_t ts) const {
        std::int64_t q = ts / ms_;
        if (ts % ms_ != 0 && ts < 0) --q;
        return q * ms_;
    }

    std::string toString() const {
        static const std::int64_t kUnits[] = {24LL * 60 * 60 * 1000, 60LL * 60 * 1000, 60LL * 1000, 1000LL};
        static const char* kNames[] = {"d", "h", "m", "s"};
        for (std::size_t i = 0; i < 4; ++i) {
            if (ms_ % kUnits[i] == 0) return std::to_string(ms_ / kUnits[i]) + kNames[i];
        }
        return std::to_string(ms_) + "ms";
    }

    bool operator==(const Period& other) const { return ms_ == other.ms_; }
    bool operator!=(const Period& other) const { return ms_ != other.ms_; }
    bool operator<(const Period& other) const { return ms_ < other.ms_; }
};

// ============================================================================
// Candles and Events
// ============================================================================

struct AggregateCandle {
    std::int64_t open_time = 0;
    std::int64_t close_time = 0;  // exclusive
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    double buy_volume = 0.0;
    std::int64_t last_update_ts = 0;

    AggregateCandle() = default;

    AggregateCandle(std::int64_t open_ts, std::int64_t close_ts, const Bar& bar)
        : open_time(open_ts), close_time(close_ts),
          open(bar.open), high(bar.high), low(bar.low), close(bar.close),
          volume(bar.volume), buy_volume(bar.buy_volume),
          last_update_ts(bar.timestamp) {}

    void merge(const Bar& bar) {
        high = std::max(high, bar.high);
        low = std::min(low, bar.low);
        close = bar.close;
        volume += bar.volume;
        buy_volume += bar.buy_volume;
        last_update_ts = bar.timestamp;
    }

    // Stamped with the bucket's open time
    Bar asBar() const {
        return Bar(open_time, open, high, low, close, volume, buy_volume);
    }
};

enum class CandleEventKind : std::uint8_t {
    Updated = 0,  // the forming candle started or changed
    Closed = 1    // the candle is final
};

inline const char* candleEventKindName(CandleEventKind kind) {
    return kind == CandleEventKind::Updated ? "updated" : "closed";
}

struct AggregatorEvent {
    CandleEventKind kind;
    Period period;
    AggregateCandle candle;
};

// ============================================================================
// Bar Aggregator (single writer, no internal synchronization)
// ============================================================================

// Input bar timestamps are open times in ms and must not decrease. A bar in the
// forming candle's bucket is merged into it; a bar in a later bucket closes the
// forming candle and starts a new one. Bars landing in a closed candle are rejected.
class BarAggregator {
public:
    struct Config {
        bool validate_ohlc;

        Config() : validate_ohlc(false) {}

        static Config getDefault() {
            return Config();
        }
    };

    struct AggregatorStats {
        std::uint64_t bars_in;
        std::uint64_t candles_closed;
        std::uint64_t rejected_bars;
    };

private:
    struct Slot {
        Period period;
        bool forming;
        AggregateCandle current;
        bool has_closed;
        std::int64_t closed_open_time;  // newest closed candle
    };

    Config config_;
    std::vector<Slot> slots_;
    std::deque<AggregatorEvent> events_;
    bool has_last_ts_ = false;
    std::int64_t last_ts_ = 0;

    std::uint64_t bars_in_ = 0;
    std::uint64_t candles_closed_ = 0;
    std::uint64_t rejected_bars_ = 0;

    [[noreturn]] BARVAULT_NO_INLINE BARVAULT_COLD_FUNCTION void reject(const std::string& reason) {
        ++rejected_bars_;
        throw InvalidBarException(reason);
    }

    void validate(const Bar& bar) {
        if (BARVAULT_UNLIKELY(!bar.isFinite())) {
            reject("non-finite field at timestamp " + std::to_string(bar.timestamp));
        }
        if (has_last_ts_ && BARVAULT_UNLIKELY(bar.timestamp < last_ts_)) {
            reject("timestamp " + std::to_string(bar.timestamp) +
                   " precedes previous bar at " + std::to_string(last_ts_));
        }
        if (config_.validate_ohlc && BARVAULT_UNLIKELY(!bar.isConsistent())) {
            reject("inconsistent OHLC/volume at timestamp " + std::to_string(bar.timestamp));
        }
        // Only reachable after flush(): a closed candle is final
        for (const Slot& slot : slots_) {
            if (slot.has_closed && slot.period.bucketStart(bar.timestamp) <= slot.closed_open_time) {
                reject("timestamp " + std::to_string(bar.timestamp) + " falls in the closed " +
                       slot.period.toString() + " candle at " +
                       std::to_string(slot.closed_open_time));
            }
        }
    }

    void close(Slot& slot) {
        events_.push_back({CandleEventKind::Closed, slot.period, slot.current});
        slot.forming = false;
        slot.has_closed = true;
        slot.closed_open_time = slot.current.open_time;
        ++candles_closed_;
    }

public:
    explicit BarAggregator(const std::vector<Period>& periods,
                           const Config& config = Config::getDefault())
        : config_(config) {
        if (periods.empty()) {
            throw InvalidArgumentException("aggregator needs at least one period");
        }
        for (const Period& p : periods) {
            for (const Slot& slot : slots_) {
                if (slot.period == p) {
                    throw InvalidArgumentException("duplicate aggregation period " + p.toString());
                }
            }
            slots_.push_back(Slot{p, false, AggregateCandle(), false, 0});
        }
    }

    // Rejected bars leave every candle untouched
    void push(const Bar& bar) {
        validate(bar);

        for (Slot& slot : slots_) {
            const std::int64_t open_time = slot.period.bucketStart(bar.timestamp);
            if (slot.forming && slot.current.open_time == open_time) {
                slot.current.merge(bar);
            } else {
                if (slot.forming) close(slot);
                slot.current = AggregateCandle(open_time, open_time + slot.period.asMs(), bar);
                slot.forming = true;
            }
            events_.push_back({CandleEventKind::Updated, slot.period, slot.current});
        }

        has_last_ts_ = true;
        last_ts_ = bar.timestamp;
        ++bars_in_;
    }

    // Closes every forming candle
    void flush() {
        for (Slot& slot : slots_) {
            if (slot.forming) close(slot);
        }
    }

    // Drains queued events in emission order
    std::vector<AggregatorEvent> pollEvents() {
        std::vector<AggregatorEvent> out(events_.begin(), events_.end());
        events_.clear();
        return out;
    }

    std::size_t pendingEvents() const { return events_.size(); }

    std::vector<Period> periods() const {
        std::vector<Period> out;
        out.reserve(slots_.size());
        for (const Slot& slot : slots_) out.push_back(slot.period);
        return out;
    }

    // Forming candle of a period, if any
    const AggregateCandle* forming(const Period& period) const {
        for (const Slot& slot : slots_) {
            if (slot.period == period) return slot.forming ? &slot.current : nullptr;
        }
        throw InvalidArgumentException("period " + period.toString() + " is not aggregated");
    }

    AggregatorStats getStats() const {
        return {bars_in_, candles_closed_, rejected_bars_};
    }
};

} // namespace barvault
