// bar_replayer.hpp
// Bar Replayer
// Applies loaded CSV records to a BarSeries, optionally skipping rejected bars

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "../core/bar_types.hpp"
#include "../core/exceptions.hpp"
#include "../data/csv_bar_loader.hpp"
#include "bar_series.hpp"
#include "multi_period_series.hpp"

namespace barvault {

// ============================================================================
// Bar Replayer
// ============================================================================

class BarReplayer {
public:
    using BarRecord = CsvBarLoader::BarRecord;
    using SkipHandler = std::function<void(const BarRecord&, const InvalidBarException&)>;

    struct Config {
        bool skip_invalid;

        Config() : skip_invalid(false) {}

        static Config getDefault() {
            return Config();
        }
    };

    struct ReplayStats {
        std::uint64_t pushed = 0;
        std::uint64_t amended = 0;
        std::uint64_t skipped = 0;
    };

private:
    Config config_;
    SkipHandler on_skip_;

    // A flagged record revises the forming bar only if that bar is the one it
    // continues; after a skipped row the newest accepted bar may be unrelated
    static bool continuesLast(const BarSeries& series, const BarRecord& record) {
        if (!record.amends_previous) return false;
        const auto last = series.last();
        return last && last->timestamp == record.bar.timestamp;
    }

    void handleRejected(const BarRecord& record, const InvalidBarException& e,
                        ReplayStats& stats) const {
        if (!config_.skip_invalid) {
            throw DataException("line " + std::to_string(record.line) + ": " + e.what());
        }
        ++stats.skipped;
        if (on_skip_) on_skip_(record, e);
    }

public:
    explicit BarReplayer(const Config& config = Config::getDefault(), SkipHandler on_skip = nullptr)
        : config_(config), on_skip_(std::move(on_skip)) {}

    // Throws DataException naming the line for a rejected bar unless skip_invalid is set
    ReplayStats replay(BarSeries& series, const std::vector<BarRecord>& records) const {
        ReplayStats stats;
        for (const auto& record : records) {
            try {
                if (continuesLast(series, record)) {
                    series.amendLast(record.bar);
                    ++stats.amended;
                } else {
                    series.push(record.bar);
                    ++stats.pushed;
                }
            } catch (const InvalidBarException& e) {
                handleRejected(record, e, stats);
            }
        }
        return stats;
    }

    // Every record is a base bar folded into the period candles; amend flags do not apply.
    // Forming candles stay open so more bars can follow; call flush() to close them.
    ReplayStats replay(MultiPeriodSeries& series, const std::vector<BarRecord>& records) const {
        ReplayStats stats;
        for (const auto& record : records) {
            try {
                series.push(record.bar);
                ++stats.pushed;
            } catch (const InvalidBarException& e) {
                handleRejected(record, e, stats);
            }
        }
        return stats;
    }

    const Config& config() const { return config_; }
};

} // namespace barvault
