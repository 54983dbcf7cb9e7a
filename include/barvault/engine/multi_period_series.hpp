// multi_period_series.hpp
// Multi-Period Series
// One BarSeries per aggregation period, fed from a BarAggregator: a candle that
// starts is pushed, a forming candle that changes amends the newest bar

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "../core/bar_types.hpp"
#include "../core/exceptions.hpp"
#include "../interfaces/indicator.hpp"
#include "bar_aggregator.hpp"
#include "bar_series.hpp"

namespace barvault {

// ============================================================================
// Multi-Period Series
// ============================================================================

class MultiPeriodSeries {
public:
    struct Config {
        BarSeries::Config series;  // applied to every period

        Config() : series(BarSeries::Config::getDefault()) {}

        static Config getDefault() {
            return Config();
        }
    };

    struct RoutingStats {
        std::uint64_t pushes;
        std::uint64_t amends;
        std::uint64_t closed;
    };

private:
    Config config_;
    BarAggregator aggregator_;
    std::vector<Period> periods_;
    std::vector<std::unique_ptr<BarSeries>> series_;  // parallel to periods_

    std::uint64_t pushes_ = 0;
    std::uint64_t amends_ = 0;
    std::uint64_t closed_ = 0;

    static BarAggregator::Config aggregatorConfig(const Config& config) {
        BarAggregator::Config out;
        out.validate_ohlc = config.series.store.validate_ohlc;
        return out;
    }

    std::size_t slotOf(const Period& period) const {
        for (std::size_t i = 0; i < periods_.size(); ++i) {
            if (periods_[i] == period) return i;
        }
        throw InvalidArgumentException("period " + period.toString() + " is not aggregated");
    }

    void route(const AggregatorEvent& event) {
        BarSeries& target = *series_[slotOf(event.period)];
        if (event.kind == CandleEventKind::Closed) {
            // Its final values already reached the series with the last update
            ++closed_;
            return;
        }
        const auto last = target.last();
        if (last && last->timestamp == event.candle.open_time) {
            target.amendLast(event.candle.asBar());
            ++amends_;
        } else {
            target.push(event.candle.asBar());
            ++pushes_;
        }
    }

public:
    explicit MultiPeriodSeries(const std::vector<Period>& periods,
                               const Config& config = Config::getDefault())
        : config_(config), aggregator_(periods, aggregatorConfig(config)), periods_(periods) {
        for (std::size_t i = 0; i < periods_.size(); ++i) {
            series_.push_back(std::make_unique<BarSeries>(config_.series));
        }
    }

    MultiPeriodSeries(const MultiPeriodSeries&) = delete;
    MultiPeriodSeries& operator=(const MultiPeriodSeries&) = delete;

    // Feeds one base bar and applies the resulting candle events; returns them
    std::vector<AggregatorEvent> push(const Bar& bar) {
        aggregator_.push(bar);
        std::vector<AggregatorEvent> events = aggregator_.pollEvents();
        for (const auto& event : events) route(event);
        return events;
    }

    // Closes every forming candle; the series keep them as their newest bars
    std::vector<AggregatorEvent> flush() {
        aggregator_.flush();
        std::vector<AggregatorEvent> events = aggregator_.pollEvents();
        for (const auto& event : events) route(event);
        return events;
    }

    // Registers the same indicator spec on every period's series
    void addIndicator(const std::string& id, const std::string& spec) {
        for (auto& series : series_) series->addIndicator(id, spec);
    }

    BarSeries& series(const Period& period) { return *series_[slotOf(period)]; }
    const BarSeries& series(const Period& period) const { return *series_[slotOf(period)]; }

    const std::vector<Period>& periods() const { return periods_; }
    const BarAggregator& aggregator() const { return aggregator_; }
    const Config& config() const { return config_; }

    RoutingStats getStats() const { return {pushes_, amends_, closed_}; }
};

} // namespace barvault
