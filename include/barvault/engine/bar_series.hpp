// bar_series.hpp
// Bar Series
// One ColumnStore plus its IndicatorHost, mutated as a single step per bar event

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>
#include "../core/bar_types.hpp"
#include "../core/exceptions.hpp"
#include "../indicators/indicator_factory.hpp"
#include "../interfaces/indicator.hpp"
#include "../storage/column_store.hpp"
#include "indicator_host.hpp"

namespace barvault {

// ============================================================================
// Bar Series
// ============================================================================

class BarSeries {
public:
    struct Config {
        std::int64_t capacity;
        ColumnStore::Config store;

        Config()
            : capacity(120)
            , store(ColumnStore::Config::getDefault()) {}

        static Config getDefault() {
            return Config();
        }
    };

    struct SeriesStats {
        ColumnStore::StoreStats store;
        std::size_t indicator_count;
        std::uint64_t replayed_bars;
    };

private:
    Config config_;
    ColumnStore store_;
    IndicatorHost host_;

    // Held exclusively across store mutation and indicator fan-out
    mutable std::shared_mutex mutex_;

    std::atomic<std::uint64_t> replayed_bars_{0};

public:
    explicit BarSeries(std::int64_t capacity)
        : BarSeries(withCapacity(capacity)) {}

    explicit BarSeries(const Config& config)
        : config_(config),
          store_(config.capacity, config.store),
          host_(store_.capacity()) {}

    BarSeries(const BarSeries&) = delete;
    BarSeries& operator=(const BarSeries&) = delete;

    static Config withCapacity(std::int64_t capacity) {
        Config config;
        config.capacity = capacity;
        return config;
    }

    // ------------------------------------------------------------------------
    // Writer interface
    // ------------------------------------------------------------------------

    void push(const Bar& bar) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        store_.push(bar);
        host_.onPush(bar);
    }

    // Returns the bar that was replaced
    Bar amendLast(const Bar& bar) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        Bar replaced = store_.amendLast(bar);
        host_.onAmend(bar);
        return replaced;
    }

    // Retained bars are replayed into the new indicator oldest first
    IIndicator& addIndicator(const std::string& id, std::unique_ptr<IIndicator> indicator) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        IIndicator& registered = host_.registerIndicator(id, std::move(indicator));
        const std::size_t count = store_.size();
        for (std::size_t i = 0; i < count; ++i) {
            registered.add(store_.get(static_cast<std::int64_t>(i)));
        }
        replayed_bars_.fetch_add(count, std::memory_order_relaxed);
        return registered;
    }

    IIndicator& addIndicator(const std::string& id, const std::string& spec) {
        return addIndicator(id, IndicatorFactory::create(spec));
    }

    // ------------------------------------------------------------------------
    // Readers
    // ------------------------------------------------------------------------

    Bar get(std::int64_t logical_index) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return store_.get(logical_index);
    }

    std::optional<Bar> last() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return store_.last();
    }

    IndicatorValue getValue(const std::string& id, std::size_t logical_index,
                            std::size_t output = 0) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return host_.getValue(id, logical_index, output);
    }

    // Reading aligned with the newest bar
    IndicatorValue lastValue(const std::string& id, std::size_t output = 0) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const IIndicator& indicator = host_.indicator(id);
        if (indicator.size() == 0) return IndicatorValue::unavailable();
        return indicator.getValue(indicator.size() - 1, output);
    }

    // Runs fn with the series held shared so store and indicators are read at one event
    template<typename Fn>
    auto withReadLock(Fn&& fn) const -> decltype(fn(std::declval<const ColumnStore&>(),
                                                    std::declval<const IndicatorHost&>())) {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return fn(store_, host_);
    }

    bool hasIndicator(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return host_.contains(id);
    }

    std::vector<std::string> indicatorIds() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return host_.ids();
    }

    StoreMetadata metadata() const { return store_.metadata(); }
    std::size_t size() const { return store_.size(); }
    std::size_t capacity() const { return store_.capacity(); }

    // Direct store access for exporters; pointers it hands out stay valid for the
    // series' lifetime, their contents only until the next mutation
    const ColumnStore& store() const { return store_; }
    const Config& config() const { return config_; }

    SeriesStats getStats() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return {store_.getStats(), host_.size(), replayed_bars_.load(std::memory_order_relaxed)};
    }
};

} // namespace barvault
