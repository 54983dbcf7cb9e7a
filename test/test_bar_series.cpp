// test_bar_series.cpp
// BarSeries: store and indicators advanced together, late registration replay

#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <vector>
#include "../include/barvault/core/bar_types.hpp"
#include "../include/barvault/core/exceptions.hpp"
#include "../include/barvault/engine/bar_series.hpp"
#include "test_framework.hpp"

using namespace barvault;
using namespace barvault::testing;

namespace {

Bar closeBar(std::int64_t ts, double close) {
    return Bar(ts, close, close + 1.0, close - 1.0, close, 10.0 + close);
}

} // namespace

void test_push_drives_indicators() {
    BarSeries series(3);
    series.addIndicator("ma2", "sma:close:2");
    series.addIndicator("ema", "ema:close:3");
    series.push(closeBar(1, 10));
    series.push(closeBar(2, 20));
    series.push(closeBar(3, 30));

    CHECK_EQ(series.size(), 3u);
    CHECK(!series.getValue("ma2", 0).available);
    CHECK_EQ(series.getValue("ma2", 1).value, 15.0);
    CHECK_EQ(series.getValue("ma2", 2).value, 25.0);
    CHECK_EQ(series.lastValue("ema").value, 22.5);

    // Eviction keeps indicator indices aligned with the store
    series.push(closeBar(4, 40));
    CHECK_EQ(series.get(0).close, 20.0);
    CHECK_EQ(series.getValue("ma2", 0).value, 15.0);
    CHECK_EQ(series.getValue("ma2", 2).value, 35.0);
}

void test_amend_reaches_every_indicator() {
    BarSeries series(5);
    series.addIndicator("ma2", "sma:close:2");
    series.addIndicator("boll", "boll:2:1");
    series.push(closeBar(1, 10));
    series.push(closeBar(2, 20));

    const Bar replaced = series.amendLast(closeBar(2, 30));
    CHECK_EQ(replaced.close, 20.0);
    CHECK_EQ(series.get(1).close, 30.0);
    CHECK_EQ(series.getValue("ma2", 1).value, 20.0);
    CHECK_EQ(series.getValue("boll", 1, BollingerBands::Mid).value, 20.0);
    CHECK_EQ(series.getValue("boll", 1, BollingerBands::Upper).value, 30.0);
    CHECK_EQ(series.getValue("boll", 1, BollingerBands::Lower).value, 10.0);

    CHECK_THROWS(EmptyBufferAmendException, BarSeries(2).amendLast(closeBar(1, 1)));
}

void test_rejected_bar_touches_nothing() {
    BarSeries series(4);
    series.addIndicator("ma2", "sma:close:2");
    series.push(closeBar(10, 1));
    series.push(closeBar(20, 2));

    CHECK_THROWS(InvalidBarException, series.push(closeBar(15, 3)));
    Bar nan_bar = closeBar(30, 3);
    nan_bar.close = std::numeric_limits<double>::quiet_NaN();
    CHECK_THROWS(InvalidBarException, series.amendLast(nan_bar));

    CHECK_EQ(series.size(), 2u);
    CHECK_EQ(series.getValue("ma2", 1).value, 1.5);
    CHECK_EQ(series.store().getStats().rejected_writes, 2u);
}

void test_late_indicator_replays_history() {
    BarSeries series(4);
    for (int i = 1; i <= 6; ++i) series.push(closeBar(i, 10.0 * i));

    series.addIndicator("ma2", "sma:close:2");
    const IIndicator& indicator = series.withReadLock(
        [](const ColumnStore&, const IndicatorHost& host) -> const IIndicator& {
            return host.indicator("ma2");
        });
    CHECK_EQ(indicator.size(), 4u);

    // Retained closes are 30, 40, 50, 60; the first retained bar starts its window
    CHECK(!series.getValue("ma2", 0).available);
    CHECK_EQ(series.getValue("ma2", 1).value, 35.0);
    CHECK_EQ(series.getValue("ma2", 3).value, 55.0);
    CHECK_EQ(series.getStats().replayed_bars, 4u);

    series.push(closeBar(7, 70));
    CHECK_EQ(series.getValue("ma2", 3).value, 65.0);
}

void test_registration_errors() {
    BarSeries series(4);
    series.addIndicator("rsi", "rsi:3");
    CHECK_THROWS(DuplicateIndicatorIdException, series.addIndicator("rsi", "rsi:5"));
    CHECK_THROWS(InvalidArgumentException, series.addIndicator("bad", "rsi:zero"));
    CHECK_THROWS(InvalidArgumentException, series.addIndicator("", "rsi:3"));
    CHECK_THROWS(UnknownIndicatorIdException, series.getValue("nope", 0));
    CHECK(series.hasIndicator("rsi"));
    CHECK(!series.hasIndicator("bad"));
    CHECK(series.indicatorIds() == std::vector<std::string>({"rsi"}));
    CHECK_THROWS(CapacityInvalidException, BarSeries(0));
}

void test_consistent_read_under_lock() {
    BarSeries series(8);
    series.addIndicator("ma3", "sma:close:3");
    for (int i = 1; i <= 10; ++i) series.push(closeBar(i, i));

    const bool aligned = series.withReadLock([](const ColumnStore& store, const IndicatorHost& host) {
        const std::size_t n = store.size();
        if (host.indicator("ma3").size() != n) return false;
        for (std::size_t i = 2; i < n; ++i) {
            double sum = 0.0;
            for (std::size_t j = i - 2; j <= i; ++j) {
                sum += store.getField(BarField::Close, static_cast<std::int64_t>(j));
            }
            if (std::fabs(host.getValue("ma3", i).value - sum / 3.0) > 1e-12) return false;
        }
        return true;
    });
    CHECK(aligned);

    const auto stats = series.getStats();
    CHECK_EQ(stats.store.total_pushes, 10u);
    CHECK_EQ(stats.store.total_evictions, 2u);
    CHECK_EQ(stats.indicator_count, 1u);
    CHECK_EQ(series.metadata().generation, 10u);
}

int main() {
    std::cout << "\n=== BarSeries Test Suite ===" << std::endl;

    TestReporter reporter;

    reporter.test("Push Drives Indicators", test_push_drives_indicators);
    reporter.test("Amend Reaches Every Indicator", test_amend_reaches_every_indicator);
    reporter.test("Rejected Bar Touches Nothing", test_rejected_bar_touches_nothing);
    reporter.test("Late Indicator Replays History", test_late_indicator_replays_history);
    reporter.test("Registration Errors", test_registration_errors);
    reporter.test("Consistent Read Under Lock", test_consistent_read_under_lock);

    reporter.report();
    return reporter.exitCode();
}
