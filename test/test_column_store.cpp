// test_column_store.cpp
// ColumnStore: capacity, eviction order, wrap-aware slicing, amendment and validation

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <vector>
#include "../include/barvault/core/bar_types.hpp"
#include "../include/barvault/core/exceptions.hpp"
#include "../include/barvault/storage/column_store.hpp"
#include "test_framework.hpp"

using namespace barvault;
using namespace barvault::testing;

namespace {

Bar barWithClose(std::int64_t ts, double close) {
    return Bar(ts, close - 1.0, close + 2.0, close - 2.0, close, 100.0 + close, 40.0 + close);
}

// Reads every field of `field` through the slice pair into chronological order
std::vector<double> concatSlices(const ColumnStore& store, BarField field) {
    const SlicePair slices = store.orderedSlices();
    const double* base = store.columnData(field);
    std::vector<double> out;
    for (std::size_t i = 0; i < slices.first.length; ++i) out.push_back(base[slices.first.offset + i]);
    for (std::size_t i = 0; i < slices.second.length; ++i) out.push_back(base[slices.second.offset + i]);
    return out;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

void test_capacity_must_be_positive() {
    auto e0 = CHECK_THROWS(CapacityInvalidException, ColumnStore(0));
    CHECK(e0.code() == ErrorCode::CapacityInvalid);
    CHECK_THROWS(CapacityInvalidException, ColumnStore(-5));

    ColumnStore store(4);
    CHECK_EQ(store.capacity(), 4u);
    CHECK_EQ(store.size(), 0u);
    CHECK(store.empty());
    CHECK(!store.full());
    CHECK(!store.last().has_value());
}

// ============================================================================
// Push / eviction
// ============================================================================

void test_size_bound() {
    for (std::int64_t capacity : {1, 2, 3, 7}) {
        ColumnStore store(capacity);
        for (int n = 1; n <= 20; ++n) {
            store.push(barWithClose(n, n));
            const std::size_t expected = std::min<std::size_t>(n, static_cast<std::size_t>(capacity));
            CHECK_EQ(store.size(), expected);
            CHECK_EQ(store.len(), expected);
        }
        CHECK(store.full());
    }
}

void test_eviction_order() {
    ColumnStore store(5);
    for (int n = 0; n < 13; ++n) store.push(barWithClose(n, 100.0 + n));

    // Last five pushes, oldest first
    for (std::int64_t i = 0; i < 5; ++i) {
        const Bar bar = store.get(i);
        CHECK_EQ(bar.timestamp, 8 + i);
        CHECK_EQ(bar.close, 108.0 + i);
        CHECK(bar == barWithClose(8 + i, 108.0 + i));
    }
    CHECK_EQ(store.getStats().total_evictions, 8u);
    CHECK_EQ(store.getStats().total_pushes, 13u);
}

void test_wraps_and_evicts_oldest() {
    ColumnStore store(3);
    store.push(barWithClose(1, 10));
    store.push(barWithClose(2, 20));
    store.push(barWithClose(3, 30));
    store.push(barWithClose(4, 40));

    CHECK_EQ(store.len(), 3u);
    CHECK_EQ(store.get(0).close, 20.0);
    CHECK_EQ(store.get(1).close, 30.0);
    CHECK_EQ(store.get(2).close, 40.0);
    for (std::int64_t i = 0; i < 3; ++i) CHECK(store.get(i).close != 10.0);
}

void test_index_out_of_range() {
    ColumnStore store(3);
    CHECK_THROWS(IndexOutOfRangeException, store.get(0));
    store.push(barWithClose(1, 10));
    auto e = CHECK_THROWS(IndexOutOfRangeException, store.get(1));
    CHECK(e.code() == ErrorCode::IndexOutOfRange);
    CHECK_EQ(e.index(), 1);
    CHECK_THROWS(IndexOutOfRangeException, store.get(-1));
    CHECK(!store.tryGet(5).has_value());
    CHECK(store.tryGet(0).has_value());
    CHECK_THROWS(IndexOutOfRangeException, store.getField(BarField::Close, 3));
}

// ============================================================================
// Slices
// ============================================================================

void test_wrapped_slices_concatenate() {
    ColumnStore store(3);
    for (int n = 1; n <= 4; ++n) store.push(barWithClose(n, 10.0 * n));

    const SlicePair slices = store.closeOrderedSlices();
    CHECK(slices.wrapped());
    CHECK_EQ(slices.first.offset, 1u);
    CHECK_EQ(slices.first.length, 2u);
    CHECK_EQ(slices.second.offset, 0u);
    CHECK_EQ(slices.second.length, 1u);

    const std::vector<double> closes = concatSlices(store, BarField::Close);
    CHECK(closes == std::vector<double>({20.0, 30.0, 40.0}));
}

void test_slice_concatenation_every_state() {
    const std::int64_t capacity = 6;
    ColumnStore store(capacity);
    CHECK_EQ(store.orderedSlices().total(), 0u);

    for (int n = 0; n < 20; ++n) {
        store.push(barWithClose(n, 3.5 * n + 1.0));
        const SlicePair slices = store.orderedSlices();
        CHECK_EQ(slices.total(), store.size());
        CHECK(slices.first.offset + slices.first.length <= static_cast<std::size_t>(capacity));

        for (BarField field : kAllBarFields) {
            if (field == BarField::Timestamp) continue;
            const std::vector<double> values = concatSlices(store, field);
            CHECK_EQ(values.size(), store.size());
            for (std::size_t i = 0; i < values.size(); ++i) {
                CHECK_EQ(values[i], barFieldValue(store.get(static_cast<std::int64_t>(i)), field));
            }
            CHECK(store.copyOrdered(field) == values);
        }

        const std::vector<std::int64_t> ts = store.copyTimestamps();
        for (std::size_t i = 0; i < ts.size(); ++i) {
            CHECK_EQ(ts[i], store.get(static_cast<std::int64_t>(i)).timestamp);
        }
    }
}

void test_compute_slices_helper() {
    SlicePair empty = ColumnStore::computeSlices(4, 0, 0);
    CHECK_EQ(empty.total(), 0u);

    SlicePair straight = ColumnStore::computeSlices(4, 3, 3);
    CHECK_EQ(straight.first.offset, 0u);
    CHECK_EQ(straight.first.length, 3u);
    CHECK(!straight.wrapped());

    SlicePair full_aligned = ColumnStore::computeSlices(4, 0, 4);
    CHECK_EQ(full_aligned.first.offset, 0u);
    CHECK_EQ(full_aligned.first.length, 4u);
    CHECK(!full_aligned.wrapped());

    SlicePair wrapped = ColumnStore::computeSlices(4, 1, 4);
    CHECK_EQ(wrapped.first.offset, 1u);
    CHECK_EQ(wrapped.first.length, 3u);
    CHECK_EQ(wrapped.second.offset, 0u);
    CHECK_EQ(wrapped.second.length, 1u);
}

// ============================================================================
// Amend
// ============================================================================

void test_amend_on_empty_store() {
    ColumnStore store(2);
    auto e = CHECK_THROWS(EmptyBufferAmendException, store.amendLast(barWithClose(1, 1)));
    CHECK(e.code() == ErrorCode::EmptyBufferAmend);
    CHECK_EQ(store.size(), 0u);
    CHECK_EQ(store.getStats().rejected_writes, 1u);
}

void test_amend_isolation() {
    ColumnStore store(4);
    for (int n = 0; n < 6; ++n) store.push(barWithClose(n, 10.0 + n));

    std::vector<Bar> before;
    for (std::int64_t i = 0; i < 4; ++i) before.push_back(store.get(i));
    const std::size_t head = store.head();

    const Bar revised(5, 1.0, 99.0, 0.5, 42.0, 7.0, 3.0);
    const Bar replaced = store.amendLast(revised);
    CHECK(replaced == before.back());

    CHECK_EQ(store.size(), 4u);
    CHECK_EQ(store.head(), head);
    for (std::int64_t i = 0; i < 3; ++i) CHECK(store.get(i) == before[static_cast<std::size_t>(i)]);
    CHECK(store.get(3) == revised);
    CHECK(*store.last() == revised);
    CHECK_EQ(*store.lastField(BarField::Close), 42.0);
    CHECK_EQ(store.getStats().total_amends, 1u);
}

// ============================================================================
// Validation
// ============================================================================

void test_rejects_non_finite() {
    ColumnStore store(3);
    store.push(barWithClose(1, 10));
    const auto meta = store.metadata();

    Bar bad = barWithClose(2, 11);
    bad.high = std::numeric_limits<double>::quiet_NaN();
    auto e = CHECK_THROWS(InvalidBarException, store.push(bad));
    CHECK(e.code() == ErrorCode::InvalidBar);

    bad = barWithClose(2, 11);
    bad.volume = std::numeric_limits<double>::infinity();
    CHECK_THROWS(InvalidBarException, store.amendLast(bad));

    const auto after = store.metadata();
    CHECK_EQ(after.count, meta.count);
    CHECK_EQ(after.head, meta.head);
    CHECK_EQ(after.generation, meta.generation);
    CHECK(store.get(0) == barWithClose(1, 10));
    CHECK_EQ(store.getStats().rejected_writes, 2u);
}

void test_rejects_decreasing_timestamps() {
    ColumnStore store(3);
    store.push(barWithClose(100, 10));
    store.push(barWithClose(100, 11));  // equal timestamps are allowed
    CHECK_THROWS(InvalidBarException, store.push(barWithClose(99, 12)));
    CHECK_EQ(store.size(), 2u);

    // Amend compares against the bar before the last
    store.push(barWithClose(200, 12));
    store.amendLast(barWithClose(150, 12));
    CHECK_THROWS(InvalidBarException, store.amendLast(barWithClose(50, 12)));
    CHECK_EQ(store.get(2).timestamp, 150);
}

void test_validation_config() {
    ColumnStore::Config relaxed;
    relaxed.reject_non_finite = false;
    relaxed.enforce_monotonic_timestamps = false;
    ColumnStore loose(3, relaxed);
    loose.push(barWithClose(10, 1));
    loose.push(barWithClose(5, std::numeric_limits<double>::quiet_NaN()));
    CHECK_EQ(loose.size(), 2u);
    CHECK(std::isnan(loose.get(1).close));

    ColumnStore::Config strict;
    strict.validate_ohlc = true;
    ColumnStore store(3, strict);
    store.push(Bar(1, 10.0, 12.0, 9.0, 11.0, 5.0, 2.0));
    CHECK_THROWS(InvalidBarException, store.push(Bar(2, 10.0, 9.0, 8.0, 11.0, 5.0)));
    CHECK_THROWS(InvalidBarException, store.push(Bar(2, 10.0, 12.0, 9.0, 11.0, -1.0)));
    CHECK_EQ(store.size(), 1u);
}

// ============================================================================
// Metadata and optimistic reads
// ============================================================================

void test_metadata_and_generation() {
    ColumnStore store(2);
    CHECK_EQ(store.metadata().generation, 0u);
    store.push(barWithClose(1, 1));
    store.push(barWithClose(2, 2));
    store.amendLast(barWithClose(2, 3));
    store.push(barWithClose(3, 4));

    const StoreMetadata meta = store.metadata();
    CHECK_EQ(meta.capacity, 2u);
    CHECK_EQ(meta.count, 2u);
    CHECK_EQ(meta.head, 1u);
    CHECK_EQ(meta.generation, 4u);
    CHECK_EQ(store.generation(), 4u);

    const auto bar = store.optimisticGet(1);
    CHECK(bar.has_value());
    CHECK_EQ(bar->close, 4.0);
    CHECK(!store.optimisticGet(2).has_value());

    const double sum = store.readConsistent([&store]() {
        double total = 0.0;
        for (std::size_t i = 0; i < store.size(); ++i) total += store.peek(i)->close;
        return total;
    });
    CHECK_EQ(sum, 7.0);
}

void test_column_addresses_are_stable() {
    ColumnStore store(3);
    const double* close = store.columnData(BarField::Close);
    const std::int64_t* ts = store.timestampData();
    for (int n = 0; n < 10; ++n) store.push(barWithClose(n, n));
    CHECK(close == store.columnData(BarField::Close));
    CHECK(ts == store.timestampData());
    CHECK_THROWS(InvalidArgumentException, store.columnData(BarField::Timestamp));
    CHECK_THROWS(InvalidArgumentException, store.copyOrdered(BarField::Timestamp));
}

int main() {
    std::cout << "\n=== ColumnStore Test Suite ===" << std::endl;

    TestReporter reporter;

    std::cout << "Construction:" << std::endl;
    reporter.test("Capacity Must Be Positive", test_capacity_must_be_positive);

    std::cout << "\nPush / Eviction:" << std::endl;
    reporter.test("Size Bound", test_size_bound);
    reporter.test("Eviction Order", test_eviction_order);
    reporter.test("Wraps And Evicts Oldest", test_wraps_and_evicts_oldest);
    reporter.test("Index Out Of Range", test_index_out_of_range);

    std::cout << "\nSlices:" << std::endl;
    reporter.test("Wrapped Slices Concatenate", test_wrapped_slices_concatenate);
    reporter.test("Concatenation In Every State", test_slice_concatenation_every_state);
    reporter.test("computeSlices Helper", test_compute_slices_helper);

    std::cout << "\nAmend:" << std::endl;
    reporter.test("Amend On Empty Store", test_amend_on_empty_store);
    reporter.test("Amend Touches Only Newest Bar", test_amend_isolation);

    std::cout << "\nValidation:" << std::endl;
    reporter.test("Rejects Non-Finite", test_rejects_non_finite);
    reporter.test("Rejects Decreasing Timestamps", test_rejects_decreasing_timestamps);
    reporter.test("Validation Config", test_validation_config);

    std::cout << "\nMetadata:" << std::endl;
    reporter.test("Metadata And Generation", test_metadata_and_generation);
    reporter.test("Stable Column Addresses", test_column_addresses_are_stable);

    reporter.report();
    return reporter.exitCode();
}
