// column_store.hpp
// Fixed-Capacity Circular Columnar Bar Store
// Seven pre-allocated parallel columns with wrap-aware chronological slicing,
// a shared/exclusive lock around write+publish and a sequence counter for optimistic readers

#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>
#include "../core/bar_types.hpp"
#include "../core/branch_hints.hpp"
#include "../core/exceptions.hpp"

namespace barvault {

// ============================================================================
// Slices and Metadata
// ============================================================================

// Contiguous run of physical indices [offset, offset + length)
struct SliceRange {
    std::size_t offset = 0;
    std::size_t length = 0;

    bool empty() const { return length == 0; }
};

// first then second is the chronological order; second is empty unless the data wraps
struct SlicePair {
    SliceRange first;
    SliceRange second;

    std::size_t total() const { return first.length + second.length; }
    bool wrapped() const { return !second.empty(); }
};

struct StoreMetadata {
    std::size_t capacity = 0;
    std::size_t head = 0;
    std::size_t count = 0;
    std::uint64_t generation = 0;  // completed mutations
};

// ============================================================================
// Column Store
// ============================================================================

class ColumnStore {
public:
    struct Config {
        bool reject_non_finite;
        bool enforce_monotonic_timestamps;
        bool validate_ohlc;

        Config()
            : reject_non_finite(true)
            , enforce_monotonic_timestamps(true)
            , validate_ohlc(false) {}

        static Config getDefault() {
            return Config();
        }
    };

    struct StoreStats {
        std::uint64_t total_pushes;
        std::uint64_t total_amends;
        std::uint64_t total_evictions;
        std::uint64_t rejected_writes;
        std::size_t current_size;
        double utilization_pct;
    };

    static constexpr std::size_t kValueColumns = kBarFieldCount - 1;

    // Same split as orderedSlices(); usable by consumers that only have the metadata
    static SlicePair computeSlices(std::size_t capacity, std::size_t head, std::size_t count) {
        SlicePair slices;
        if (capacity == 0 || count == 0) return slices;
        const std::size_t oldest = (head + capacity - count) % capacity;
        if (oldest + count <= capacity) {
            slices.first = {oldest, count};
        } else {
            slices.first = {oldest, capacity - oldest};
            slices.second = {0, count - (capacity - oldest)};
        }
        return slices;
    }

private:
    const std::size_t capacity_;
    Config config_;

    // Fixed addresses for the store's lifetime; exported slices point straight into these
    std::unique_ptr<std::int64_t[]> timestamps_;
    std::array<std::unique_ptr<double[]>, kValueColumns> values_;

    // head/count are atomics so optimistic readers can sample them without the lock
    std::atomic<std::size_t> head_{0};
    std::atomic<std::size_t> count_{0};

    // Odd while a write is in flight
    alignas(kCacheLineSize) std::atomic<std::uint64_t> sequence_{0};

    mutable std::shared_mutex mutex_;

    std::atomic<std::uint64_t> total_pushes_{0};
    std::atomic<std::uint64_t> total_amends_{0};
    std::atomic<std::uint64_t> total_evictions_{0};
    std::atomic<std::uint64_t> rejected_writes_{0};

    static std::size_t validatedCapacity(std::int64_t capacity) {
        if (capacity <= 0) {
            throw CapacityInvalidException("capacity must be > 0, got " + std::to_string(capacity));
        }
        return static_cast<std::size_t>(capacity);
    }

    static std::size_t columnSlot(BarField field) {
        return static_cast<std::size_t>(field) - 1;
    }

    BARVAULT_FORCE_INLINE std::size_t physicalIndex(std::size_t logical, std::size_t head,
                                                    std::size_t count) const {
        return (head + capacity_ - count + logical) % capacity_;
    }

    BARVAULT_FORCE_INLINE void writeSlot(std::size_t slot, const Bar& bar) {
        timestamps_[slot] = bar.timestamp;
        values_[columnSlot(BarField::Open)][slot] = bar.open;
        values_[columnSlot(BarField::High)][slot] = bar.high;
        values_[columnSlot(BarField::Low)][slot] = bar.low;
        values_[columnSlot(BarField::Close)][slot] = bar.close;
        values_[columnSlot(BarField::Volume)][slot] = bar.volume;
        values_[columnSlot(BarField::BuyVolume)][slot] = bar.buy_volume;
    }

    BARVAULT_FORCE_INLINE Bar readSlot(std::size_t slot) const {
        return Bar(timestamps_[slot],
                   values_[columnSlot(BarField::Open)][slot],
                   values_[columnSlot(BarField::High)][slot],
                   values_[columnSlot(BarField::Low)][slot],
                   values_[columnSlot(BarField::Close)][slot],
                   values_[columnSlot(BarField::Volume)][slot],
                   values_[columnSlot(BarField::BuyVolume)][slot]);
    }

    BARVAULT_FORCE_INLINE void beginWrite() {
        sequence_.store(sequence_.load(std::memory_order_relaxed) + 1, std::memory_order_relaxed);
        std::atomic_thread_fence(std::memory_order_release);
    }

    BARVAULT_FORCE_INLINE void endWrite() {
        sequence_.store(sequence_.load(std::memory_order_relaxed) + 1, std::memory_order_release);
    }

    [[noreturn]] BARVAULT_NO_INLINE BARVAULT_COLD_FUNCTION void reject(const std::string& reason) {
        rejected_writes_.fetch_add(1, std::memory_order_relaxed);
        throw InvalidBarException(reason);
    }

    // previous_ts is the timestamp the bar must not precede, if any
    void validate(const Bar& bar, const std::optional<std::int64_t>& previous_ts) {
        if (config_.reject_non_finite && BARVAULT_UNLIKELY(!bar.isFinite())) {
            reject("non-finite field at timestamp " + std::to_string(bar.timestamp));
        }
        if (config_.enforce_monotonic_timestamps && previous_ts &&
            BARVAULT_UNLIKELY(bar.timestamp < *previous_ts)) {
            reject("timestamp " + std::to_string(bar.timestamp) +
                   " precedes previous bar at " + std::to_string(*previous_ts));
        }
        if (config_.validate_ohlc && BARVAULT_UNLIKELY(!bar.isConsistent())) {
            reject("inconsistent OHLC/volume at timestamp " + std::to_string(bar.timestamp));
        }
    }

public:
    explicit ColumnStore(std::int64_t capacity, const Config& config = Config::getDefault())
        : capacity_(validatedCapacity(capacity)), config_(config) {
        timestamps_ = std::make_unique<std::int64_t[]>(capacity_);
        for (auto& column : values_) {
            column = std::make_unique<double[]>(capacity_);
        }
    }

    // Exported views hold raw addresses into this object
    ColumnStore(const ColumnStore&) = delete;
    ColumnStore& operator=(const ColumnStore&) = delete;
    ColumnStore(ColumnStore&&) = delete;
    ColumnStore& operator=(ColumnStore&&) = delete;

    // ------------------------------------------------------------------------
    // Writer interface (single writer)
    // ------------------------------------------------------------------------

    // Validate, write every field at head, then publish head/count
    BARVAULT_HOT_FUNCTION
    void push(const Bar& bar) {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t count = count_.load(std::memory_order_relaxed);

        std::optional<std::int64_t> previous_ts;
        if (count > 0) previous_ts = timestamps_[(head + capacity_ - 1) % capacity_];
        validate(bar, previous_ts);

        beginWrite();
        writeSlot(head, bar);
        head_.store((head + 1) % capacity_, std::memory_order_relaxed);
        if (count < capacity_) {
            count_.store(count + 1, std::memory_order_relaxed);
        } else {
            total_evictions_.fetch_add(1, std::memory_order_relaxed);
        }
        endWrite();

        total_pushes_.fetch_add(1, std::memory_order_relaxed);
    }

    // Overwrites the newest bar in place and returns the bar it replaced
    BARVAULT_HOT_FUNCTION
    Bar amendLast(const Bar& bar) {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t count = count_.load(std::memory_order_relaxed);
        if (BARVAULT_UNLIKELY(count == 0)) {
            rejected_writes_.fetch_add(1, std::memory_order_relaxed);
            throw EmptyBufferAmendException("amend_last called on an empty store");
        }

        const std::size_t last_slot = (head + capacity_ - 1) % capacity_;
        std::optional<std::int64_t> previous_ts;
        if (count > 1) previous_ts = timestamps_[(head + capacity_ - 2) % capacity_];
        validate(bar, previous_ts);

        const Bar replaced = readSlot(last_slot);
        beginWrite();
        writeSlot(last_slot, bar);
        endWrite();

        total_amends_.fetch_add(1, std::memory_order_relaxed);
        return replaced;
    }

    // ------------------------------------------------------------------------
    // Locked readers
    // ------------------------------------------------------------------------

    Bar get(std::int64_t logical_index) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const std::size_t count = count_.load(std::memory_order_relaxed);
        if (BARVAULT_UNLIKELY(logical_index < 0 ||
                              static_cast<std::size_t>(logical_index) >= count)) {
            throw IndexOutOfRangeException(logical_index, count);
        }
        return readSlot(physicalIndex(static_cast<std::size_t>(logical_index),
                                      head_.load(std::memory_order_relaxed), count));
    }

    std::optional<Bar> tryGet(std::int64_t logical_index) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const std::size_t count = count_.load(std::memory_order_relaxed);
        if (logical_index < 0 || static_cast<std::size_t>(logical_index) >= count) {
            return std::nullopt;
        }
        return readSlot(physicalIndex(static_cast<std::size_t>(logical_index),
                                      head_.load(std::memory_order_relaxed), count));
    }

    std::optional<Bar> last() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const std::size_t count = count_.load(std::memory_order_relaxed);
        if (count == 0) return std::nullopt;
        return readSlot((head_.load(std::memory_order_relaxed) + capacity_ - 1) % capacity_);
    }

    double getField(BarField field, std::int64_t logical_index) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const std::size_t count = count_.load(std::memory_order_relaxed);
        if (BARVAULT_UNLIKELY(logical_index < 0 ||
                              static_cast<std::size_t>(logical_index) >= count)) {
            throw IndexOutOfRangeException(logical_index, count);
        }
        const std::size_t slot = physicalIndex(static_cast<std::size_t>(logical_index),
                                               head_.load(std::memory_order_relaxed), count);
        if (field == BarField::Timestamp) return static_cast<double>(timestamps_[slot]);
        return values_[columnSlot(field)][slot];
    }

    std::optional<double> lastField(BarField field) const {
        auto bar = last();
        if (!bar) return std::nullopt;
        return barFieldValue(*bar, field);
    }

    // Chronological split of the close column; every column shares the same physical layout
    SlicePair closeOrderedSlices() const {
        return orderedSlices();
    }

    SlicePair orderedSlices() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return computeSlices(capacity_, head_.load(std::memory_order_relaxed),
                             count_.load(std::memory_order_relaxed));
    }

    // Owned chronological copy of one numeric column
    std::vector<double> copyOrdered(BarField field) const {
        if (field == BarField::Timestamp) {
            throw InvalidArgumentException("use copyTimestamps() for the timestamp column");
        }
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const SlicePair slices = computeSlices(capacity_, head_.load(std::memory_order_relaxed),
                                               count_.load(std::memory_order_relaxed));
        const double* base = values_[columnSlot(field)].get();
        std::vector<double> out;
        out.reserve(slices.total());
        out.insert(out.end(), base + slices.first.offset, base + slices.first.offset + slices.first.length);
        out.insert(out.end(), base + slices.second.offset, base + slices.second.offset + slices.second.length);
        return out;
    }

    std::vector<std::int64_t> copyTimestamps() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const SlicePair slices = computeSlices(capacity_, head_.load(std::memory_order_relaxed),
                                               count_.load(std::memory_order_relaxed));
        const std::int64_t* base = timestamps_.get();
        std::vector<std::int64_t> out;
        out.reserve(slices.total());
        out.insert(out.end(), base + slices.first.offset, base + slices.first.offset + slices.first.length);
        out.insert(out.end(), base + slices.second.offset, base + slices.second.offset + slices.second.length);
        return out;
    }

    StoreMetadata metadata() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        StoreMetadata meta;
        meta.capacity = capacity_;
        meta.head = head_.load(std::memory_order_relaxed);
        meta.count = count_.load(std::memory_order_relaxed);
        meta.generation = sequence_.load(std::memory_order_relaxed) / 2;
        return meta;
    }

    // ------------------------------------------------------------------------
    // Optimistic (lock-free) readers
    // ------------------------------------------------------------------------

    // Runs fn until it completes without an overlapping write; fn must be
    // side-effect free and return a value. This is a sequence lock: fn's plain
    // column reads can race with the writer (formally a data race), and a pass
    // that overlapped a write is discarded and retried, never returned.
    template<typename Fn>
    auto readConsistent(Fn&& fn) const -> decltype(fn()) {
        for (;;) {
            const std::uint64_t before = sequence_.load(std::memory_order_acquire);
            if (BARVAULT_UNLIKELY(before & 1u)) {
                std::this_thread::yield();
                continue;
            }
            auto result = fn();
            std::atomic_thread_fence(std::memory_order_acquire);
            if (BARVAULT_LIKELY(sequence_.load(std::memory_order_relaxed) == before)) {
                return result;
            }
        }
    }

    // Unsynchronized read; call only inside readConsistent(), whose sequence
    // check discards a result torn by a concurrent write
    std::optional<Bar> peek(std::size_t logical_index) const {
        const std::size_t count = count_.load(std::memory_order_relaxed);
        if (logical_index >= count) return std::nullopt;
        return readSlot(physicalIndex(logical_index, head_.load(std::memory_order_relaxed), count));
    }

    std::optional<Bar> optimisticGet(std::size_t logical_index) const {
        return readConsistent([this, logical_index]() { return peek(logical_index); });
    }

    std::uint64_t generation() const {
        return sequence_.load(std::memory_order_acquire) / 2;
    }

    // ------------------------------------------------------------------------
    // Raw column access (borrowed, valid until the store is destroyed)
    // ------------------------------------------------------------------------

    const double* columnData(BarField field) const {
        if (field == BarField::Timestamp) {
            throw InvalidArgumentException("timestamp column is int64; use timestampData()");
        }
        return values_[columnSlot(field)].get();
    }

    const std::int64_t* timestampData() const { return timestamps_.get(); }

    // ------------------------------------------------------------------------
    // Size and statistics
    // ------------------------------------------------------------------------

    std::size_t size() const { return count_.load(std::memory_order_acquire); }
    std::size_t len() const { return size(); }
    std::size_t capacity() const { return capacity_; }
    std::size_t head() const { return head_.load(std::memory_order_acquire); }
    bool empty() const { return size() == 0; }
    bool full() const { return size() == capacity_; }
    const Config& config() const { return config_; }

    StoreStats getStats() const {
        const std::size_t sz = size();
        return {
            total_pushes_.load(std::memory_order_relaxed),
            total_amends_.load(std::memory_order_relaxed),
            total_evictions_.load(std::memory_order_relaxed),
            rejected_writes_.load(std::memory_order_relaxed),
            sz,
            (static_cast<double>(sz) / static_cast<double>(capacity_)) * 100.0
        };
    }

    void resetStats() {
        total_pushes_.store(0, std::memory_order_relaxed);
        total_amends_.store(0, std::memory_order_relaxed);
        total_evictions_.store(0, std::memory_order_relaxed);
        rejected_writes_.store(0, std::memory_order_relaxed);
    }
};

} // namespace barvault
