// ring_column.hpp
// Fixed-Capacity Ring Column
// Single-column overwrite-oldest ring used for indicator inputs and outputs

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "../core/branch_hints.hpp"
#include "../core/exceptions.hpp"

namespace barvault {

// ============================================================================
// Ring Column (single writer, no internal synchronization)
// ============================================================================

template<typename T>
class RingColumn {
private:
    std::vector<T> data_;
    std::size_t capacity_ = 0;
    std::size_t head_ = 0;   // next physical write position
    std::size_t count_ = 0;

    BARVAULT_FORCE_INLINE std::size_t physical(std::size_t logical) const {
        return (head_ + capacity_ - count_ + logical) % capacity_;
    }

public:
    RingColumn() = default;

    explicit RingColumn(std::size_t capacity) { resize(capacity); }

    // Drops all contents
    void resize(std::size_t capacity) {
        if (capacity == 0) {
            throw CapacityInvalidException("ring column capacity must be > 0");
        }
        data_.assign(capacity, T{});
        capacity_ = capacity;
        head_ = 0;
        count_ = 0;
    }

    // Overwrites the oldest element once full
    BARVAULT_FORCE_INLINE void push(const T& value) {
        data_[head_] = value;
        head_ = (head_ + 1) % capacity_;
        if (count_ < capacity_) ++count_;
    }

    void updateLast(const T& value) {
        if (BARVAULT_UNLIKELY(count_ == 0)) {
            throw EmptyBufferAmendException("ring column is empty");
        }
        data_[(head_ + capacity_ - 1) % capacity_] = value;
    }

    // 0 = oldest retained
    const T& get(std::size_t logical) const {
        if (BARVAULT_UNLIKELY(logical >= count_)) {
            throw IndexOutOfRangeException(static_cast<std::int64_t>(logical), count_);
        }
        return data_[physical(logical)];
    }

    // 0 = newest
    const T& fromEnd(std::size_t back) const {
        if (BARVAULT_UNLIKELY(back >= count_)) {
            throw IndexOutOfRangeException(-1 - static_cast<std::int64_t>(back), count_);
        }
        return data_[physical(count_ - 1 - back)];
    }

    const T& last() const { return fromEnd(0); }

    void clear() {
        head_ = 0;
        count_ = 0;
    }

    std::size_t size() const { return count_; }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return count_ == 0; }
    bool full() const { return capacity_ != 0 && count_ == capacity_; }
};

} // namespace barvault
