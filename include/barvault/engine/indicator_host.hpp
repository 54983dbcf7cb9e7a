// indicator_host.hpp
// Indicator Host
// Named indicator registry that fans each bar event out in registration order

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "../core/bar_types.hpp"
#include "../core/exceptions.hpp"
#include "../interfaces/indicator.hpp"

namespace barvault {

// ============================================================================
// Indicator Host (no internal synchronization; see BarSeries)
// ============================================================================

class IndicatorHost {
private:
    struct Entry {
        std::string id;
        std::unique_ptr<IIndicator> indicator;
    };

    std::size_t history_length_;
    std::vector<Entry> entries_;                          // registration order
    std::unordered_map<std::string, std::size_t> index_;  // id -> position in entries_

    std::atomic<std::uint64_t> push_events_{0};
    std::atomic<std::uint64_t> amend_events_{0};

    const Entry& find(const std::string& id) const {
        auto it = index_.find(id);
        if (it == index_.end()) {
            throw UnknownIndicatorIdException(id);
        }
        return entries_[it->second];
    }

public:
    // history_length is the store capacity so logical indices line up
    explicit IndicatorHost(std::size_t history_length) : history_length_(history_length) {
        if (history_length_ == 0) {
            throw CapacityInvalidException("indicator history length must be > 0");
        }
    }

    IndicatorHost(const IndicatorHost&) = delete;
    IndicatorHost& operator=(const IndicatorHost&) = delete;

    // Takes ownership; the indicator's output history is sized to the store capacity
    IIndicator& registerIndicator(const std::string& id, std::unique_ptr<IIndicator> indicator) {
        if (id.empty()) {
            throw InvalidArgumentException("indicator id must not be empty");
        }
        if (!indicator) {
            throw InvalidArgumentException("indicator '" + id + "' is null");
        }
        if (index_.count(id) != 0) {
            throw DuplicateIndicatorIdException(id);
        }

        indicator->setMaxHistoryLength(history_length_);
        entries_.push_back(Entry{id, std::move(indicator)});
        try {
            index_.emplace(id, entries_.size() - 1);
        } catch (...) {
            entries_.pop_back();
            throw;
        }
        return *entries_.back().indicator;
    }

    void onPush(const Bar& bar) {
        for (auto& entry : entries_) {
            entry.indicator->add(bar);
        }
        push_events_.fetch_add(1, std::memory_order_relaxed);
    }

    void onAmend(const Bar& bar) {
        for (auto& entry : entries_) {
            entry.indicator->updateLast(bar);
        }
        amend_events_.fetch_add(1, std::memory_order_relaxed);
    }

    IndicatorValue getValue(const std::string& id, std::size_t logical_index,
                            std::size_t output = 0) const {
        return find(id).indicator->getValue(logical_index, output);
    }

    const IIndicator& indicator(const std::string& id) const {
        return *find(id).indicator;
    }

    bool contains(const std::string& id) const { return index_.count(id) != 0; }

    std::vector<std::string> ids() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& entry : entries_) out.push_back(entry.id);
        return out;
    }

    std::size_t size() const { return entries_.size(); }
    std::size_t historyLength() const { return history_length_; }

    // Clears every indicator's state and outputs; registrations are kept
    void reset() {
        for (auto& entry : entries_) {
            entry.indicator->reset();
        }
    }

    std::uint64_t pushEvents() const { return push_events_.load(std::memory_order_relaxed); }
    std::uint64_t amendEvents() const { return amend_events_.load(std::memory_order_relaxed); }
};

} // namespace barvault
