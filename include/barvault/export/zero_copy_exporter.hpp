// zero_copy_exporter.hpp
// Zero-Copy Column Export
// Describes the retained history as (pointer, offset, length, stride) slices into the
// store's own column arrays; nothing is copied and nothing is pinned

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include "../core/bar_types.hpp"
#include "../core/exceptions.hpp"
#include "../storage/column_store.hpp"

namespace barvault {

// ============================================================================
// View Types
// ============================================================================

enum class ElementType : std::uint8_t {
    Int64 = 0,
    Float64 = 1
};

// length elements starting at data; data == base + offset * stride bytes
struct SliceDescriptor {
    const void* data = nullptr;
    std::size_t offset = 0;   // elements from the column base
    std::size_t length = 0;
    std::size_t stride = 0;   // bytes between consecutive elements
};

struct ColumnView {
    BarField field = BarField::Close;
    ElementType type = ElementType::Float64;
    const void* base = nullptr;
    std::array<SliceDescriptor, 2> slices{};  // chronological; slices[1] empty unless wrapped
    StoreMetadata metadata;

    std::size_t length() const { return slices[0].length + slices[1].length; }

    // Chronological element i, read through the descriptors
    double valueAt(std::size_t i) const {
        if (i >= length()) {
            throw IndexOutOfRangeException(static_cast<std::int64_t>(i), length());
        }
        const SliceDescriptor& s = i < slices[0].length ? slices[0] : slices[1];
        const std::size_t k = i < slices[0].length ? i : i - slices[0].length;
        const auto* bytes = static_cast<const unsigned char*>(s.data) + k * s.stride;
        if (type == ElementType::Int64) {
            return static_cast<double>(*reinterpret_cast<const std::int64_t*>(bytes));
        }
        return *reinterpret_cast<const double*>(bytes);
    }
};

struct SeriesView {
    StoreMetadata metadata;
    std::array<ColumnView, kBarFieldCount> columns{};  // indexed by BarField

    const ColumnView& column(BarField field) const {
        return columns[static_cast<std::size_t>(field)];
    }
};

// ============================================================================
// Exporter
// ============================================================================

class ZeroCopyExporter {
private:
    const ColumnStore& store_;

    static SliceDescriptor describe(const void* base, std::size_t element_size,
                                    const SliceRange& range) {
        SliceDescriptor d;
        d.offset = range.offset;
        d.length = range.length;
        d.stride = element_size;
        if (!range.empty()) {
            d.data = static_cast<const unsigned char*>(base) + range.offset * element_size;
        }
        return d;
    }

    ColumnView buildColumn(BarField field, const StoreMetadata& meta) const {
        ColumnView view;
        view.field = field;
        view.metadata = meta;

        std::size_t element_size = sizeof(double);
        if (field == BarField::Timestamp) {
            view.type = ElementType::Int64;
            view.base = store_.timestampData();
            element_size = sizeof(std::int64_t);
        } else {
            view.type = ElementType::Float64;
            view.base = store_.columnData(field);
        }

        const SlicePair pair = ColumnStore::computeSlices(meta.capacity, meta.head, meta.count);
        view.slices[0] = describe(view.base, element_size, pair.first);
        view.slices[1] = describe(view.base, element_size, pair.second);
        return view;
    }

public:
    explicit ZeroCopyExporter(const ColumnStore& store) : store_(store) {}

    ColumnView exportColumn(BarField field) const {
        return buildColumn(field, store_.metadata());
    }

    // All seven columns described against one metadata snapshot
    SeriesView exportAll() const {
        SeriesView view;
        view.metadata = store_.metadata();
        for (BarField field : kAllBarFields) {
            view.columns[static_cast<std::size_t>(field)] = buildColumn(field, view.metadata);
        }
        return view;
    }

    // False once any push or amend completed after the view was taken
    bool isCurrent(const ColumnView& view) const {
        return store_.generation() == view.metadata.generation;
    }

    bool isCurrent(const SeriesView& view) const {
        return store_.generation() == view.metadata.generation;
    }
};

} // namespace barvault
