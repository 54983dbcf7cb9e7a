// c_api.cpp
// C ABI over BarSeries
// Every entry point converts exceptions into a bv_status plus a thread-local message

#include "barvault/ffi/barvault_c.h"

#include <exception>
#include <memory>
#include <new>
#include <string>

#include "barvault/core/bar_types.hpp"
#include "barvault/core/exceptions.hpp"
#include "barvault/engine/bar_series.hpp"
#include "barvault/export/zero_copy_exporter.hpp"

// Opaque handle behind bv_series*
struct bv_series {
    explicit bv_series(std::int64_t capacity) : series(capacity), exporter(series.store()) {}

    barvault::BarSeries series;
    barvault::ZeroCopyExporter exporter;
};

namespace {

using namespace barvault;

thread_local std::string g_last_error;

bv_status toStatus(ErrorCode code) {
    return static_cast<bv_status>(static_cast<std::int32_t>(code));
}

bv_status fail(bv_status status, const std::string& message) {
    g_last_error = message;
    return status;
}

// Runs fn and maps whatever it throws onto a status
template<typename Fn>
bv_status guarded(Fn&& fn) noexcept {
    try {
        fn();
        return BV_OK;
    } catch (const BarVaultException& e) {
        return fail(toStatus(e.code()), e.what());
    } catch (const std::bad_alloc&) {
        return fail(BV_INTERNAL, "out of memory");
    } catch (const std::exception& e) {
        return fail(BV_INTERNAL, e.what());
    } catch (...) {
        return fail(BV_INTERNAL, "unrecognized C++ exception");
    }
}

template<typename T>
void requireNonNull(const T* ptr, const char* what) {
    if (ptr == nullptr) {
        throw InvalidArgumentException(std::string(what) + " must not be NULL");
    }
}

Bar fromC(const bv_bar& b) {
    return Bar(b.timestamp, b.open, b.high, b.low, b.close, b.volume, b.buy_volume);
}

bv_bar toC(const Bar& b) {
    bv_bar out;
    out.timestamp = b.timestamp;
    out.open = b.open;
    out.high = b.high;
    out.low = b.low;
    out.close = b.close;
    out.volume = b.volume;
    out.buy_volume = b.buy_volume;
    return out;
}

bv_indicator_value toC(const IndicatorValue& v) {
    bv_indicator_value out;
    out.value = v.value;
    out.available = v.available ? 1 : 0;
    return out;
}

bv_slice toC(const SliceDescriptor& d) {
    bv_slice out;
    out.ptr = d.data;
    out.offset = d.offset;
    out.length = d.length;
    out.stride = d.stride;
    return out;
}

} // namespace

// ============================================================================
// Series lifecycle
// ============================================================================

extern "C" bv_status bv_series_new(int64_t capacity, bv_series** out) {
    return guarded([&] {
        requireNonNull(out, "out");
        *out = nullptr;
        auto handle = std::make_unique<bv_series>(capacity);
        *out = handle.release();
    });
}

extern "C" void bv_series_free(bv_series* series) {
    delete series;
}

extern "C" bv_status bv_series_add_indicator(bv_series* series, const char* id,
                                             const char* spec_text) {
    return guarded([&] {
        requireNonNull(series, "series");
        requireNonNull(id, "id");
        requireNonNull(spec_text, "spec_text");
        series->series.addIndicator(id, std::string(spec_text));
    });
}

// ============================================================================
// Writer
// ============================================================================

extern "C" bv_status bv_series_push_bar(bv_series* series, bv_bar bar) {
    return guarded([&] {
        requireNonNull(series, "series");
        series->series.push(fromC(bar));
    });
}

extern "C" bv_status bv_series_amend_last_bar(bv_series* series, bv_bar bar) {
    return guarded([&] {
        requireNonNull(series, "series");
        series->series.amendLast(fromC(bar));
    });
}

// ============================================================================
// Readers
// ============================================================================

extern "C" bv_status bv_series_get_bar(const bv_series* series, int64_t index, bv_bar* out) {
    return guarded([&] {
        requireNonNull(series, "series");
        requireNonNull(out, "out");
        *out = toC(series->series.get(index));
    });
}

extern "C" bv_status bv_series_metadata(const bv_series* series, bv_metadata* out) {
    return guarded([&] {
        requireNonNull(series, "series");
        requireNonNull(out, "out");
        const StoreMetadata meta = series->series.metadata();
        out->capacity = meta.capacity;
        out->head = meta.head;
        out->count = meta.count;
        out->generation = meta.generation;
    });
}

extern "C" bv_status bv_series_export_columns(const bv_series* series,
                                              bv_column_export out[BV_FIELD_COUNT]) {
    return guarded([&] {
        requireNonNull(series, "series");
        requireNonNull(out, "out");
        const SeriesView view = series->exporter.exportAll();
        for (BarField field : kAllBarFields) {
            const ColumnView& column = view.column(field);
            bv_column_export& dst = out[static_cast<std::size_t>(field)];
            dst.field = static_cast<bv_field>(static_cast<int>(field));
            dst.type = column.type == ElementType::Int64 ? BV_INT64 : BV_FLOAT64;
            dst.base = column.base;
            dst.slices[0] = toC(column.slices[0]);
            dst.slices[1] = toC(column.slices[1]);
            dst.generation = column.metadata.generation;
        }
    });
}

extern "C" bv_status bv_series_indicator_value(const bv_series* series, const char* id,
                                               size_t index, size_t output,
                                               bv_indicator_value* out) {
    return guarded([&] {
        requireNonNull(series, "series");
        requireNonNull(id, "id");
        requireNonNull(out, "out");
        *out = toC(series->series.getValue(id, index, output));
    });
}

extern "C" bv_status bv_series_indicator_last(const bv_series* series, const char* id,
                                              size_t output, bv_indicator_value* out) {
    return guarded([&] {
        requireNonNull(series, "series");
        requireNonNull(id, "id");
        requireNonNull(out, "out");
        *out = toC(series->series.lastValue(id, output));
    });
}

// ============================================================================
// Diagnostics
// ============================================================================

extern "C" const char* bv_status_message(bv_status status) {
    switch (status) {
        case BV_OK:                     return "ok";
        case BV_CAPACITY_INVALID:       return "capacity must be greater than zero";
        case BV_EMPTY_BUFFER_AMEND:     return "amend on an empty series";
        case BV_INDEX_OUT_OF_RANGE:     return "logical index out of range";
        case BV_UNKNOWN_INDICATOR_ID:   return "unknown indicator id";
        case BV_INVALID_BAR:            return "bar rejected by validation";
        case BV_INVALID_ARGUMENT:       return "invalid argument";
        case BV_DUPLICATE_INDICATOR_ID: return "indicator id already registered";
        case BV_DATA_ERROR:             return "data error";
        case BV_INTERNAL:               return "internal error";
    }
    return "unknown status";
}

extern "C" const char* bv_last_error_message(void) {
    return g_last_error.c_str();
}
