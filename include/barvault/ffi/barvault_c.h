/* barvault_c.h
 * C ABI for the barvault Time-Series Core
 * Opaque series handle, status-code returns and zero-copy column descriptors
 */

#ifndef BARVAULT_C_H
#define BARVAULT_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#if defined(_WIN32)
  #define BARVAULT_C_API __declspec(dllexport)
#elif defined(__GNUC__) || defined(__clang__)
  #define BARVAULT_C_API __attribute__((visibility("default")))
#else
  #define BARVAULT_C_API
#endif

/* ===== Status codes (values match barvault::ErrorCode) ===== */

typedef enum bv_status {
  BV_OK = 0,
  BV_CAPACITY_INVALID = 1,
  BV_EMPTY_BUFFER_AMEND = 2,
  BV_INDEX_OUT_OF_RANGE = 3,
  BV_UNKNOWN_INDICATOR_ID = 4,
  BV_INVALID_BAR = 5,
  BV_INVALID_ARGUMENT = 6,
  BV_DUPLICATE_INDICATOR_ID = 7,
  BV_DATA_ERROR = 8,
  BV_INTERNAL = 99
} bv_status;

/* ===== Basic types ===== */

typedef struct bv_series bv_series;

typedef struct bv_bar {
  int64_t timestamp;
  double open;
  double high;
  double low;
  double close;
  double volume;
  double buy_volume;
} bv_bar;

typedef struct bv_indicator_value {
  double value;      /* NaN when not available */
  uint8_t available;
} bv_indicator_value;

typedef struct bv_metadata {
  size_t capacity;
  size_t head;
  size_t count;
  uint64_t generation;
} bv_metadata;

/* Column order of bv_series_export_columns */
typedef enum bv_field {
  BV_FIELD_TIMESTAMP = 0,
  BV_FIELD_OPEN = 1,
  BV_FIELD_HIGH = 2,
  BV_FIELD_LOW = 3,
  BV_FIELD_CLOSE = 4,
  BV_FIELD_VOLUME = 5,
  BV_FIELD_BUY_VOLUME = 6,
  BV_FIELD_COUNT = 7
} bv_field;

typedef enum bv_element_type {
  BV_INT64 = 0,
  BV_FLOAT64 = 1
} bv_element_type;

/* length elements at ptr, stride bytes apart; ptr is NULL when length is 0 */
typedef struct bv_slice {
  const void* ptr;
  size_t offset;   /* elements from the column base */
  size_t length;
  size_t stride;   /* bytes */
} bv_slice;

/* Borrowed view; valid until the next push/amend or bv_series_free */
typedef struct bv_column_export {
  bv_field field;
  bv_element_type type;
  const void* base;
  bv_slice slices[2];  /* chronological: slices[0] then slices[1] */
  uint64_t generation;
} bv_column_export;

/* ===== Series lifecycle ===== */

BARVAULT_C_API bv_status bv_series_new(int64_t capacity, bv_series** out);
BARVAULT_C_API void bv_series_free(bv_series* series);

/* spec_text: "sma:close:20", "ema:close:12", "stddev:close:20", "boll:20:2",
 * "rsi:14", "macd:12:26:9", "atr:14", "vri:20" */
BARVAULT_C_API bv_status bv_series_add_indicator(bv_series* series, const char* id,
                                                 const char* spec_text);

/* ===== Writer ===== */

BARVAULT_C_API bv_status bv_series_push_bar(bv_series* series, bv_bar bar);
BARVAULT_C_API bv_status bv_series_amend_last_bar(bv_series* series, bv_bar bar);

/* ===== Readers ===== */

BARVAULT_C_API bv_status bv_series_get_bar(const bv_series* series, int64_t index, bv_bar* out);
BARVAULT_C_API bv_status bv_series_metadata(const bv_series* series, bv_metadata* out);

/* out must hold BV_FIELD_COUNT entries, indexed by bv_field */
BARVAULT_C_API bv_status bv_series_export_columns(const bv_series* series,
                                                  bv_column_export out[BV_FIELD_COUNT]);

BARVAULT_C_API bv_status bv_series_indicator_value(const bv_series* series, const char* id,
                                                   size_t index, size_t output,
                                                   bv_indicator_value* out);

/* Reading aligned with the newest bar */
BARVAULT_C_API bv_status bv_series_indicator_last(const bv_series* series, const char* id,
                                                  size_t output, bv_indicator_value* out);

/* ===== Diagnostics ===== */

BARVAULT_C_API const char* bv_status_message(bv_status status);

/* Message of the most recent failure on the calling thread; "" if none */
BARVAULT_C_API const char* bv_last_error_message(void);

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* BARVAULT_C_H */
