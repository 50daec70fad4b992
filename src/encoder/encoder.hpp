/**
 * @file encoder.hpp
 * @brief Conversion of metric records into remote-write time series.
 * @author Dimitris Kafetzis
 *
 * One series is produced per numeric field of each record. Histogram and
 * Summary records and non-numeric fields are dropped without error.
 */

#pragma once

#include "core/types.hpp"

#include <span>
#include <string>
#include <string_view>

namespace remote_shipper {

/**
 * @brief Rewrite a tag key into the label-name grammar [a-zA-Z_][a-zA-Z0-9_]*.
 *
 * Every offending character (one per UTF-8 code point) becomes '_'; so does
 * a leading digit. An empty key becomes "_".
 */
[[nodiscard]] std::string sanitize_label_name(std::string_view key);

/**
 * @brief Series name for a field: metric name with '.' and '-' turned into
 *        '_', then '_' and the field key.
 */
[[nodiscard]] std::string series_name(std::string_view metric_name, std::string_view field_key);

/**
 * @brief Truncate a record timestamp to milliseconds since the epoch.
 */
[[nodiscard]] int64_t to_millis(Timestamp time) noexcept;

/**
 * @brief Encode a batch of records.
 *
 * Series appear in record-then-field order. Labels of each series are
 * sorted by name; duplicate names (e.g. a tag sanitized into "__name__")
 * are kept as is.
 */
[[nodiscard]] WriteRequest encode(std::span<const MetricRecord> records);

}  // namespace remote_shipper
