/**
 * @file encoder.cpp
 * @brief Record → TimeSeries encoding.
 * @author Dimitris Kafetzis
 */

#include "encoder/encoder.hpp"

#include <algorithm>

namespace remote_shipper {

namespace {

constexpr bool is_name_start(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

constexpr bool is_name_char(char c) noexcept {
    return is_name_start(c) || (c >= '0' && c <= '9');
}

/// UTF-8 continuation bytes (10xxxxxx) belong to the preceding code point.
constexpr bool is_continuation(char c) noexcept {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/// Number of continuation bytes announced by a UTF-8 lead byte.
constexpr int continuation_count(char c) noexcept {
    auto byte = static_cast<unsigned char>(c);
    if ((byte & 0xE0) == 0xC0) return 1;
    if ((byte & 0xF0) == 0xE0) return 2;
    if ((byte & 0xF8) == 0xF0) return 3;
    return 0;
}

bool should_ship(MetricKind kind) noexcept {
    return kind != MetricKind::Histogram && kind != MetricKind::Summary;
}

}  // anonymous namespace

std::string sanitize_label_name(std::string_view key) {
    if (key.empty()) return "_";

    std::string name;
    name.reserve(key.size());
    int pending = 0;
    for (char c : key) {
        // A stray continuation byte counts as a code point of its own.
        if (pending > 0 && is_continuation(c)) {
            --pending;
            continue;
        }
        pending = continuation_count(c);
        bool valid = name.empty() ? is_name_start(c) : is_name_char(c);
        name.push_back(valid ? c : '_');
    }
    return name;
}

std::string series_name(std::string_view metric_name, std::string_view field_key) {
    std::string name(metric_name);
    std::replace(name.begin(), name.end(), '.', '_');
    std::replace(name.begin(), name.end(), '-', '_');
    name.push_back('_');
    name.append(field_key);
    return name;
}

int64_t to_millis(Timestamp time) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count();
}

WriteRequest encode(std::span<const MetricRecord> records) {
    WriteRequest request;

    for (const auto& record : records) {
        if (!should_ship(record.kind)) continue;

        std::vector<Label> common;
        common.reserve(record.tags.size());
        for (const auto& tag : record.tags) {
            common.push_back(Label{sanitize_label_name(tag.key), tag.value});
        }

        const int64_t timestamp_ms = to_millis(record.time);

        for (const auto& field : record.fields) {
            auto value = to_sample_value(field.value);
            if (!value) continue;

            TimeSeries series;
            series.labels = common;
            series.labels.push_back(Label{std::string(METRIC_NAME_LABEL),
                                          series_name(record.name, field.key)});
            std::stable_sort(series.labels.begin(), series.labels.end(),
                             [](const Label& a, const Label& b) { return a.name < b.name; });

            series.samples.push_back(Sample{timestamp_ms, *value});
            request.timeseries.push_back(std::move(series));
        }
    }

    return request;
}

}  // namespace remote_shipper
