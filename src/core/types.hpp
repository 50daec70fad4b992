/**
 * @file types.hpp
 * @brief Fundamental types used throughout RemoteShipper.
 * @author Dimitris Kafetzis
 *
 * Defines the metric record handed in by the pipeline, the Prometheus
 * time-series vocabulary produced by the encoder, and shared time aliases.
 * All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace remote_shipper {

// ─────────────────────────────────────────────
// Time Aliases
// ─────────────────────────────────────────────

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;

// ─────────────────────────────────────────────
// Metric Kind
// ─────────────────────────────────────────────

enum class MetricKind : uint8_t {
    Untyped,
    Counter,
    Gauge,
    Histogram,     ///< Not shipped
    Summary        ///< Not shipped
};

[[nodiscard]] constexpr std::string_view to_string(MetricKind kind) noexcept {
    switch (kind) {
        case MetricKind::Untyped:   return "untyped";
        case MetricKind::Counter:   return "counter";
        case MetricKind::Gauge:     return "gauge";
        case MetricKind::Histogram: return "histogram";
        case MetricKind::Summary:   return "summary";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Field Values
// ─────────────────────────────────────────────

/**
 * @brief Tagged union of the value kinds a metric field may carry.
 *
 * Integers and floats are numeric and become samples; booleans and text
 * are carried through the pipeline but never shipped.
 */
using FieldValue = std::variant<int64_t, uint64_t, double, bool, std::string>;

[[nodiscard]] inline bool is_numeric(const FieldValue& value) noexcept {
    return std::holds_alternative<int64_t>(value)
        || std::holds_alternative<uint64_t>(value)
        || std::holds_alternative<double>(value);
}

/**
 * @brief Coerce a field value to a sample value.
 * @return The value as a double, or nullopt for non-numeric kinds.
 */
[[nodiscard]] inline std::optional<double> to_sample_value(const FieldValue& value) noexcept {
    return std::visit([](const auto& v) -> std::optional<double> {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, int64_t> || std::is_same_v<V, uint64_t>) {
            return static_cast<double>(v);
        } else if constexpr (std::is_same_v<V, double>) {
            return v;
        } else {
            return std::nullopt;
        }
    }, value);
}

// ─────────────────────────────────────────────
// Metric Record (pipeline input)
// ─────────────────────────────────────────────

struct Tag {
    std::string key;
    std::string value;
};

struct Field {
    std::string key;
    FieldValue value;
};

/**
 * @brief One measurement as handed over by the metric pipeline.
 *
 * Tags and fields keep the order the producer gave them; that order
 * determines the order of the emitted series.
 */
struct MetricRecord {
    std::string name;
    std::vector<Tag> tags;
    std::vector<Field> fields;
    Timestamp time{};
    MetricKind kind{MetricKind::Untyped};
};

// ─────────────────────────────────────────────
// Time Series (remote-write vocabulary)
// ─────────────────────────────────────────────

struct Label {
    std::string name;
    std::string value;

    bool operator==(const Label&) const = default;
};

struct Sample {
    int64_t timestamp_ms{0};       ///< Milliseconds since the Unix epoch
    double value{0.0};

    bool operator==(const Sample&) const = default;
};

/**
 * @brief A series identity (its labels) plus its samples.
 *
 * Series built by the encoder always carry exactly one sample.
 */
struct TimeSeries {
    std::vector<Label> labels;
    std::vector<Sample> samples;

    bool operator==(const TimeSeries&) const = default;
};

struct WriteRequest {
    std::vector<TimeSeries> timeseries;

    [[nodiscard]] bool empty() const noexcept { return timeseries.empty(); }
    [[nodiscard]] size_t size() const noexcept { return timeseries.size(); }

    bool operator==(const WriteRequest&) const = default;
};

/// Name of the label that carries the series name.
inline constexpr std::string_view METRIC_NAME_LABEL = "__name__";

}  // namespace remote_shipper
