/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <string_view>

namespace remote_shipper {

namespace {

/**
 * @brief Read an integer setting and check it against [min, max] before
 *        narrowing, so negative values cannot wrap around.
 */
Result<uint32_t> read_bounded(toml::node_view<toml::node> table,
                              std::string_view section,
                              std::string_view key,
                              int64_t fallback,
                              int64_t min,
                              int64_t max) {
    int64_t value = table[key].value_or(fallback);
    if (value < min || value > max) {
        return Error{ErrorKind::Configuration,
                     std::string(section) + "." + std::string(key) + " must be in ["
                     + std::to_string(min) + ", " + std::to_string(max) + "], got "
                     + std::to_string(value)};
    }
    return static_cast<uint32_t>(value);
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path, std::string_view url_override) {
    if (!std::filesystem::exists(path)) {
        if (url_override.empty()) {
            return Error{ErrorKind::Configuration,
                         "Configuration file not found: " + path.string()};
        }
        Config config;
        config.output.url = std::string(url_override);
        return config;
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [output]
        if (auto output = tbl["output"]; output.is_table()) {
            config.output.url = output["url"].value_or(std::string{});
            config.output.basic_username = output["basic_username"].value_or(std::string{});
            config.output.basic_password = output["basic_password"].value_or(std::string{});
            config.output.tls.ca_path = output["tls_ca"].value_or(std::string{});
            config.output.tls.cert_path = output["tls_cert"].value_or(std::string{});
            config.output.tls.key_path = output["tls_key"].value_or(std::string{});
            config.output.tls.insecure_skip_verify =
                output["insecure_skip_verify"].value_or(false);
            config.output.user_agent =
                output["user_agent"].value_or(std::string{"RemoteShipper/1.0.0"});
        }

        // [pool]
        if (auto pool = tbl["pool"]; pool.is_table()) {
            auto handles = read_bounded(pool, "pool", "handles_per_address", 5, 1, 1024);
            if (!handles) return handles.error();
            config.pool.handles_per_address = *handles;

            auto base = read_bounded(pool, "pool", "refresh_base_s", 60, 0, 86400);
            if (!base) return base.error();
            config.pool.refresh_base_s = *base;

            auto jitter = read_bounded(pool, "pool", "refresh_jitter_s", 90, 0, 86400);
            if (!jitter) return jitter.error();
            config.pool.refresh_jitter_s = *jitter;
        }

        // [agent]
        if (auto agent = tbl["agent"]; agent.is_table()) {
            auto interval = read_bounded(agent, "agent", "flush_interval_ms",
                                         10000, 1, 86'400'000);
            if (!interval) return interval.error();
            config.agent.flush_interval_ms = *interval;
            config.agent.hostname = agent["hostname"].value_or(std::string{});
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});

            auto max_size = read_bounded(telemetry, "telemetry", "max_file_size_mb",
                                         50, 1, 1'048'576);
            if (!max_size) return max_size.error();
            config.telemetry.max_file_size_mb = *max_size;

            auto rotate = read_bounded(telemetry, "telemetry", "rotate_count", 5, 0, 1000);
            if (!rotate) return rotate.error();
            config.telemetry.rotate_count = *rotate;

            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        if (!url_override.empty()) {
            config.output.url = std::string(url_override);
        }
        if (config.output.url.empty()) {
            return Error{ErrorKind::Configuration, "output.url is required"};
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Configuration,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    Config config;
    config.output.url = "http://localhost/push";
    return config;
}

}  // namespace remote_shipper
