/**
 * @file config.hpp
 * @brief Shipper configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "core/result.hpp"

namespace remote_shipper {

/**
 * @brief TLS material used on HTTPS connections to the endpoint.
 *
 * Empty paths mean "not configured". The cert and key must be given together.
 */
struct TlsConfig {
    std::string ca_path;
    std::string cert_path;
    std::string key_path;
    bool insecure_skip_verify = false;

    [[nodiscard]] bool has_client_cert() const noexcept {
        return !cert_path.empty() || !key_path.empty();
    }
};

struct OutputConfig {
    std::string url;                                   ///< Required
    std::string basic_username;
    std::string basic_password;
    TlsConfig tls;
    std::string user_agent = "RemoteShipper/1.0.0";

    [[nodiscard]] bool has_basic_auth() const noexcept {
        return !basic_username.empty() || !basic_password.empty();
    }
};

struct PoolConfig {
    uint32_t handles_per_address = 5;
    uint32_t refresh_base_s = 60;
    uint32_t refresh_jitter_s = 90;                    ///< Upper bound (exclusive)
};

struct AgentConfig {
    uint32_t flush_interval_ms = 10000;
    std::string hostname;                              ///< Empty = gethostname()
};

struct TelemetryConfig {
    std::filesystem::path log_dir;                     ///< Empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level shipper configuration.
 */
struct Config {
    OutputConfig output;
    PoolConfig pool;
    AgentConfig agent;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * A non-empty @p url_override replaces output.url. When the file does not
 * exist and an override is given, the defaults are used with that URL; a
 * file that exists but is invalid is always an error.
 *
 * Fails with ErrorKind::Configuration when the file is missing (and no
 * override is given), does not parse, holds an out-of-range value, or
 * leaves output.url empty.
 */
Result<Config> load_config(const std::filesystem::path& path,
                           std::string_view url_override = {});

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace remote_shipper
