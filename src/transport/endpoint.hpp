/**
 * @file endpoint.hpp
 * @brief Remote-write endpoint URL parsing.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <string>

namespace remote_shipper {

/**
 * @brief A parsed endpoint URL.
 *
 * `host` is bare (IPv6 literals have their brackets removed) so it can be
 * handed straight to the resolver.
 */
struct Endpoint {
    std::string url;
    std::string scheme;
    std::string host;
    uint16_t port{0};

    [[nodiscard]] bool is_tls() const noexcept { return scheme == "https"; }
};

/**
 * @brief Parse and validate an http(s) endpoint URL.
 *
 * Fails with ErrorKind::Configuration on a malformed URL, a scheme other than
 * http/https, or an empty host.
 */
Result<Endpoint> parse_endpoint(const std::string& url);

}  // namespace remote_shipper
