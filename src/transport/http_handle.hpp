/**
 * @file http_handle.hpp
 * @brief Transport handle abstraction used by the endpoint pool.
 * @author Dimitris Kafetzis
 *
 * A handle is a reusable HTTP client object. Connection reuse (keep-alive,
 * idle eviction) is the handle implementation's business; the pool only
 * chooses which handle a request goes to.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace remote_shipper {

struct HttpHeader {
    std::string name;
    std::string value;
};

struct BasicAuth {
    std::string username;
    std::string password;
};

struct HttpRequest {
    std::string url;
    std::vector<HttpHeader> headers;
    std::string body;
    std::optional<BasicAuth> auth;
};

struct HttpResponse {
    long status{0};
    std::string body;

    [[nodiscard]] bool is_success() const noexcept { return status / 100 == 2; }
};

/**
 * @brief One interchangeable transport handle.
 */
class IHttpHandle {
public:
    virtual ~IHttpHandle() = default;

    /**
     * @brief Issue a blocking POST.
     * @return The response (any status), or ErrorKind::Transport when no
     *         response was received.
     */
    virtual Result<HttpResponse> post(const HttpRequest& request) = 0;
};

/**
 * @brief Builds handles configured with the endpoint's TLS material.
 */
class IHandleFactory {
public:
    virtual ~IHandleFactory() = default;

    virtual Result<std::unique_ptr<IHttpHandle>> create(const TlsConfig& tls) = 0;
};

}  // namespace remote_shipper
