/**
 * @file curl_handle.hpp
 * @brief libcurl easy-handle implementation of IHttpHandle.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "transport/http_handle.hpp"

#include <curl/curl.h>

#include <memory>

namespace remote_shipper {

/**
 * @brief Wraps one CURL easy handle.
 *
 * The easy handle keeps its own connection cache, so consecutive posts on
 * the same handle reuse the connection when the server allows it.
 * Not thread-safe; a handle must not be used by two threads at once.
 */
class CurlHandle : public IHttpHandle {
public:
    CurlHandle(CURL* easy, TlsConfig tls);
    ~CurlHandle() override;

    // Non-copyable
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    Result<HttpResponse> post(const HttpRequest& request) override;

private:
    void apply_tls();

    CURL* easy_;
    TlsConfig tls_;
};

/**
 * @brief Creates CurlHandle instances; performs curl_global_init() once.
 */
class CurlHandleFactory : public IHandleFactory {
public:
    CurlHandleFactory();

    Result<std::unique_ptr<IHttpHandle>> create(const TlsConfig& tls) override;
};

}  // namespace remote_shipper
