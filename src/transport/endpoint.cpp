/**
 * @file endpoint.cpp
 * @brief Endpoint parsing on top of the libcurl URL API.
 * @author Dimitris Kafetzis
 */

#include "transport/endpoint.hpp"

#include <curl/curl.h>

#include <memory>

namespace remote_shipper {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* handle) const noexcept { curl_url_cleanup(handle); }
};

struct CurlStringDeleter {
    void operator()(char* str) const noexcept { curl_free(str); }
};

using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;
using CurlString = std::unique_ptr<char, CurlStringDeleter>;

Result<std::string> get_part(CURLU* handle, CURLUPart part, unsigned int flags = 0) {
    char* raw = nullptr;
    CURLUcode rc = curl_url_get(handle, part, &raw, flags);
    CurlString owned(raw);
    if (rc != CURLUE_OK || !owned) {
        return Error{ErrorKind::Configuration,
                     std::string{"URL component missing: "} + curl_url_strerror(rc)};
    }
    return std::string{owned.get()};
}

}  // anonymous namespace

Result<Endpoint> parse_endpoint(const std::string& url) {
    if (url.empty()) {
        return Error{ErrorKind::Configuration, "Endpoint URL is empty"};
    }

    CurlUrlPtr handle(curl_url());
    if (!handle) {
        return Error{ErrorKind::Configuration, "Failed to allocate URL parser"};
    }

    CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0);
    if (rc != CURLUE_OK) {
        return Error{ErrorKind::Configuration,
                     "Malformed URL '" + url + "': " + curl_url_strerror(rc)};
    }

    Endpoint endpoint;
    endpoint.url = url;

    auto scheme = get_part(handle.get(), CURLUPART_SCHEME);
    if (!scheme) return scheme.error();
    endpoint.scheme = *scheme;
    if (endpoint.scheme != "http" && endpoint.scheme != "https") {
        return Error{ErrorKind::Configuration,
                     "Unsupported URL scheme '" + endpoint.scheme + "' in " + url};
    }

    auto host = get_part(handle.get(), CURLUPART_HOST);
    if (!host || host->empty()) {
        return Error{ErrorKind::Configuration, "URL has no host: " + url};
    }
    endpoint.host = *host;
    if (endpoint.host.size() > 2 && endpoint.host.front() == '['
        && endpoint.host.back() == ']') {
        endpoint.host = endpoint.host.substr(1, endpoint.host.size() - 2);
    }

    auto port = get_part(handle.get(), CURLUPART_PORT, CURLU_DEFAULT_PORT);
    if (!port) return port.error();
    try {
        endpoint.port = static_cast<uint16_t>(std::stoul(*port));
    } catch (const std::exception&) {
        return Error{ErrorKind::Configuration, "Invalid port '" + *port + "' in " + url};
    }

    return endpoint;
}

}  // namespace remote_shipper
