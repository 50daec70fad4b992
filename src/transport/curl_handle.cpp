/**
 * @file curl_handle.cpp
 * @brief CurlHandle implementation: blocking POST over a reused easy handle.
 * @author Dimitris Kafetzis
 */

#include "transport/curl_handle.hpp"

#include <mutex>

namespace remote_shipper {

namespace {

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

size_t collect_body(char* data, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(data, size * nmemb);
    return size * nmemb;
}

std::once_flag g_curl_init;

}  // anonymous namespace

// ─────────────────────────────────────────────
// CurlHandle
// ─────────────────────────────────────────────

CurlHandle::CurlHandle(CURL* easy, TlsConfig tls)
    : easy_(easy), tls_(std::move(tls)) {}

CurlHandle::~CurlHandle() {
    if (easy_ != nullptr) {
        curl_easy_cleanup(easy_);
        easy_ = nullptr;
    }
}

void CurlHandle::apply_tls() {
    if (!tls_.ca_path.empty()) {
        curl_easy_setopt(easy_, CURLOPT_CAINFO, tls_.ca_path.c_str());
    }
    if (!tls_.cert_path.empty()) {
        curl_easy_setopt(easy_, CURLOPT_SSLCERT, tls_.cert_path.c_str());
        curl_easy_setopt(easy_, CURLOPT_SSLKEY, tls_.key_path.c_str());
    }
    if (tls_.insecure_skip_verify) {
        curl_easy_setopt(easy_, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(easy_, CURLOPT_SSL_VERIFYHOST, 0L);
    }
}

Result<HttpResponse> CurlHandle::post(const HttpRequest& request) {
    // Reset drops per-request options but keeps the connection cache.
    curl_easy_reset(easy_);
    apply_tls();

    curl_slist* list = nullptr;
    for (const auto& header : request.headers) {
        auto line = header.name + ": " + header.value;
        curl_slist* appended = curl_slist_append(list, line.c_str());
        if (appended == nullptr) {
            curl_slist_free_all(list);
            return Error{ErrorKind::Transport, "Failed to build request headers"};
        }
        list = appended;
    }
    // Suppress curl's automatic "Expect: 100-continue" on larger bodies.
    if (curl_slist* appended = curl_slist_append(list, "Expect:"); appended != nullptr) {
        list = appended;
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(list);

    HttpResponse response;

    curl_easy_setopt(easy_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(easy_, CURLOPT_POST, 1L);
    curl_easy_setopt(easy_, CURLOPT_POSTFIELDS, request.body.data());
    curl_easy_setopt(easy_, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(request.body.size()));
    curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, &response.body);

    if (request.auth) {
        curl_easy_setopt(easy_, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
        curl_easy_setopt(easy_, CURLOPT_USERNAME, request.auth->username.c_str());
        curl_easy_setopt(easy_, CURLOPT_PASSWORD, request.auth->password.c_str());
    }

    CURLcode rc = curl_easy_perform(easy_);

    // The header list must outlive the transfer; detach it from the handle now.
    curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, static_cast<curl_slist*>(nullptr));

    if (rc != CURLE_OK) {
        return Error{ErrorKind::Transport,
                     "POST " + request.url + " failed: " + curl_easy_strerror(rc)};
    }

    curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

// ─────────────────────────────────────────────
// CurlHandleFactory
// ─────────────────────────────────────────────

CurlHandleFactory::CurlHandleFactory() {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Result<std::unique_ptr<IHttpHandle>> CurlHandleFactory::create(const TlsConfig& tls) {
    CURL* easy = curl_easy_init();
    if (easy == nullptr) {
        return Error{ErrorKind::Transport, "curl_easy_init() failed"};
    }
    return std::unique_ptr<IHttpHandle>(std::make_unique<CurlHandle>(easy, tls));
}

}  // namespace remote_shipper
