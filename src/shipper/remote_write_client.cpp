/**
 * @file remote_write_client.cpp
 * @brief RemoteWriteClient implementation.
 * @author Dimitris Kafetzis
 */

#include "shipper/remote_write_client.hpp"

#include "encoder/encoder.hpp"
#include "transport/curl_handle.hpp"
#include "wire/packager.hpp"

#include <random>
#include <utility>

namespace remote_shipper {

RemoteWriteClient::RemoteWriteClient(OutputConfig output, PoolConfig pool, Logger& logger)
    : RemoteWriteClient(std::move(output), pool, logger,
                        std::make_unique<SystemResolver>(),
                        std::make_unique<CurlHandleFactory>(),
                        [] { return std::chrono::system_clock::now(); },
                        std::random_device{}()) {}

RemoteWriteClient::RemoteWriteClient(OutputConfig output,
                                     PoolConfig pool,
                                     Logger& logger,
                                     std::unique_ptr<IHostResolver> resolver,
                                     std::unique_ptr<IHandleFactory> factory,
                                     EndpointPool::Clock clock,
                                     uint64_t seed)
    : output_(std::move(output))
    , logger_(logger)
    , resolver_(std::move(resolver))
    , factory_(std::move(factory))
    , pool_(output_.url, output_.tls, pool, *resolver_, *factory_, std::move(clock), seed) {}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> RemoteWriteClient::connect() {
    auto result = pool_.resolve();
    if (!result) {
        logger_.error("Connect to " + output_.url + " failed: " + result.error().message);
        return result;
    }
    logger_.info("Connected to " + output_.url + ": "
                 + std::to_string(pool_.address_count()) + " address(es), "
                 + std::to_string(pool_.size()) + " handles");
    return result;
}

void RemoteWriteClient::close() {
    logger_.debug("Remote write output closed");
}

// ─────────────────────────────────────────────
// Delivery
// ─────────────────────────────────────────────

Result<void> RemoteWriteClient::write(std::span<const MetricRecord> records) {
    auto request = encode(records);
    auto payload = pack(request);
    if (!payload) {
        state_ = DeliveryState::Sending;
        return fail(payload.error());
    }
    logger_.debug("Encoded " + std::to_string(records.size()) + " records into "
                  + std::to_string(request.size()) + " series ("
                  + std::to_string(payload->size()) + " bytes compressed)");
    return send(*payload);
}

Result<void> RemoteWriteClient::send(const std::string& payload) {
    state_ = DeliveryState::Sending;

    if (!pool_.is_ready()) {
        return fail(Error{ErrorKind::Configuration,
                          "Remote write output is not connected"});
    }

    IHttpHandle& handle = pool_.acquire();
    auto response = handle.post(build_request(payload));
    if (!response) {
        logger_.warn(response.error().message);
        return fail(response.error());
    }

    if (!response->is_success()) {
        auto excerpt = response->body.substr(0, BODY_EXCERPT_LIMIT);
        logger_.warn("Remote write rejected with HTTP " + std::to_string(response->status)
                     + ": " + excerpt);
        return fail(Error::remote_rejected(response->status, std::move(excerpt)));
    }

    ++delivered_;
    state_ = DeliveryState::Delivered;

    const auto resolutions = pool_.resolution_count();
    if (auto refreshed = pool_.maybe_refresh(); !refreshed) {
        // The batch itself arrived; only the rebuild failed.
        logger_.warn("Pool refresh for " + output_.url + " failed: "
                     + refreshed.error().message);
        state_ = DeliveryState::Failed;
        return refreshed;
    }
    if (pool_.resolution_count() != resolutions) {
        logger_.info("Pool for " + output_.url + " rebuilt: "
                     + std::to_string(pool_.address_count()) + " address(es), "
                     + std::to_string(pool_.size()) + " handles");
    }
    return Result<void>{};
}

HttpRequest RemoteWriteClient::build_request(const std::string& payload) const {
    HttpRequest request;
    request.url = output_.url;
    request.body = payload;
    request.headers = {
        {"Content-Encoding", std::string(CONTENT_ENCODING)},
        {"Content-Type", std::string(CONTENT_TYPE)},
        {std::string(REMOTE_WRITE_VERSION_HEADER), std::string(REMOTE_WRITE_VERSION)},
        {"User-Agent", output_.user_agent},
    };
    if (output_.has_basic_auth()) {
        request.auth = BasicAuth{output_.basic_username, output_.basic_password};
    }
    return request;
}

Result<void> RemoteWriteClient::fail(Error error) {
    ++failed_;
    state_ = DeliveryState::Failed;
    return error;
}

}  // namespace remote_shipper
