/**
 * @file remote_write_client.hpp
 * @brief Delivery of metric batches to a Prometheus remote-write endpoint.
 * @author Dimitris Kafetzis
 *
 * Pipeline per write() call:
 *   encode → pack → acquire handle → POST → interpret status → maybe refresh
 *
 * Each call either transmits the whole batch or fails; encoding finishes
 * before any network I/O starts. There is no retry loop: a failed batch is
 * handed back to the caller.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "transport/endpoint_pool.hpp"
#include "transport/http_handle.hpp"
#include "transport/resolver.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace remote_shipper {

enum class DeliveryState : uint8_t {
    Idle,          ///< No call made yet
    Sending,       ///< A call is in progress
    Delivered,     ///< Last call succeeded
    Failed         ///< Last call failed
};

[[nodiscard]] constexpr std::string_view to_string(DeliveryState state) noexcept {
    switch (state) {
        case DeliveryState::Idle:      return "idle";
        case DeliveryState::Sending:   return "sending";
        case DeliveryState::Delivered: return "delivered";
        case DeliveryState::Failed:    return "failed";
    }
    return "unknown";
}

/**
 * @brief Remote-write output: owns one EndpointPool and ships batches into it.
 *
 * Single writer per instance. Calls must be made sequentially; for concurrent
 * throughput create one client per writer thread rather than sharing one.
 */
class RemoteWriteClient {
public:
    static constexpr size_t BODY_EXCERPT_LIMIT = 256;

    /// Production wiring: system DNS and libcurl handles.
    RemoteWriteClient(OutputConfig output, PoolConfig pool, Logger& logger);

    /// Injectable wiring for tests and embedding.
    RemoteWriteClient(OutputConfig output,
                      PoolConfig pool,
                      Logger& logger,
                      std::unique_ptr<IHostResolver> resolver,
                      std::unique_ptr<IHandleFactory> factory,
                      EndpointPool::Clock clock,
                      uint64_t seed);

    // Non-copyable
    RemoteWriteClient(const RemoteWriteClient&) = delete;
    RemoteWriteClient& operator=(const RemoteWriteClient&) = delete;

    /**
     * @brief Resolve the endpoint and build the handle pool.
     */
    Result<void> connect();

    /**
     * @brief Encode, pack, and deliver one batch.
     */
    Result<void> write(std::span<const MetricRecord> records);

    /**
     * @brief Deliver an already packed body.
     */
    Result<void> send(const std::string& payload);

    /**
     * @brief Release nothing: handles live until the pool is rebuilt or destroyed.
     */
    void close();

    [[nodiscard]] DeliveryState state() const noexcept { return state_; }
    [[nodiscard]] const EndpointPool& pool() const noexcept { return pool_; }
    [[nodiscard]] uint64_t delivered_batches() const noexcept { return delivered_; }
    [[nodiscard]] uint64_t failed_batches() const noexcept { return failed_; }

    [[nodiscard]] static std::string_view description() noexcept {
        return "Configuration for the Prometheus remote write client to spawn";
    }

private:
    [[nodiscard]] HttpRequest build_request(const std::string& payload) const;
    Result<void> fail(Error error);

    OutputConfig output_;
    Logger& logger_;
    std::unique_ptr<IHostResolver> resolver_;
    std::unique_ptr<IHandleFactory> factory_;
    EndpointPool pool_;

    DeliveryState state_{DeliveryState::Idle};
    uint64_t delivered_{0};
    uint64_t failed_{0};
};

}  // namespace remote_shipper
