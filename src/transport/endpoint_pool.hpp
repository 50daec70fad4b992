/**
 * @file endpoint_pool.hpp
 * @brief DNS-sized pool of transport handles with jittered refresh.
 * @author Dimitris Kafetzis
 *
 * The pool holds handles_per_address handles for every address the endpoint
 * host resolves to and hands them out round-robin. It is rebuilt wholesale
 * from a fresh lookup once its refresh deadline has passed; the deadline is
 * jittered so that many shippers pointed at the same endpoint do not refresh
 * in lockstep.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "transport/endpoint.hpp"
#include "transport/http_handle.hpp"
#include "transport/resolver.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace remote_shipper {

/**
 * @brief The mutable part of the pool, replaced as a whole on every resolve.
 */
struct PoolState {
    std::vector<std::unique_ptr<IHttpHandle>> handles;
    size_t cursor{0};
    Timestamp refresh_deadline{};
    size_t address_count{0};
};

/**
 * @brief Endpoint resolver and handle pool manager.
 *
 * Not internally synchronized: the cursor and deadline are mutated by
 * acquire() and maybe_refresh() without locks. Use one pool per writer, or
 * serialize access externally.
 */
class EndpointPool {
public:
    using Clock = std::function<Timestamp()>;

    EndpointPool(std::string url,
                 TlsConfig tls,
                 PoolConfig settings,
                 IHostResolver& resolver,
                 IHandleFactory& factory,
                 Clock clock = [] { return std::chrono::system_clock::now(); },
                 uint64_t seed = std::random_device{}());

    // Non-copyable
    EndpointPool(const EndpointPool&) = delete;
    EndpointPool& operator=(const EndpointPool&) = delete;

    /**
     * @brief Resolve the endpoint and replace the pool with a fresh one.
     *
     * On failure the current pool (if any) is left untouched.
     */
    Result<void> resolve();

    /**
     * @brief Advance the cursor and return the handle it now points at.
     * @pre The pool has been resolved successfully at least once.
     */
    IHttpHandle& acquire();

    /**
     * @brief Rebuild the pool if the refresh deadline has passed.
     */
    Result<void> maybe_refresh();

    // ── State queries ────────────────────────
    [[nodiscard]] bool is_ready() const noexcept { return !state_.handles.empty(); }
    [[nodiscard]] size_t size() const noexcept { return state_.handles.size(); }
    [[nodiscard]] size_t cursor() const noexcept { return state_.cursor; }
    [[nodiscard]] size_t address_count() const noexcept { return state_.address_count; }
    [[nodiscard]] Timestamp refresh_deadline() const noexcept { return state_.refresh_deadline; }
    [[nodiscard]] uint64_t resolution_count() const noexcept { return resolution_count_; }
    [[nodiscard]] const std::string& url() const noexcept { return url_; }

private:
    Result<PoolState> build_state();
    Timestamp next_deadline();

    std::string url_;
    TlsConfig tls_;
    PoolConfig settings_;
    IHostResolver& resolver_;
    IHandleFactory& factory_;
    Clock clock_;
    std::mt19937_64 rng_;

    PoolState state_;
    uint64_t resolution_count_{0};
};

}  // namespace remote_shipper
