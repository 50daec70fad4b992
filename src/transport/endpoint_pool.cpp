/**
 * @file endpoint_pool.cpp
 * @brief EndpointPool implementation.
 * @author Dimitris Kafetzis
 */

#include "transport/endpoint_pool.hpp"

#include "transport/tls.hpp"

#include <stdexcept>
#include <utility>

namespace remote_shipper {

EndpointPool::EndpointPool(std::string url,
                           TlsConfig tls,
                           PoolConfig settings,
                           IHostResolver& resolver,
                           IHandleFactory& factory,
                           Clock clock,
                           uint64_t seed)
    : url_(std::move(url))
    , tls_(std::move(tls))
    , settings_(settings)
    , resolver_(resolver)
    , factory_(factory)
    , clock_(std::move(clock))
    , rng_(seed) {}

// ─────────────────────────────────────────────
// Resolution
// ─────────────────────────────────────────────

Result<void> EndpointPool::resolve() {
    auto fresh = build_state();
    if (!fresh) return fresh.error();

    // Previous handles are released here; their connections close with them.
    state_ = std::move(*fresh);
    return Result<void>{};
}

Result<PoolState> EndpointPool::build_state() {
    if (auto tls_ok = validate_tls(tls_); !tls_ok) {
        return tls_ok.error();
    }

    auto endpoint = parse_endpoint(url_);
    if (!endpoint) return endpoint.error();

    ++resolution_count_;
    auto addresses = resolver_.lookup(endpoint->host);
    if (!addresses) return addresses.error();
    if (addresses->empty()) {
        return Error{ErrorKind::Resolution, "No addresses found for " + endpoint->host};
    }

    PoolState state;
    state.address_count = addresses->size();
    const size_t pool_size = state.address_count * settings_.handles_per_address;
    state.handles.reserve(pool_size);
    for (size_t i = 0; i < pool_size; ++i) {
        auto handle = factory_.create(tls_);
        if (!handle) return handle.error();
        state.handles.push_back(std::move(*handle));
    }

    state.cursor = 0;
    state.refresh_deadline = next_deadline();
    return state;
}

Timestamp EndpointPool::next_deadline() {
    std::chrono::seconds jitter{0};
    if (settings_.refresh_jitter_s > 0) {
        std::uniform_int_distribution<uint32_t> dist(0, settings_.refresh_jitter_s - 1);
        jitter = std::chrono::seconds{dist(rng_)};
    }
    return clock_() + std::chrono::seconds{settings_.refresh_base_s} + jitter;
}

// ─────────────────────────────────────────────
// Rotation / Refresh
// ─────────────────────────────────────────────

IHttpHandle& EndpointPool::acquire() {
    if (state_.handles.empty()) {
        throw std::logic_error("EndpointPool::acquire() on an unresolved pool");
    }
    state_.cursor = (state_.cursor + 1) % state_.handles.size();
    return *state_.handles[state_.cursor];
}

Result<void> EndpointPool::maybe_refresh() {
    if (clock_() <= state_.refresh_deadline) {
        return Result<void>{};
    }
    return resolve();
}

}  // namespace remote_shipper
