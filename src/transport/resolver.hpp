/**
 * @file resolver.hpp
 * @brief Host name resolution for the endpoint pool.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"

#include <string>
#include <vector>

namespace remote_shipper {

/**
 * @brief Resolves a host name to its addresses.
 *
 * Virtual so the pool can be driven by a scripted resolver in tests.
 */
class IHostResolver {
public:
    virtual ~IHostResolver() = default;

    /**
     * @brief Look up all addresses of @p host.
     * @return Distinct numeric addresses (never empty on success), or
     *         ErrorKind::Resolution.
     */
    virtual Result<std::vector<std::string>> lookup(const std::string& host) = 0;
};

/**
 * @brief Resolver backed by the system's getaddrinfo().
 */
class SystemResolver : public IHostResolver {
public:
    Result<std::vector<std::string>> lookup(const std::string& host) override;
};

}  // namespace remote_shipper
