/**
 * @file resolver.cpp
 * @brief SystemResolver: getaddrinfo() based lookup.
 * @author Dimitris Kafetzis
 */

#include "transport/resolver.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <memory>

namespace remote_shipper {

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const noexcept { ::freeaddrinfo(info); }
};

std::string to_numeric(const addrinfo* ai) {
    char buf[INET6_ADDRSTRLEN] = {};
    if (ai->ai_family == AF_INET) {
        const auto* sin = reinterpret_cast<const sockaddr_in*>(ai->ai_addr);
        ::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
    } else if (ai->ai_family == AF_INET6) {
        const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(ai->ai_addr);
        ::inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
    }
    return buf;
}

}  // anonymous namespace

Result<std::vector<std::string>> SystemResolver::lookup(const std::string& host) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &raw);
    std::unique_ptr<addrinfo, AddrInfoDeleter> results(raw);
    if (rc != 0) {
        return Error{ErrorKind::Resolution,
                     "Lookup of " + host + " failed: " + ::gai_strerror(rc)};
    }

    // getaddrinfo() repeats an address once per socket type; keep first-seen order.
    std::vector<std::string> addresses;
    for (const addrinfo* ai = results.get(); ai != nullptr; ai = ai->ai_next) {
        auto address = to_numeric(ai);
        if (address.empty()) continue;
        if (std::find(addresses.begin(), addresses.end(), address) == addresses.end()) {
            addresses.push_back(std::move(address));
        }
    }

    if (addresses.empty()) {
        return Error{ErrorKind::Resolution, "No addresses found for " + host};
    }
    return addresses;
}

}  // namespace remote_shipper
