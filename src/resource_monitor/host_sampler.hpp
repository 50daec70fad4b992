/**
 * @file host_sampler.hpp
 * @brief Host metric sampling from Linux pseudo-filesystems.
 * @author Dimitris Kafetzis
 *
 * Produces the metric records the daemon ships each flush interval.
 *
 * Data sources (relative to the proc root):
 *   stat    : aggregate CPU time counters        → "cpu"    (counter)
 *   meminfo : memory total and available          → "mem"    (gauge)
 *   loadavg : 1/5/15 minute load averages         → "system" (gauge)
 *   uptime  : seconds since boot                  → "system" (gauge)
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace remote_shipper {

class HostSampler {
public:
    explicit HostSampler(std::string hostname,
                         std::filesystem::path proc_root = "/proc");

    /**
     * @brief Read all sources once.
     *
     * Fails with ErrorKind::Configuration if no source could be read at all;
     * individually missing sources are skipped.
     */
    Result<std::vector<MetricRecord>> sample() const;

    [[nodiscard]] const std::string& hostname() const noexcept { return hostname_; }

private:
    std::string hostname_;
    std::filesystem::path proc_root_;
};

/**
 * @brief Local host name from gethostname(), or "localhost" if unavailable.
 */
[[nodiscard]] std::string local_hostname();

}  // namespace remote_shipper
