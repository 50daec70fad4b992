/**
 * @file host_sampler.cpp
 * @brief HostSampler: /proc parsing into metric records.
 * @author Dimitris Kafetzis
 */

#include "resource_monitor/host_sampler.hpp"

#include <unistd.h>

#include <array>
#include <chrono>
#include <climits>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>

namespace remote_shipper {

namespace {

std::string read_file_line(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::string line;
    if (ifs.is_open()) {
        std::getline(ifs, line);
    }
    return line;
}

std::vector<std::string> read_file_lines(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

/**
 * @brief Parse the aggregate "cpu" line of stat.
 * Format: "cpu user nice system idle iowait irq softirq steal ..."
 */
std::optional<MetricRecord> read_cpu(const std::filesystem::path& root) {
    auto line = read_file_line(root / "stat");
    if (!line.starts_with("cpu ")) return std::nullopt;

    static constexpr std::array<const char*, 8> NAMES = {
        "user", "nice", "system", "idle", "iowait", "irq", "softirq", "steal"};

    std::istringstream iss(line);
    std::string label;
    iss >> label;

    MetricRecord record;
    record.name = "cpu";
    record.kind = MetricKind::Counter;
    for (const char* name : NAMES) {
        uint64_t ticks = 0;
        if (!(iss >> ticks)) break;
        record.fields.push_back(Field{name, ticks});
    }
    if (record.fields.empty()) return std::nullopt;
    record.tags.push_back(Tag{"cpu", "cpu-total"});
    return record;
}

std::optional<MetricRecord> read_memory(const std::filesystem::path& root) {
    uint64_t total_kb = 0;
    uint64_t available_kb = 0;
    bool found = false;
    for (const auto& line : read_file_lines(root / "meminfo")) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream iss(line.substr(9));
            if (iss >> total_kb) found = true;
        } else if (line.starts_with("MemAvailable:")) {
            std::istringstream iss(line.substr(13));
            iss >> available_kb;
        }
    }
    if (!found || total_kb == 0) return std::nullopt;

    MetricRecord record;
    record.name = "mem";
    record.kind = MetricKind::Gauge;
    record.fields.push_back(Field{"total", total_kb * 1024});
    record.fields.push_back(Field{"available", available_kb * 1024});
    record.fields.push_back(Field{"used_percent",
        100.0 * static_cast<double>(total_kb - available_kb) / static_cast<double>(total_kb)});
    return record;
}

std::optional<MetricRecord> read_system(const std::filesystem::path& root) {
    MetricRecord record;
    record.name = "system";
    record.kind = MetricKind::Gauge;

    std::istringstream load(read_file_line(root / "loadavg"));
    double load1 = 0.0, load5 = 0.0, load15 = 0.0;
    if (load >> load1 >> load5 >> load15) {
        record.fields.push_back(Field{"load1", load1});
        record.fields.push_back(Field{"load5", load5});
        record.fields.push_back(Field{"load15", load15});
    }

    std::istringstream up(read_file_line(root / "uptime"));
    double uptime_s = 0.0;
    if (up >> uptime_s) {
        record.fields.push_back(Field{"uptime", static_cast<uint64_t>(uptime_s)});
    }

    if (record.fields.empty()) return std::nullopt;
    return record;
}

}  // anonymous namespace

HostSampler::HostSampler(std::string hostname, std::filesystem::path proc_root)
    : hostname_(std::move(hostname)), proc_root_(std::move(proc_root)) {}

Result<std::vector<MetricRecord>> HostSampler::sample() const {
    const auto now = std::chrono::system_clock::now();

    std::vector<MetricRecord> records;
    for (auto record : {read_cpu(proc_root_), read_memory(proc_root_), read_system(proc_root_)}) {
        if (!record) continue;
        record->time = now;
        record->tags.push_back(Tag{"host", hostname_});
        records.push_back(std::move(*record));
    }

    if (records.empty()) {
        return Error{ErrorKind::Configuration,
                     "No host metrics readable under " + proc_root_.string()};
    }
    return records;
}

std::string local_hostname() {
    std::array<char, HOST_NAME_MAX + 1> buf{};
    if (::gethostname(buf.data(), buf.size()) != 0 || buf[0] == '\0') {
        return "localhost";
    }
    buf.back() = '\0';
    return buf.data();
}

}  // namespace remote_shipper
