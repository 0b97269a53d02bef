#pragma once

#include "platform/load_sampler.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>

struct CpuTimes {
    uint64_t user = 0, nice = 0, system = 0, idle = 0;
    uint64_t iowait = 0, irq = 0, softirq = 0, steal = 0;

    uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
    uint64_t busy() const { return user + nice + system + irq + softirq + steal; }
};

// Samples aggregate CPU utilization from two /proc/stat reads taken `window`
// apart. sample() blocks for the whole window.
class ProcStatSampler : public LoadSampler {
public:
    explicit ProcStatSampler(std::chrono::milliseconds window,
                             std::string stat_path = "/proc/stat");

    std::expected<double, std::string> sample() override;

    // Parses the aggregate "cpu " line of /proc/stat.
    static std::expected<CpuTimes, std::string> parse_cpu_line(const std::string& line);
    static double utilization(const CpuTimes& before, const CpuTimes& after);

private:
    std::expected<CpuTimes, std::string> read_times() const;

    std::chrono::milliseconds window_;
    std::string stat_path_;
};
