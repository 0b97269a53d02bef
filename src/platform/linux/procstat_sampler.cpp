#include "platform/linux/procstat_sampler.hpp"

#include <fstream>
#include <sstream>
#include <thread>

ProcStatSampler::ProcStatSampler(std::chrono::milliseconds window, std::string stat_path)
    : window_(window), stat_path_(std::move(stat_path)) {}

std::expected<double, std::string> ProcStatSampler::sample() {
    auto before = read_times();
    if (!before) return std::unexpected(before.error());

    std::this_thread::sleep_for(window_);

    auto after = read_times();
    if (!after) return std::unexpected(after.error());

    if (after->total() <= before->total()) {
        return std::unexpected("no CPU time elapsed between samples");
    }
    return utilization(*before, *after);
}

std::expected<CpuTimes, std::string> ProcStatSampler::parse_cpu_line(const std::string& line) {
    std::istringstream in(line);
    std::string label;
    in >> label;
    if (label != "cpu") {
        return std::unexpected("not an aggregate cpu line: " + line);
    }

    CpuTimes t;
    if (!(in >> t.user >> t.nice >> t.system >> t.idle)) {
        return std::unexpected("truncated cpu line: " + line);
    }
    // iowait and later columns are missing on very old kernels
    in >> t.iowait >> t.irq >> t.softirq >> t.steal;
    return t;
}

double ProcStatSampler::utilization(const CpuTimes& before, const CpuTimes& after) {
    auto total = static_cast<double>(after.total() - before.total());
    if (total <= 0.0) return 0.0;
    auto busy = static_cast<double>(after.busy() - before.busy());
    return busy / total * 100.0;
}

std::expected<CpuTimes, std::string> ProcStatSampler::read_times() const {
    std::ifstream f(stat_path_);
    if (!f.is_open()) {
        return std::unexpected("could not open " + stat_path_);
    }
    std::string line;
    if (!std::getline(f, line)) {
        return std::unexpected("empty " + stat_path_);
    }
    return parse_cpu_line(line);
}
