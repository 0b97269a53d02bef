#include "scoring/confidence.hpp"

#include <algorithm>
#include <cmath>

namespace confidence {

double aggregate(std::span<const Segment> segments) {
    double numerator = 0.0;
    double denominator = 0.0;

    for (const auto& seg : segments) {
        if (!seg.avg_log_probability || std::isnan(*seg.avg_log_probability)) continue;

        double duration = std::max(kMinDuration, seg.end - seg.start);
        double seg_confidence = std::clamp(std::exp(*seg.avg_log_probability), 0.0, 1.0);

        numerator += seg_confidence * duration;
        denominator += duration;
    }

    if (denominator == 0.0) return kUnknown;
    return std::clamp(numerator / denominator, 0.0, 1.0);
}

double round_confidence(double value) {
    return std::round(value * 10000.0) / 10000.0;
}

int to_percent(double value) {
    return static_cast<int>(std::clamp(std::lround(value * 100.0), 0L, 100L));
}

} // namespace confidence
