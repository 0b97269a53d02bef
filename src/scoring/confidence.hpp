#pragma once

#include <optional>
#include <span>

struct Segment {
    double start = 0.0;
    double end = 0.0;
    std::optional<double> avg_log_probability;
};

namespace confidence {

constexpr double kMinDuration = 1e-3;
constexpr double kUnknown = 0.5;

// Duration-weighted mean of exp(avg_log_probability) over the segments that
// carry one. Returns kUnknown when no segment contributes.
double aggregate(std::span<const Segment> segments);

// Four decimal digits, half away from zero.
double round_confidence(double value);

// Nearest integer of value * 100, half away from zero, clamped to [0, 100].
int to_percent(double value);

} // namespace confidence
