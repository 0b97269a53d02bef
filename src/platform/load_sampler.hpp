#pragma once

#include <expected>
#include <string>

// Point-in-time processor utilization, normalized to [0, 100].
class LoadSampler {
public:
    virtual ~LoadSampler() = default;
    virtual std::expected<double, std::string> sample() = 0;
};
