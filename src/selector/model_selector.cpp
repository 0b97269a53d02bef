#include "selector/model_selector.hpp"

#include <cmath>
#include <filesystem>
#include <format>

namespace fs = std::filesystem;

namespace {

bool artifact_present(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::string local_identifier(const ModelPolicy& policy) {
    if (!policy.local_id.empty()) return policy.local_id;
    return fs::path(*policy.local_path).stem().string();
}

} // namespace

ModelChoice select_model(const ModelPolicy& policy, LoadSampler& sampler) {
    if (policy.local_path && !policy.local_path->empty() && artifact_present(*policy.local_path)) {
        return ModelChoice{
            .variant = ModelVariant::Local,
            .id = local_identifier(policy),
            .path = *policy.local_path,
            .load = std::nullopt,
            .reason = "cached model at " + *policy.local_path,
        };
    }

    auto sample = sampler.sample();
    if (!sample) {
        return ModelChoice{
            .variant = ModelVariant::Fast,
            .id = policy.fast_id,
            .path = {},
            .load = std::nullopt,
            .reason = "load sampling failed (" + sample.error() + "), using fast model",
        };
    }

    double load = *sample;
    if (!std::isfinite(load) || load < 0.0 || load > 100.0) {
        return ModelChoice{
            .variant = ModelVariant::Fast,
            .id = policy.fast_id,
            .path = {},
            .load = std::nullopt,
            .reason = std::format("load sample {} out of range, using fast model", load),
        };
    }

    if (load > policy.load_threshold) {
        return ModelChoice{
            .variant = ModelVariant::Fast,
            .id = policy.fast_id,
            .path = {},
            .load = load,
            .reason = std::format("load {:.1f}% above {:.0f}%", load, policy.load_threshold),
        };
    }

    return ModelChoice{
        .variant = ModelVariant::Accurate,
        .id = policy.accurate_id,
        .path = {},
        .load = load,
        .reason = std::format("load {:.1f}% at or below {:.0f}%", load, policy.load_threshold),
    };
}

const char* variant_name(ModelVariant variant) {
    switch (variant) {
        case ModelVariant::Local: return "local";
        case ModelVariant::Fast: return "fast";
        case ModelVariant::Accurate: return "accurate";
    }
    return "unknown";
}
