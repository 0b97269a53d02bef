#pragma once

#include "platform/load_sampler.hpp"

#include <optional>
#include <string>

enum class ModelVariant { Local, Fast, Accurate };

struct ModelPolicy {
    std::optional<std::string> local_path;
    std::string local_id;           // empty: file stem of local_path
    std::string fast_id = "tiny";
    std::string accurate_id = "base";
    double load_threshold = 60.0;   // strictly above this picks fast_id
};

struct ModelChoice {
    ModelVariant variant = ModelVariant::Fast;
    std::string id;
    std::string path;               // set only for ModelVariant::Local
    std::optional<double> load;     // absent when not sampled or sampling failed
    std::string reason;
};

// Chooses the model for a single run. A cached local artifact wins outright;
// otherwise the load sample decides, and an unusable sample falls back to the
// fast variant. Holds no state between calls.
ModelChoice select_model(const ModelPolicy& policy, LoadSampler& sampler);

const char* variant_name(ModelVariant variant);
