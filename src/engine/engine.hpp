#pragma once

#include "scoring/confidence.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

struct EngineOptions {
    std::string language = "en";
    std::string device = "cpu";     // already resolved: "cpu" or "gpu"
    int threads = 4;
    uint32_t pcm_sample_rate = 48000;
};

struct EngineTranscript {
    std::string text;
    std::vector<Segment> segments;
    double duration_s = 0.0;
    double processing_s = 0.0;
};

class TranscriptionModel {
public:
    virtual ~TranscriptionModel() = default;
    virtual std::expected<EngineTranscript, std::string>
        transcribe(const std::string& audio_path) = 0;
};

class TranscriptionEngine {
public:
    virtual ~TranscriptionEngine() = default;
    // model_path is non-empty when the model is a specific local artifact.
    virtual std::expected<std::unique_ptr<TranscriptionModel>, std::string>
        load(const std::string& model_id, const std::string& model_path,
             const EngineOptions& options) = 0;
};

namespace engine {

inline std::string trim(std::string text) {
    auto start_pos = text.find_first_not_of(" \t\n\r");
    if (start_pos == std::string::npos) return {};
    auto end_pos = text.find_last_not_of(" \t\n\r");
    return text.substr(start_pos, end_pos - start_pos + 1);
}

} // namespace engine
