#pragma once

#include "engine.hpp"

#include <string>

// Runs whisper.cpp in-process. Models resolve to <model_dir>/ggml-<id>.bin
// unless an explicit model path is given.
class LocalEngine : public TranscriptionEngine {
public:
    explicit LocalEngine(std::string model_dir);

    std::expected<std::unique_ptr<TranscriptionModel>, std::string>
        load(const std::string& model_id, const std::string& model_path,
             const EngineOptions& options) override;

private:
    std::string model_dir_;
};
