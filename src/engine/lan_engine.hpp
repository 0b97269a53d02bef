#pragma once

#include "engine.hpp"

#include <string>

// Transcribes through a whisper.cpp server or an OpenAI-compatible endpoint.
class LanEngine : public TranscriptionEngine {
public:
    // api_format: "whisper.cpp" or "openai"
    // model_dir: server-side directory holding ggml-<id>.bin. With the
    // whisper.cpp format every load() posts /load, so an empty model_dir
    // fails unless an explicit model path is given.
    LanEngine(std::string url, std::string api_format = "whisper.cpp",
              std::string model_dir = {});
    ~LanEngine() override;

    LanEngine(const LanEngine&) = delete;
    LanEngine& operator=(const LanEngine&) = delete;

    std::expected<std::unique_ptr<TranscriptionModel>, std::string>
        load(const std::string& model_id, const std::string& model_path,
             const EngineOptions& options) override;

    // Parses a verbose_json transcription response.
    static std::expected<EngineTranscript, std::string> parse_response(const std::string& body);

private:
    std::string url_;
    std::string api_format_;
    std::string model_dir_;
};
