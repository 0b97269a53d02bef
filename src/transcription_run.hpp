#pragma once

#include "config.hpp"
#include "engine/engine.hpp"
#include "platform/decoder_probe.hpp"
#include "platform/load_sampler.hpp"
#include "run_error.hpp"
#include "selector/model_selector.hpp"
#include "storage/run_history.hpp"

#include <expected>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

struct TranscriptionResult {
    std::string text;
    std::string model;
    double confidence = confidence::kUnknown;
    int confidence_percent = 50;
};

using RunOutcome = std::expected<TranscriptionResult, RunError>;

// One input file, one outcome. Collaborators are borrowed and must outlive
// the run; history may be null.
class TranscriptionRun {
public:
    TranscriptionRun(const Config& config, bool verbose,
                     LoadSampler& sampler, DecoderProbe& decoder,
                     TranscriptionEngine& engine, RunHistory* history = nullptr);

    TranscriptionRun(const TranscriptionRun&) = delete;
    TranscriptionRun& operator=(const TranscriptionRun&) = delete;

    RunOutcome execute(const std::string& audio_path);

    // The single result line: {text, model, confidence, confidence_percent} or {error}.
    static nlohmann::json to_json(const RunOutcome& outcome);

private:
    RunOutcome run_pipeline(const std::string& audio_path);
    ModelPolicy model_policy() const;
    EngineOptions engine_options() const;
    void record(const std::string& audio_path, const RunOutcome& outcome, double processing_s);

    void log(const std::string& msg);

    const Config& config_;
    bool verbose_;

    LoadSampler& sampler_;
    DecoderProbe& decoder_;
    TranscriptionEngine& engine_;
    RunHistory* history_;

    ModelChoice choice_;
};

// Builds the engine named by config.type ("lan" or "local").
std::expected<std::unique_ptr<TranscriptionEngine>, std::string>
make_engine(const Config::Engine& config);

// InputError when the path is missing, not a regular file or unreadable.
std::expected<void, RunError> validate_input(const std::string& audio_path);

// Validates the input before building the engine from config, so a missing
// file is reported as such even when the engine cannot be built.
RunOutcome run_once(const Config& config, bool verbose, const std::string& audio_path,
                    LoadSampler& sampler, DecoderProbe& decoder, RunHistory* history = nullptr);
