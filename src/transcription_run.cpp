#include "transcription_run.hpp"

#include "engine/lan_engine.hpp"
#include "platform/compute_device.hpp"

#ifdef VOXSCORE_HAS_WHISPER
#include "engine/local_engine.hpp"
#endif

#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>

namespace fs = std::filesystem;

TranscriptionRun::TranscriptionRun(const Config& config, bool verbose,
                                   LoadSampler& sampler, DecoderProbe& decoder,
                                   TranscriptionEngine& engine, RunHistory* history)
    : config_(config), verbose_(verbose),
      sampler_(sampler), decoder_(decoder), engine_(engine), history_(history) {}

RunOutcome TranscriptionRun::execute(const std::string& audio_path) {
    choice_ = {};

    auto start = std::chrono::steady_clock::now();
    auto outcome = run_pipeline(audio_path);
    auto end = std::chrono::steady_clock::now();

    if (!outcome) {
        log(std::format("{} error: {}", error_kind_name(outcome.error().kind),
                        outcome.error().message));
    }
    record(audio_path, outcome, std::chrono::duration<double>(end - start).count());
    return outcome;
}

RunOutcome TranscriptionRun::run_pipeline(const std::string& audio_path) {
    if (auto valid = validate_input(audio_path); !valid) {
        return std::unexpected(valid.error());
    }

    if (auto healthy = decoder_.check(); !healthy) {
        return std::unexpected(RunError{ErrorKind::Dependency, healthy.error()});
    }

    choice_ = select_model(model_policy(), sampler_);
    log(std::format("Model {} ({}): {}", choice_.id, variant_name(choice_.variant), choice_.reason));

    auto options = engine_options();
    log(std::format("Engine {} on {}, language {}", config_.engine.type, options.device,
                    options.language.empty() ? "auto" : options.language));

    try {
        auto model = engine_.load(choice_.id, choice_.path, options);
        if (!model) {
            return std::unexpected(RunError{ErrorKind::Engine, model.error()});
        }

        auto transcript = (*model)->transcribe(audio_path);
        if (!transcript) {
            return std::unexpected(RunError{ErrorKind::Engine, transcript.error()});
        }

        double raw = confidence::aggregate(transcript->segments);
        double rounded = confidence::round_confidence(raw);

        log(std::format("Transcribed {:.1f}s audio in {:.1f}s, {} segments, confidence {:.4f}",
                        transcript->duration_s, transcript->processing_s,
                        transcript->segments.size(), raw));

        return TranscriptionResult{
            .text = std::move(transcript->text),
            .model = choice_.id,
            .confidence = rounded,
            .confidence_percent = confidence::to_percent(rounded),
        };
    } catch (const std::exception& e) {
        return std::unexpected(RunError{ErrorKind::Engine, std::string("engine failure: ") + e.what()});
    }
}

std::expected<void, RunError> validate_input(const std::string& audio_path) {
    std::error_code ec;
    if (audio_path.empty() || !fs::exists(audio_path, ec)) {
        return std::unexpected(RunError{ErrorKind::Input, "audio file not found: " + audio_path});
    }
    if (!fs::is_regular_file(audio_path, ec)) {
        return std::unexpected(RunError{ErrorKind::Input, "not a regular file: " + audio_path});
    }
    std::ifstream probe(audio_path, std::ios::binary);
    if (!probe.is_open()) {
        return std::unexpected(RunError{ErrorKind::Input, "audio file not readable: " + audio_path});
    }
    return {};
}

ModelPolicy TranscriptionRun::model_policy() const {
    ModelPolicy policy;
    if (!config_.models.local_path.empty()) policy.local_path = config_.models.local_path;
    policy.local_id = config_.models.local_id;
    policy.fast_id = config_.models.fast;
    policy.accurate_id = config_.models.accurate;
    policy.load_threshold = config_.selector.load_threshold;
    return policy;
}

EngineOptions TranscriptionRun::engine_options() const {
    return EngineOptions{
        .language = config_.engine.language,
        .device = platform::resolve_compute_device(config_.engine.device),
        .threads = config_.engine.threads,
        .pcm_sample_rate = config_.audio.pcm_sample_rate,
    };
}

nlohmann::json TranscriptionRun::to_json(const RunOutcome& outcome) {
    if (!outcome) {
        return {{"error", outcome.error().message}};
    }
    return {
        {"text", outcome->text},
        {"model", outcome->model},
        {"confidence", outcome->confidence},
        {"confidence_percent", outcome->confidence_percent},
    };
}

void TranscriptionRun::record(const std::string& audio_path, const RunOutcome& outcome,
                              double processing_s) {
    if (!history_ || !history_->is_open()) return;

    RunRecord r;
    r.input_path = audio_path;
    r.model = choice_.id;
    r.load = choice_.load;
    r.processing_time = processing_s;
    if (outcome) {
        r.confidence = outcome->confidence;
        r.text = outcome->text;
    } else {
        r.error = outcome.error().message;
    }

    if (!history_->insert(r)) {
        log("Failed to record run in history");
    }
}

void TranscriptionRun::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[voxscore] {}", msg);
    }
}

std::expected<std::unique_ptr<TranscriptionEngine>, std::string>
make_engine(const Config::Engine& config) {
    if (config.type == "lan") {
        return std::make_unique<LanEngine>(config.url, config.api_format, config.model_dir);
    }
    if (config.type == "local") {
#ifdef VOXSCORE_HAS_WHISPER
        return std::make_unique<LocalEngine>(config.model_dir);
#else
        return std::unexpected("local engine unavailable: built without whisper.cpp");
#endif
    }
    return std::unexpected("unknown engine type: " + config.type);
}

RunOutcome run_once(const Config& config, bool verbose, const std::string& audio_path,
                    LoadSampler& sampler, DecoderProbe& decoder, RunHistory* history) {
    if (auto valid = validate_input(audio_path); !valid) {
        return std::unexpected(valid.error());
    }

    auto engine = make_engine(config.engine);
    if (!engine) {
        return std::unexpected(RunError{ErrorKind::Engine, engine.error()});
    }

    TranscriptionRun run(config, verbose, sampler, decoder, **engine, history);
    return run.execute(audio_path);
}
