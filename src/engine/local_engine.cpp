#include "local_engine.hpp"

#include "audio/audio_file.hpp"

#include <chrono>
#include <filesystem>
#include <whisper.h>

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kWhisperRate = WHISPER_SAMPLE_RATE;

class LocalModel : public TranscriptionModel {
public:
    LocalModel(whisper_context* ctx, EngineOptions options)
        : ctx_(ctx), options_(std::move(options)) {}

    ~LocalModel() override {
        if (ctx_) whisper_free(ctx_);
    }

    LocalModel(const LocalModel&) = delete;
    LocalModel& operator=(const LocalModel&) = delete;

    std::expected<EngineTranscript, std::string>
    transcribe(const std::string& audio_path) override {
        auto pcm = audio::load(audio_path, options_.pcm_sample_rate);
        if (!pcm) return std::unexpected(pcm.error());
        if (pcm->samples.empty()) {
            return std::unexpected("empty audio");
        }
        if (pcm->sample_rate != kWhisperRate) {
            return std::unexpected("unsupported audio: " + std::to_string(pcm->sample_rate) +
                                   " Hz, local engine needs " + std::to_string(kWhisperRate) + " Hz");
        }

        std::vector<float> samples(pcm->samples.size());
        for (size_t i = 0; i < samples.size(); ++i) {
            samples[i] = static_cast<float>(pcm->samples[i]) / 32768.0f;
        }

        whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.n_threads = options_.threads;
        params.language = options_.language.empty() ? "auto" : options_.language.c_str();
        params.translate = false;
        params.print_progress = false;
        params.print_realtime = false;
        params.print_timestamps = false;

        auto start = std::chrono::steady_clock::now();
        int rc = whisper_full(ctx_, params, samples.data(), static_cast<int>(samples.size()));
        auto end = std::chrono::steady_clock::now();

        if (rc != 0) {
            return std::unexpected("whisper_full failed with code " + std::to_string(rc));
        }

        EngineTranscript tr;
        tr.duration_s = static_cast<double>(samples.size()) / kWhisperRate;
        tr.processing_s = std::chrono::duration<double>(end - start).count();

        const whisper_token eot = whisper_token_eot(ctx_);
        const int n_segments = whisper_full_n_segments(ctx_);
        for (int s = 0; s < n_segments; ++s) {
            tr.text += whisper_full_get_segment_text(ctx_, s);

            Segment seg;
            // t0/t1 are in 10 ms units
            seg.start = whisper_full_get_segment_t0(ctx_, s) * 0.01;
            seg.end = whisper_full_get_segment_t1(ctx_, s) * 0.01;

            double plog_sum = 0.0;
            int n_text = 0;
            const int n_tokens = whisper_full_n_tokens(ctx_, s);
            for (int t = 0; t < n_tokens; ++t) {
                auto td = whisper_full_get_token_data(ctx_, s, t);
                if (td.id >= eot) continue; // special and timestamp tokens
                plog_sum += td.plog;
                ++n_text;
            }
            if (n_text > 0) seg.avg_log_probability = plog_sum / n_text;

            tr.segments.push_back(seg);
        }
        tr.text = engine::trim(std::move(tr.text));
        return tr;
    }

private:
    whisper_context* ctx_;
    EngineOptions options_;
};

} // namespace

LocalEngine::LocalEngine(std::string model_dir)
    : model_dir_(std::move(model_dir)) {}

std::expected<std::unique_ptr<TranscriptionModel>, std::string>
LocalEngine::load(const std::string& model_id, const std::string& model_path,
                  const EngineOptions& options) {
    std::string path = model_path;
    if (path.empty()) {
        if (model_dir_.empty()) {
            return std::unexpected("engine.model_dir is required for the local engine");
        }
        path = (fs::path(model_dir_) / ("ggml-" + model_id + ".bin")).string();
    }

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::unexpected("model file not found: " + path);
    }

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = options.device == "gpu";

    whisper_context* ctx = whisper_init_from_file_with_params(path.c_str(), cparams);
    if (!ctx) {
        return std::unexpected("failed to load model " + path);
    }
    return std::make_unique<LocalModel>(ctx, options);
}
