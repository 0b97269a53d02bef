#include "cli_options.hpp"
#include "config.hpp"
#include "platform/linux/exec_decoder_probe.hpp"
#include "platform/linux/procstat_sampler.hpp"
#include "storage/run_history.hpp"
#include "transcription_run.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] <audio-file>", prog);
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH   Config file path");
    std::println(stderr, "  -v, --verbose       Log progress to stderr");
    std::println(stderr, "      --history [N]   Print the N most recent runs and exit");
    std::println(stderr, "  -h, --help          Show this help");
}

static int print_history(const Config& config, int limit) {
    RunHistory history;
    if (!history.open(config.history.resolved_path())) {
        std::println("{}", json{{"error", "could not open run history"}}.dump());
        return 0;
    }

    json entries = json::array();
    for (auto& r : history.recent(limit)) {
        json e = {
            {"id", r.id},
            {"timestamp", r.timestamp},
            {"input", r.input_path},
            {"model", r.model},
            {"load", r.load ? json(*r.load) : json(nullptr)},
            {"confidence", r.confidence ? json(*r.confidence) : json(nullptr)},
            {"processing_time", r.processing_time},
        };
        if (r.error.empty()) e["text"] = r.text;
        else e["error"] = r.error;
        entries.push_back(std::move(e));
    }
    std::println("{}", entries.dump(-1, ' ', false, json::error_handler_t::replace));
    return 0;
}

int main(int argc, char* argv[]) {
    auto opts = parse_cli(argc, argv);
    if (!opts) {
        std::println(stderr, "{}", opts.error());
        usage(argv[0]);
        return 1;
    }
    if (opts->help) {
        usage(argv[0]);
        return 0;
    }

    const auto& config_path = opts->config_path;
    const auto& audio_path = opts->audio_path;
    bool verbose = opts->verbose;

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    if (opts->show_history) {
        return print_history(config, opts->history_limit);
    }

    if (audio_path.empty()) {
        std::println("{}", json{{"error", "audio file path not provided"}}.dump());
        return 1;
    }

    RunHistory history;
    if (config.history.enabled && !history.open(config.history.resolved_path())) {
        std::println(stderr, "[voxscore] Warning: run history failed to open, history disabled");
    }

    ProcStatSampler sampler(std::chrono::milliseconds(config.selector.sample_window_ms));
    ExecDecoderProbe decoder(config.decoder.path);

    auto outcome = run_once(config, verbose, audio_path, sampler, decoder, &history);

    // Engine text is not guaranteed to be valid UTF-8
    std::println("{}", TranscriptionRun::to_json(outcome)
                           .dump(-1, ' ', false, json::error_handler_t::replace));
    return 0;
}
