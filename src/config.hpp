#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Engine {
        std::string type = "lan";  // "lan" or "local"
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string language = "en";
        std::string device = "auto"; // "auto", "cpu" or "gpu"
        int threads = 4;
        std::string model_dir = "models"; // ggml-<id>.bin; server-side for "lan"
    } engine;

    struct Models {
        std::string fast = "tiny";
        std::string accurate = "base";
        std::string local_path;
        std::string local_id;
    } models;

    struct Selector {
        double load_threshold = 60.0;
        uint32_t sample_window_ms = 200;
    } selector;

    struct Decoder {
        std::string path = "ffmpeg";
    } decoder;

    struct Audio {
        uint32_t pcm_sample_rate = 48000;
    } audio;

    struct History {
        bool enabled = false;
        std::string path;

        // Falls back to the XDG data directory when no path is configured.
        std::string resolved_path() const;
    } history;

    static Config load(const std::string& path);
    static Config load_default();
};
