#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("engine")) {
            auto& e = j["engine"];
            if (e.contains("type")) cfg.engine.type = e["type"].get<std::string>();
            if (e.contains("url")) cfg.engine.url = e["url"].get<std::string>();
            if (e.contains("api_format")) cfg.engine.api_format = e["api_format"].get<std::string>();
            if (e.contains("language")) cfg.engine.language = e["language"].get<std::string>();
            if (e.contains("device")) cfg.engine.device = e["device"].get<std::string>();
            if (e.contains("threads")) cfg.engine.threads = e["threads"].get<int>();
            if (e.contains("model_dir")) cfg.engine.model_dir = e["model_dir"].get<std::string>();
        }

        if (j.contains("models")) {
            auto& m = j["models"];
            if (m.contains("fast")) cfg.models.fast = m["fast"].get<std::string>();
            if (m.contains("accurate")) cfg.models.accurate = m["accurate"].get<std::string>();
            if (m.contains("local_path")) cfg.models.local_path = m["local_path"].get<std::string>();
            if (m.contains("local_id")) cfg.models.local_id = m["local_id"].get<std::string>();
        }

        if (j.contains("selector")) {
            auto& s = j["selector"];
            if (s.contains("load_threshold")) cfg.selector.load_threshold = s["load_threshold"].get<double>();
            if (s.contains("sample_window_ms")) cfg.selector.sample_window_ms = s["sample_window_ms"].get<uint32_t>();
        }

        if (j.contains("decoder")) {
            auto& d = j["decoder"];
            if (d.contains("path")) cfg.decoder.path = d["path"].get<std::string>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("pcm_sample_rate")) cfg.audio.pcm_sample_rate = a["pcm_sample_rate"].get<uint32_t>();
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
            if (h.contains("path")) cfg.history.path = h["path"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        return load(config_path.string());
    }
    return Config{};
}

std::string Config::History::resolved_path() const {
    if (!path.empty()) return path;
    auto data = platform::data_dir();
    if (data.empty()) return "/tmp/voxscore/history.db";
    return data + "/history.db";
}
