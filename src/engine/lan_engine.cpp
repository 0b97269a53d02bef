#include "lan_engine.hpp"

#include "audio/audio_file.hpp"
#include "audio/wav_codec.hpp"

#include <chrono>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

void add_field(curl_mime* mime, const char* name, const std::string& value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

// Posts a multipart form and returns the response body.
std::expected<std::string, std::string>
post_form(const std::string& endpoint, curl_mime* mime, CURL* curl, long timeout_s) {
    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code >= 400) {
        return std::unexpected("HTTP " + std::to_string(http_code) + " from " + endpoint +
                               (response_body.empty() ? "" : ": " + response_body));
    }
    return response_body;
}

bool is_loopback_url(const std::string& url) {
    CURLU* handle = curl_url();
    if (!handle) return false;

    bool loopback = false;
    char* host = nullptr;
    if (curl_url_set(handle, CURLUPART_URL, url.c_str(), 0) == CURLUE_OK &&
        curl_url_get(handle, CURLUPART_HOST, &host, 0) == CURLUE_OK) {
        std::string h = host;
        loopback = h == "localhost" || h == "::1" || h == "[::1]" || h.starts_with("127.");
        curl_free(host);
    }
    curl_url_cleanup(handle);
    return loopback;
}

class LanModel : public TranscriptionModel {
public:
    LanModel(std::string url, std::string api_format, std::string model_id, EngineOptions options)
        : url_(std::move(url)), api_format_(std::move(api_format)),
          model_id_(std::move(model_id)), options_(std::move(options)) {}

    std::expected<EngineTranscript, std::string>
    transcribe(const std::string& audio_path) override {
        auto pcm = audio::load(audio_path, options_.pcm_sample_rate);
        if (!pcm) return std::unexpected(pcm.error());
        if (pcm->samples.empty()) {
            return std::unexpected("empty audio");
        }

        double duration_s = static_cast<double>(pcm->samples.size()) / pcm->sample_rate;
        auto wav_data = wav::encode(pcm->samples, pcm->sample_rate);

        auto start = std::chrono::steady_clock::now();

        CURL* curl = curl_easy_init();
        if (!curl) {
            return std::unexpected("curl_easy_init failed");
        }

        std::string endpoint;
        curl_mime* mime = curl_mime_init(curl);

        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, "file");
        curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
        curl_mime_filename(part, "audio.wav");
        curl_mime_type(part, "audio/wav");

        add_field(mime, "response_format", "verbose_json");
        if (!options_.language.empty()) add_field(mime, "language", options_.language);

        if (api_format_ == "openai") {
            endpoint = url_ + "/v1/audio/transcriptions";
            add_field(mime, "model", model_id_);
        } else {
            endpoint = url_ + "/inference";
            add_field(mime, "temperature", "0.0");
        }

        auto body = post_form(endpoint, mime, curl, 300L);

        curl_mime_free(mime);
        curl_easy_cleanup(curl);

        auto end = std::chrono::steady_clock::now();

        if (!body) return std::unexpected(body.error());

        auto transcript = LanEngine::parse_response(*body);
        if (!transcript) return transcript;

        if (transcript->duration_s <= 0.0) transcript->duration_s = duration_s;
        transcript->processing_s = std::chrono::duration<double>(end - start).count();
        return transcript;
    }

private:
    std::string url_;
    std::string api_format_;
    std::string model_id_;
    EngineOptions options_;
};

} // namespace

LanEngine::LanEngine(std::string url, std::string api_format, std::string model_dir)
    : url_(std::move(url)), api_format_(std::move(api_format)),
      model_dir_(std::move(model_dir)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanEngine::~LanEngine() {
    curl_global_cleanup();
}

std::expected<std::unique_ptr<TranscriptionModel>, std::string>
LanEngine::load(const std::string& model_id, const std::string& model_path,
                const EngineOptions& options) {
    if (api_format_ != "openai" && api_format_ != "whisper.cpp") {
        return std::unexpected("unknown api_format: " + api_format_);
    }

    if (api_format_ == "openai") {
        if (!model_path.empty()) {
            return std::unexpected("cached model " + model_path +
                                   " cannot be served through the OpenAI API");
        }
        return std::make_unique<LanModel>(url_, api_format_, model_id, options);
    }

    // whisper.cpp's server only switches models through /load with a path it
    // can open itself, so a cached client-side file needs a server on this host.
    std::string server_path;
    if (!model_path.empty()) {
        if (!is_loopback_url(url_)) {
            return std::unexpected("cached model " + model_path +
                                   " is only usable with a server on this host, not " + url_);
        }
        server_path = model_path;
    } else if (!model_dir_.empty()) {
        server_path = model_dir_ + "/ggml-" + model_id + ".bin";
    } else {
        return std::unexpected("cannot select model " + model_id +
                               ": engine.model_dir is not set");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }
    curl_mime* mime = curl_mime_init(curl);
    add_field(mime, "model", server_path);

    auto body = post_form(url_ + "/load", mime, curl, 120L);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (!body) {
        return std::unexpected("model load failed for " + model_id + ": " + body.error());
    }

    return std::make_unique<LanModel>(url_, api_format_, model_id, options);
}

std::expected<EngineTranscript, std::string> LanEngine::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);

        if (j.contains("error")) {
            auto& err = j["error"];
            std::string msg = err.is_string() ? err.get<std::string>()
                              : err.is_object() ? err.value("message", err.dump())
                                                : err.dump();
            return std::unexpected("server error: " + msg);
        }
        if (!j.contains("text")) {
            return std::unexpected("unexpected response: " + body);
        }

        EngineTranscript tr;
        tr.text = engine::trim(j["text"].get<std::string>());
        if (j.contains("duration") && j["duration"].is_number()) {
            tr.duration_s = j["duration"].get<double>();
        }

        if (j.contains("segments") && j["segments"].is_array()) {
            for (auto& s : j["segments"]) {
                Segment seg;
                seg.start = s.value("start", 0.0);
                seg.end = s.value("end", seg.start);
                if (s.contains("avg_logprob") && s["avg_logprob"].is_number()) {
                    seg.avg_log_probability = s["avg_logprob"].get<double>();
                }
                tr.segments.push_back(seg);
            }
        }

        return tr;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
