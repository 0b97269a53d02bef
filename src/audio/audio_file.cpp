#include "audio/audio_file.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

namespace fs = std::filesystem;

namespace audio {

bool is_raw_pcm(const std::string& path) {
    auto ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".pcm" || ext == ".raw";
}

std::expected<wav::Pcm, std::string> load(const std::string& path, uint32_t pcm_sample_rate) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("could not open audio file " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());

    if (!is_raw_pcm(path)) {
        auto pcm = wav::decode(bytes);
        if (!pcm) return std::unexpected(path + ": " + pcm.error());
        return pcm;
    }

    if (pcm_sample_rate == 0) {
        return std::unexpected("raw PCM input needs a sample rate");
    }
    wav::Pcm pcm;
    pcm.sample_rate = pcm_sample_rate;
    pcm.samples.resize(bytes.size() / sizeof(int16_t));
    std::memcpy(pcm.samples.data(), bytes.data(), pcm.samples.size() * sizeof(int16_t));
    return pcm;
}

} // namespace audio
