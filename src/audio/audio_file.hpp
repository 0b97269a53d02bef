#pragma once

#include "audio/wav_codec.hpp"

#include <cstdint>
#include <expected>
#include <string>

namespace audio {

// Loads a .wav file, or a headerless .pcm capture (s16le mono at
// pcm_sample_rate), as mono PCM16.
std::expected<wav::Pcm, std::string> load(const std::string& path, uint32_t pcm_sample_rate);

bool is_raw_pcm(const std::string& path);

} // namespace audio
