#pragma once

#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <vector>

// In-memory PCM16 WAV encoding and decoding.
namespace wav {

struct Pcm {
    std::vector<int16_t> samples; // mono
    uint32_t sample_rate = 0;
};

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) std::memcpy(out.data() + 44, samples.data(), data_size);

    return out;
}

// Accepts PCM16 with any channel count; channels are averaged down to mono.
// Unknown chunks (LIST, fact, ...) are skipped.
inline std::expected<Pcm, std::string> decode(std::span<const uint8_t> bytes) {
    auto r16 = [&bytes](size_t pos) { uint16_t v; std::memcpy(&v, bytes.data() + pos, 2); return v; };
    auto r32 = [&bytes](size_t pos) { uint32_t v; std::memcpy(&v, bytes.data() + pos, 4); return v; };
    auto tag = [&bytes](size_t pos, const char* t) { return std::memcmp(bytes.data() + pos, t, 4) == 0; };

    if (bytes.size() < 12 || !tag(0, "RIFF") || !tag(8, "WAVE")) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    uint16_t format = 0, channels = 0, bits = 0;
    uint32_t sample_rate = 0;
    bool have_fmt = false;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        uint32_t chunk_size = r32(pos + 4);
        size_t body = pos + 8;
        if (chunk_size > bytes.size() - body) chunk_size = static_cast<uint32_t>(bytes.size() - body);

        if (tag(pos, "fmt ")) {
            if (chunk_size < 16) return std::unexpected("fmt chunk too short");
            format = r16(body);
            channels = r16(body + 2);
            sample_rate = r32(body + 4);
            bits = r16(body + 14);
            have_fmt = true;
        } else if (tag(pos, "data")) {
            if (!have_fmt) return std::unexpected("data chunk before fmt chunk");
            if (format != 1 || bits != 16) {
                return std::unexpected("unsupported WAV encoding (need 16-bit PCM)");
            }
            if (channels == 0 || sample_rate == 0) {
                return std::unexpected("invalid WAV header");
            }

            size_t frames = chunk_size / (sizeof(int16_t) * channels);
            Pcm pcm;
            pcm.sample_rate = sample_rate;
            pcm.samples.resize(frames);
            for (size_t i = 0; i < frames; ++i) {
                int32_t acc = 0;
                for (uint16_t c = 0; c < channels; ++c) {
                    acc += static_cast<int16_t>(r16(body + (i * channels + c) * 2));
                }
                pcm.samples[i] = static_cast<int16_t>(acc / channels);
            }
            return pcm;
        }

        pos = body + chunk_size + (chunk_size & 1);
    }

    return std::unexpected("no data chunk");
}

} // namespace wav
