#include <catch2/catch_test_macros.hpp>

#include "audio/wav_codec.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace {

// Read a little-endian uint16 from raw bytes.
uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

// Read a little-endian uint32 from raw bytes.
uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

std::string read_tag(const uint8_t* p) {
    return {reinterpret_cast<const char*>(p), 4};
}

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
}

void put_tag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

// Stereo 16-bit WAV with a LIST chunk between fmt and data.
std::vector<uint8_t> stereo_wav_with_list(const std::vector<int16_t>& interleaved, uint32_t rate) {
    std::vector<uint8_t> out;
    uint32_t data_size = static_cast<uint32_t>(interleaved.size() * 2);
    put_tag(out, "RIFF");
    put_u32(out, 4 + 24 + 12 + 8 + data_size);
    put_tag(out, "WAVE");
    put_tag(out, "fmt ");
    put_u32(out, 16);
    put_u16(out, 1);
    put_u16(out, 2);
    put_u32(out, rate);
    put_u32(out, rate * 4);
    put_u16(out, 4);
    put_u16(out, 16);
    put_tag(out, "LIST");
    put_u32(out, 4);
    put_tag(out, "INFO");
    put_tag(out, "data");
    put_u32(out, data_size);
    for (int16_t s : interleaved) put_u16(out, static_cast<uint16_t>(s));
    return out;
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    constexpr uint32_t sample_rate = 16000;
    std::vector<int16_t> samples = {0, 100, -100, 32767, -32768};

    SECTION("HeaderMagic") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(read_tag(wav.data()) == "RIFF");
        REQUIRE(read_tag(wav.data() + 8) == "WAVE");
        REQUIRE(read_tag(wav.data() + 12) == "fmt ");
        REQUIRE(read_tag(wav.data() + 36) == "data");
    }

    SECTION("HeaderFields") {
        auto wav = wav::encode(samples, sample_rate);
        REQUIRE(wav.size() == 44 + samples.size() * 2);
        REQUIRE(read_u16(wav.data() + 20) == 1);
        REQUIRE(read_u16(wav.data() + 22) == 1);
        REQUIRE(read_u32(wav.data() + 24) == sample_rate);
        REQUIRE(read_u16(wav.data() + 34) == 16);
        REQUIRE(read_u32(wav.data() + 40) == samples.size() * 2);
    }

    SECTION("EmptySamples") {
        std::vector<int16_t> empty;
        auto wav = wav::encode(empty, sample_rate);
        REQUIRE(wav.size() == 44);
        REQUIRE(read_u32(wav.data() + 40) == 0);
    }
}

TEST_CASE("wav::decode", "[wav]") {

    SECTION("ReadsWhatEncodeWrites") {
        std::vector<int16_t> samples = {0, 100, -100, 32767, -32768};
        auto pcm = wav::decode(wav::encode(samples, 16000));
        REQUIRE(pcm.has_value());
        REQUIRE(pcm->sample_rate == 16000);
        REQUIRE(pcm->samples == samples);
    }

    SECTION("StereoIsDownmixedAndListSkipped") {
        auto bytes = stereo_wav_with_list({100, 300, -200, -400, 32767, 32767}, 44100);
        auto pcm = wav::decode(bytes);
        REQUIRE(pcm.has_value());
        REQUIRE(pcm->sample_rate == 44100);
        REQUIRE(pcm->samples == std::vector<int16_t>{200, -300, 32767});
    }

    SECTION("RejectsNonRiff") {
        std::vector<uint8_t> bytes = {'I', 'D', '3', 4, 0, 0, 0, 0, 0, 0, 0, 0, 0};
        auto pcm = wav::decode(bytes);
        REQUIRE_FALSE(pcm.has_value());
        REQUIRE(pcm.error() == "not a RIFF/WAVE file");
    }

    SECTION("RejectsFloatEncoding") {
        auto bytes = wav::encode(std::vector<int16_t>{1, 2}, 16000);
        bytes[20] = 3; // IEEE float
        auto pcm = wav::decode(bytes);
        REQUIRE_FALSE(pcm.has_value());
        REQUIRE(pcm.error() == "unsupported WAV encoding (need 16-bit PCM)");
    }

    SECTION("MissingDataChunk") {
        auto bytes = wav::encode(std::vector<int16_t>{}, 16000);
        bytes.resize(36);
        auto pcm = wav::decode(bytes);
        REQUIRE_FALSE(pcm.has_value());
        REQUIRE(pcm.error() == "no data chunk");
    }
}
