#include <catch2/catch_test_macros.hpp>

#include "platform/linux/exec_decoder_probe.hpp"
#include "test_helpers.hpp"

#include <filesystem>

namespace {

// Executable shell script that exits with `code`.
struct TmpScript {
    test::TmpFile file;

    TmpScript(const std::string& name, int code)
        : file(name, "#!/bin/sh\nexit " + std::to_string(code) + "\n") {
        std::filesystem::permissions(file.path, std::filesystem::perms::owner_all);
    }
};

} // namespace

TEST_CASE("ExecDecoderProbe", "[decoder]") {

    SECTION("HealthyExecutable") {
        TmpScript ffmpeg("fake_ffmpeg_ok", 0);
        ExecDecoderProbe probe(ffmpeg.file.path);
        REQUIRE(probe.check().has_value());
    }

    SECTION("FailingHealthCheck") {
        TmpScript ffmpeg("fake_ffmpeg_bad", 3);
        ExecDecoderProbe probe(ffmpeg.file.path);
        auto res = probe.check();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("exited with code 3") != std::string::npos);
    }

    SECTION("MissingExecutable") {
        auto path = test::missing_path("ffmpeg");
        ExecDecoderProbe probe(path);
        auto res = probe.check();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "decoder not found at " + path);
    }

    SECTION("BareNameNotOnPath") {
        ExecDecoderProbe probe("voxscore-no-such-decoder");
        auto res = probe.check();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "decoder could not be executed: voxscore-no-such-decoder");
    }

    SECTION("NotExecutable") {
        test::TmpFile plain("fake_ffmpeg_plain", "not a program");
        ExecDecoderProbe probe(plain.path);
        REQUIRE_FALSE(probe.check().has_value());
    }

    SECTION("EmptyPath") {
        ExecDecoderProbe probe("");
        REQUIRE_FALSE(probe.check().has_value());
    }
}
