#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "selector/model_selector.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <limits>

namespace {

class FixedSampler : public LoadSampler {
public:
    explicit FixedSampler(double load) : load_(load) {}
    std::expected<double, std::string> sample() override {
        ++calls;
        return load_;
    }
    int calls = 0;
private:
    double load_;
};

class FailingSampler : public LoadSampler {
public:
    std::expected<double, std::string> sample() override {
        return std::unexpected("could not open /proc/stat");
    }
};

ModelPolicy default_policy() {
    ModelPolicy policy;
    policy.fast_id = "tiny";
    policy.accurate_id = "base";
    return policy;
}

} // namespace

TEST_CASE("select_model under load", "[selector]") {
    auto policy = default_policy();

    SECTION("LowLoadPicksAccurate") {
        auto load = GENERATE(0.0, 12.5, 45.0, 59.9);
        FixedSampler sampler(load);
        auto choice = select_model(policy, sampler);
        REQUIRE(choice.variant == ModelVariant::Accurate);
        REQUIRE(choice.id == "base");
        REQUIRE(choice.load == load);
        REQUIRE(choice.path.empty());
    }

    SECTION("HighLoadPicksFast") {
        auto load = GENERATE(60.1, 75.0, 99.0, 100.0);
        FixedSampler sampler(load);
        auto choice = select_model(policy, sampler);
        REQUIRE(choice.variant == ModelVariant::Fast);
        REQUIRE(choice.id == "tiny");
    }

    SECTION("ExactlyAtThresholdPicksAccurate") {
        FixedSampler sampler(60.0);
        auto choice = select_model(policy, sampler);
        REQUIRE(choice.variant == ModelVariant::Accurate);
        REQUIRE(choice.id == "base");
    }

    SECTION("CustomThreshold") {
        policy.load_threshold = 30.0;
        FixedSampler sampler(45.0);
        REQUIRE(select_model(policy, sampler).variant == ModelVariant::Fast);
    }

    SECTION("SamplesEveryCall") {
        FixedSampler sampler(10.0);
        select_model(policy, sampler);
        select_model(policy, sampler);
        REQUIRE(sampler.calls == 2);
    }
}

TEST_CASE("select_model fails closed", "[selector]") {
    auto policy = default_policy();

    SECTION("SamplerError") {
        FailingSampler sampler;
        auto choice = select_model(policy, sampler);
        REQUIRE(choice.variant == ModelVariant::Fast);
        REQUIRE(choice.id == "tiny");
        REQUIRE_FALSE(choice.load.has_value());
    }

    SECTION("OutOfRangeSample") {
        auto load = GENERATE(-1.0, 100.5, 250.0,
                             std::numeric_limits<double>::quiet_NaN(),
                             std::numeric_limits<double>::infinity());
        FixedSampler sampler(load);
        auto choice = select_model(policy, sampler);
        REQUIRE(choice.variant == ModelVariant::Fast);
        REQUIRE_FALSE(choice.load.has_value());
    }
}

TEST_CASE("select_model with a cached local model", "[selector]") {
    test::TmpFile artifact("whisper-finetuned.bin", "ggml");
    auto policy = default_policy();
    policy.local_path = artifact.path;

    SECTION("ArtifactWinsUnderHeavyLoad") {
        FixedSampler sampler(99.0);
        auto choice = select_model(policy, sampler);
        REQUIRE(choice.variant == ModelVariant::Local);
        REQUIRE(choice.path == artifact.path);
        REQUIRE(sampler.calls == 0);
    }

    SECTION("IdDefaultsToFileStem") {
        FixedSampler sampler(10.0);
        auto choice = select_model(policy, sampler);
        auto expected_id = std::filesystem::path(artifact.path).stem().string();
        REQUIRE(choice.id == expected_id);
    }

    SECTION("ConfiguredIdIsUsed") {
        policy.local_id = "finetuned-v2";
        FixedSampler sampler(10.0);
        REQUIRE(select_model(policy, sampler).id == "finetuned-v2");
    }

    SECTION("MissingArtifactFallsBackToLoad") {
        policy.local_path = test::missing_path("absent.bin");
        FixedSampler sampler(99.0);
        auto choice = select_model(policy, sampler);
        REQUIRE(choice.variant == ModelVariant::Fast);
        REQUIRE(sampler.calls == 1);
    }

    SECTION("DirectoryIsNotAnArtifact") {
        policy.local_path = std::filesystem::temp_directory_path().string();
        FixedSampler sampler(10.0);
        REQUIRE(select_model(policy, sampler).variant == ModelVariant::Accurate);
    }
}

TEST_CASE("variant_name", "[selector]") {
    REQUIRE(std::string(variant_name(ModelVariant::Local)) == "local");
    REQUIRE(std::string(variant_name(ModelVariant::Fast)) == "fast");
    REQUIRE(std::string(variant_name(ModelVariant::Accurate)) == "accurate");
}
