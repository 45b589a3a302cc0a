#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <cmath>
#include <vector>
#include "dsp/tone_generator.h"

using stand::dsp::ToneGenerator;
using stand::dsp::ToneSpec;

TEST_CASE("ToneGenerator starts every tone at a zero crossing", "[tone]") {
    ToneGenerator gen(ToneSpec::fixed(440.0, 0.1, 0.0, 0.5f, 8000));
    std::vector<float> out(16);
    REQUIRE(gen.generate(out.data(), out.size()) == 16);
    REQUIRE(out[0] == 0.0f);
    REQUIRE(out[1] != 0.0f);
}

TEST_CASE("ToneGenerator clamps amplitude and fade length", "[tone]") {
    ToneGenerator loud(ToneSpec::fixed(50.0, 0.5, 0.0, 1.5f, 8000));
    REQUIRE(loud.amplitude() == ToneGenerator::kMaxAmplitude);

    std::vector<float> out(loud.totalFrames());
    loud.generate(out.data(), out.size());
    for (float s : out) {
        REQUIRE(std::fabs(s) <= ToneGenerator::kMaxAmplitude);
    }

    ToneGenerator shortTone(ToneSpec::fixed(50.0, 0.1, 1.0, 0.5f, 1000));
    REQUIRE(shortTone.totalFrames() == 100);
    REQUIRE(shortTone.fadeFrames() == 50);
}

TEST_CASE("ToneGenerator fades in and out", "[tone]") {
    ToneGenerator gen(ToneSpec::fixed(200.0, 1.0, 0.1, 0.5f, 8000));
    std::vector<float> out(gen.totalFrames());
    REQUIRE(gen.generate(out.data(), out.size()) == 8000);
    REQUIRE(gen.finished());

    float headPeak = 0.0f;
    float midPeak = 0.0f;
    for (size_t i = 0; i < 40; i++) {
        headPeak = std::max(headPeak, std::fabs(out[i]));
    }
    for (size_t i = 4000; i < 4040; i++) {
        midPeak = std::max(midPeak, std::fabs(out[i]));
    }
    REQUIRE(headPeak < 0.05f);
    REQUIRE(midPeak > 0.45f);
    REQUIRE(std::fabs(out.back()) < 0.01f);
}

TEST_CASE("ToneGenerator chirp phase does not depend on block size", "[tone]") {
    const ToneSpec spec = ToneSpec::sweep(1.0, 150.0, 0.5, 0.05, 0.5f, 8000);
    REQUIRE(spec.isSweep());

    ToneGenerator whole(spec);
    std::vector<float> reference(whole.totalFrames());
    whole.generate(reference.data(), reference.size());

    ToneGenerator blocks(spec);
    std::vector<float> pieces;
    std::vector<float> block(333);
    while (!blocks.finished()) {
        const size_t n = blocks.generate(block.data(), block.size());
        pieces.insert(pieces.end(), block.begin(), block.begin() + static_cast<long>(n));
    }
    REQUIRE(pieces == reference);

    REQUIRE(whole.instantaneousFrequency(0) == Catch::Approx(1.0));
    REQUIRE(whole.instantaneousFrequency(whole.totalFrames() / 2) == Catch::Approx(75.5));
    REQUIRE(whole.instantaneousFrequency(whole.totalFrames()) == Catch::Approx(150.0));
}

TEST_CASE("ToneGenerator keeps a continuous phase for fixed tones", "[tone]") {
    const double frequency = 100.0;
    const int rate = 8000;
    ToneGenerator gen(ToneSpec::fixed(frequency, 1.0, 0.0, 0.5f, rate));
    std::vector<float> out(rate);
    gen.generate(out.data(), out.size());

    // One full second of a 100 Hz tone leaves the phase where it started.
    const double wrapped = std::fmod(gen.phase(), 2.0 * 3.14159265358979323846);
    REQUIRE((wrapped < 1e-6 || wrapped > 2.0 * 3.14159265358979323846 - 1e-6));
    REQUIRE(out[80] == Catch::Approx(0.0f).margin(1e-4));
}
