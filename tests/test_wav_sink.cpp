#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <chrono>
#include <fstream>
#include <iterator>
#include <vector>
#include "audio_backend.h"
#include "run_signals.h"
#include "tone_engine.h"

TEST_CASE("WavFileSink writes a 16-bit PCM file with a valid header", "[wav]") {
    const char* path = "test_stand_tone.wav";
    {
        WavFileSink sink(path, false);
        ToneEngine engine(sink, false);
        REQUIRE(engine.play(stand::dsp::ToneSpec::fixed(100.0, 0.25, 0.01, 0.5f, 8000)) ==
                RenderResult::Completed);
        REQUIRE_FALSE(sink.isOpen());
        REQUIRE(sink.dataSize() == 2000u * 2u);
    }

    std::ifstream in(path, std::ios::binary);
    REQUIRE(in.good());
    std::vector<char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(bytes.size() == 44u + 4000u);
    REQUIRE(std::memcmp(bytes.data(), "RIFF", 4) == 0);
    REQUIRE(std::memcmp(bytes.data() + 8, "WAVE", 4) == 0);
    REQUIRE(std::memcmp(bytes.data() + 36, "data", 4) == 0);

    uint32_t sampleRate = 0;
    uint16_t channels = 0;
    uint16_t bits = 0;
    uint32_t dataSize = 0;
    std::memcpy(&channels, bytes.data() + 22, 2);
    std::memcpy(&sampleRate, bytes.data() + 24, 4);
    std::memcpy(&bits, bytes.data() + 34, 2);
    std::memcpy(&dataSize, bytes.data() + 40, 4);
    REQUIRE(channels == 1);
    REQUIRE(sampleRate == 8000u);
    REQUIRE(bits == 16);
    REQUIRE(dataSize == 4000u);

    std::remove(path);
}

namespace {
uint32_t headerDataSize(const char* path) {
    std::ifstream in(path, std::ios::binary);
    std::vector<char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    uint32_t dataSize = 0;
    if (bytes.size() >= 44) {
        std::memcpy(&dataSize, bytes.data() + 40, 4);
    }
    return dataSize;
}
}  // namespace

TEST_CASE("WavFileSink keeps every tone of a session in one file", "[wav]") {
    const char* path = "test_stand_session.wav";
    std::remove(path);
    {
        WavFileSink sink(path, false);
        ToneEngine engine(sink, false);
        REQUIRE(engine.play(stand::dsp::ToneSpec::fixed(100.0, 1.0, 0.01, 0.5f, 8000)) == RenderResult::Completed);
        REQUIRE(headerDataSize(path) == 16000u);
        REQUIRE(engine.play(stand::dsp::ToneSpec::fixed(200.0, 1.0, 0.01, 0.5f, 8000)) == RenderResult::Completed);
        REQUIRE(sink.dataSize() == 32000u);
        // The header is current after each tone, not only at shutdown.
        REQUIRE(headerDataSize(path) == 32000u);
    }
    REQUIRE(headerDataSize(path) == 32000u);
    std::remove(path);
}

TEST_CASE("WavFileSink restarts the file when the format changes", "[wav]") {
    const char* path = "test_stand_format.wav";
    std::remove(path);
    {
        WavFileSink sink(path, false);
        ToneEngine engine(sink, false);
        REQUIRE(engine.play(stand::dsp::ToneSpec::fixed(100.0, 1.0, 0.0, 0.5f, 8000)) == RenderResult::Completed);
        REQUIRE(engine.play(stand::dsp::ToneSpec::fixed(100.0, 0.5, 0.0, 0.5f, 16000)) == RenderResult::Completed);
        REQUIRE(sink.dataSize() == 16000u);
    }
    REQUIRE(headerDataSize(path) == 16000u);
    std::remove(path);
}

TEST_CASE("WavFileSink paces writes to real time", "[wav]") {
    const char* path = "test_stand_paced.wav";
    WavFileSink sink(path, true);
    ToneEngine engine(sink, false);

    const auto begin = std::chrono::steady_clock::now();
    REQUIRE(engine.play(stand::dsp::ToneSpec::fixed(100.0, 0.3, 0.0, 0.5f, 8000)) == RenderResult::Completed);
    const auto elapsed = std::chrono::steady_clock::now() - begin;
    REQUIRE(elapsed >= std::chrono::milliseconds(280));

    std::remove(path);
}

TEST_CASE("WavFileSink fails cleanly on an unwritable path", "[wav]") {
    WavFileSink sink("/nonexistent-dir-stand/out.wav", false);
    REQUIRE_FALSE(sink.open(8000, 1));
    const float sample = 0.0f;
    REQUIRE_FALSE(sink.write(&sample, 1));
}
