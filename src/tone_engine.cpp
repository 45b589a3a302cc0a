#include "tone_engine.h"

#include <algorithm>
#include <iostream>
#include <vector>

const char *renderResultName(RenderResult result) {
    switch (result) {
        case RenderResult::Completed:
            return "completed";
        case RenderResult::Cancelled:
            return "cancelled";
        case RenderResult::DeviceError:
            return "device error";
    }
    return "unknown";
}

ToneEngine::ToneEngine(IAudioSink& sink, bool verboseLogging)
    : m_sink(sink)
    , m_verboseLogging(verboseLogging) {
}

RenderResult ToneEngine::render(const stand::dsp::ToneSpec& spec, const StopSignal& stop) {
    std::lock_guard<std::mutex> lock(m_renderMutex);
    if (stop.isSet()) {
        return RenderResult::Cancelled;
    }

    stand::dsp::ToneGenerator generator(spec);
    if (!m_sink.open(spec.sample_rate, 1)) {
        std::cerr << "[Audio] cannot open output device\n";
        return RenderResult::DeviceError;
    }
    if (m_verboseLogging) {
        if (spec.isSweep()) {
            std::cout << "[Audio] sweep " << spec.start_hz << " -> " << spec.end_hz << " Hz over "
                      << spec.duration_s << " s\n";
        }
    }

    std::vector<float> block(blockFrames(spec.sample_rate));
    RenderResult result = RenderResult::Completed;
    while (!generator.finished()) {
        if (stop.isSet()) {
            result = RenderResult::Cancelled;
            break;
        }
        const size_t frames = generator.generate(block.data(), block.size());
        if (!m_sink.write(block.data(), frames)) {
            std::cerr << "[Audio] write failed at frame " << generator.position() << "\n";
            result = RenderResult::DeviceError;
            break;
        }
    }

    m_sink.close(result != RenderResult::Completed);
    return result;
}

size_t ToneEngine::blockFrames(int sampleRate) {
    const size_t byTime = static_cast<size_t>(std::max(1, sampleRate)) * MAX_BLOCK_MS / 1000;
    return std::max<size_t>(1, std::min(BLOCK_FRAMES, byTime));
}

RenderResult ToneEngine::play(const stand::dsp::ToneSpec& spec) {
    StopSignal neverRaised;
    return render(spec, neverRaised);
}
