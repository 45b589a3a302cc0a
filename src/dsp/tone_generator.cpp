#include "dsp/tone_generator.h"

#include <algorithm>
#include <cmath>

namespace stand::dsp {

namespace {
constexpr double kPi = 3.14159265358979323846264338327950288;
constexpr double kTwoPi = 2.0 * kPi;
}  // namespace

ToneSpec ToneSpec::fixed(double frequency, double duration, double fade, float amplitude, int sampleRate) {
    ToneSpec spec;
    spec.start_hz = frequency;
    spec.end_hz = frequency;
    spec.duration_s = duration;
    spec.fade_s = fade;
    spec.amplitude = amplitude;
    spec.sample_rate = sampleRate;
    return spec;
}

ToneSpec ToneSpec::sweep(double startHz, double endHz, double duration, double fade,
                         float amplitude, int sampleRate) {
    ToneSpec spec = fixed(startHz, duration, fade, amplitude, sampleRate);
    spec.end_hz = endHz;
    return spec;
}

ToneGenerator::ToneGenerator(const ToneSpec& spec)
    : m_spec(spec)
    , m_totalFrames(0)
    , m_fadeFrames(0)
    , m_position(0)
    , m_phase(0.0)
    , m_amplitude(std::clamp(spec.amplitude, 0.0f, kMaxAmplitude)) {
    m_spec.sample_rate = std::max(1, m_spec.sample_rate);
    const double frames = std::max(0.0, m_spec.duration_s) * m_spec.sample_rate;
    m_totalFrames = static_cast<size_t>(frames);
    const double fadeFrames = std::max(0.0, m_spec.fade_s) * m_spec.sample_rate;
    m_fadeFrames = std::min(static_cast<size_t>(fadeFrames), m_totalFrames / 2);
}

double ToneGenerator::instantaneousFrequency(size_t frame) const {
    if (!m_spec.isSweep() || m_totalFrames == 0) {
        return m_spec.start_hz;
    }
    const double t = static_cast<double>(std::min(frame, m_totalFrames)) / static_cast<double>(m_totalFrames);
    return m_spec.start_hz + (m_spec.end_hz - m_spec.start_hz) * t;
}

float ToneGenerator::envelope(size_t frame) const {
    if (m_fadeFrames == 0) {
        return 1.0f;
    }
    if (frame < m_fadeFrames) {
        const double x = static_cast<double>(frame) / static_cast<double>(m_fadeFrames);
        return static_cast<float>(0.5 * (1.0 - std::cos(kPi * x)));
    }
    const size_t fadeOutStart = m_totalFrames - m_fadeFrames;
    if (frame >= fadeOutStart) {
        const double x = static_cast<double>(frame - fadeOutStart) / static_cast<double>(m_fadeFrames);
        return static_cast<float>(0.5 * (1.0 + std::cos(kPi * x)));
    }
    return 1.0f;
}

size_t ToneGenerator::generate(float* out, size_t maxFrames) {
    if (!out) {
        return 0;
    }
    const size_t frames = std::min(maxFrames, framesRemaining());
    const double sampleRate = static_cast<double>(m_spec.sample_rate);
    for (size_t i = 0; i < frames; i++) {
        const size_t frame = m_position + i;
        out[i] = m_amplitude * envelope(frame) * static_cast<float>(std::sin(m_phase));
        m_phase += kTwoPi * instantaneousFrequency(frame) / sampleRate;
        if (m_phase >= kTwoPi) {
            m_phase = std::fmod(m_phase, kTwoPi);
        }
    }
    m_position += frames;
    return frames;
}

}  // namespace stand::dsp
