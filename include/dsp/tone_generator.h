#ifndef DSP_TONE_GENERATOR_H
#define DSP_TONE_GENERATOR_H

#include <cstddef>

namespace stand::dsp {

struct ToneSpec {
  double start_hz = 440.0;
  double end_hz = 440.0;
  double duration_s = 1.0;
  double fade_s = 0.0;
  float amplitude = 0.5f;
  int sample_rate = 44100;

  static ToneSpec fixed(double frequency, double duration, double fade, float amplitude,
                        int sampleRate);
  static ToneSpec sweep(double startHz, double endHz, double duration, double fade,
                        float amplitude, int sampleRate);
  bool isSweep() const { return start_hz != end_hz; }
};

// Produces a fixed tone or linear chirp one block at a time. Phase is the
// running sum of the per-sample angular frequency, so blocks join without
// discontinuities; onset and offset get a raised-cosine fade.
class ToneGenerator {
public:
  static constexpr float kMaxAmplitude = 0.8f;

  explicit ToneGenerator(const ToneSpec &spec);

  size_t generate(float *out, size_t maxFrames);

  size_t totalFrames() const { return m_totalFrames; }
  size_t framesRemaining() const { return m_totalFrames - m_position; }
  size_t fadeFrames() const { return m_fadeFrames; }
  size_t position() const { return m_position; }
  bool finished() const { return m_position >= m_totalFrames; }
  double phase() const { return m_phase; }
  double instantaneousFrequency(size_t frame) const;
  float amplitude() const { return m_amplitude; }

private:
  float envelope(size_t frame) const;

  ToneSpec m_spec;
  size_t m_totalFrames;
  size_t m_fadeFrames;
  size_t m_position;
  double m_phase;
  float m_amplitude;
};

} // namespace stand::dsp

#endif
