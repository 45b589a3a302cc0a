#ifndef TONE_ENGINE_H
#define TONE_ENGINE_H

#include <cstddef>
#include <mutex>

#include "audio_backend.h"
#include "dsp/tone_generator.h"
#include "run_signals.h"

enum class RenderResult { Completed = 0, Cancelled = 1, DeviceError = 2 };

const char *renderResultName(RenderResult result);

// Streams tones into a sink. Only one render is active at a time; a second
// caller blocks until the first has closed the device.
class ToneEngine {
public:
  static constexpr size_t BLOCK_FRAMES = 1024;
  // Upper bound on the audio time between two stop checks.
  static constexpr int MAX_BLOCK_MS = 50;

  ToneEngine(IAudioSink &sink, bool verboseLogging = true);

  // Blocks until the tone finished, stop was raised, or the sink failed.
  // Stop is checked before every block.
  RenderResult render(const stand::dsp::ToneSpec &spec, const StopSignal &stop);
  RenderResult play(const stand::dsp::ToneSpec &spec);

  // BLOCK_FRAMES, shortened at low sample rates to stay within MAX_BLOCK_MS.
  static size_t blockFrames(int sampleRate);

private:
  IAudioSink &m_sink;
  bool m_verboseLogging;
  std::mutex m_renderMutex;
};

#endif
