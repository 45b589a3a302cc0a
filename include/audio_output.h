#ifndef AUDIO_OUTPUT_H
#define AUDIO_OUTPUT_H

#include <stddef.h>
#include <string>
#include <vector>

#include "audio_backend.h"

#if defined(STAND_HAS_PORTAUDIO)
#include <portaudio.h>
#endif
#if defined(__linux__) && defined(STAND_HAS_ALSA)
#include <alsa/asoundlib.h>
#endif

// Blocking output to the sound card: PortAudio by default, or the ALSA PCM
// API directly. Mono float samples in, clipped to [-1, 1].
class AudioOutput : public IAudioSink {
public:
  enum class Backend { PortAudio, Alsa };

  static constexpr int FRAMES_PER_BUFFER = 1024;
  static constexpr unsigned int ALSA_LATENCY_US = 100000;

  AudioOutput(Backend backend, const std::string &deviceSelector, bool verboseLogging = true);
  ~AudioOutput() override;

  bool open(int sampleRate, int channels) override;
  bool write(const float *samples, size_t frames) override;
  void close(bool discardPending) override;
  bool isOpen() const override { return m_open; }

  static bool listDevices();

private:
  bool openPortAudio(int sampleRate, int channels);
  bool writePortAudio(const float *samples, size_t frames);
  void closePortAudio(bool discardPending);
  bool openAlsa(int sampleRate, int channels);
  bool writeAlsa(const float *samples, size_t frames);
  void closeAlsa(bool discardPending);

  Backend m_backend;
  std::string m_deviceSelector;
  bool m_verboseLogging;
  bool m_open;
  int m_channels;
  std::vector<float> m_scratch;

#if defined(STAND_HAS_PORTAUDIO)
  PaStream *m_paStream;
  bool m_portAudioInitialized;
#endif

#if defined(__linux__) && defined(STAND_HAS_ALSA)
  snd_pcm_t *m_alsaPcm;
#endif
};

#endif
