#ifndef FAKE_AUDIO_SINK_H
#define FAKE_AUDIO_SINK_H

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "audio_backend.h"

// Records what a ToneEngine feeds it. With realtime pacing each write blocks
// for the duration of the frames it was given, like a sound card would.
class FakeAudioSink : public IAudioSink {
public:
  explicit FakeAudioSink(bool realtimePacing = false) : m_realtimePacing(realtimePacing) {}

  bool open(int sampleRate, int channels) override {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_opens++;
    m_sampleRate = sampleRate;
    m_channels = channels;
    m_open = !m_failOpen;
    return m_open;
  }

  bool write(const float *samples, size_t frames) override {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (!m_open || (m_failAfterFrames > 0 && m_frames >= m_failAfterFrames)) {
        return false;
      }
      m_frames += frames;
      m_samples.insert(m_samples.end(), samples, samples + frames);
    }
    if (m_realtimePacing && m_sampleRate > 0) {
      std::this_thread::sleep_for(std::chrono::duration<double>(static_cast<double>(frames) / m_sampleRate));
    }
    return true;
  }

  void close(bool discardPending) override {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_open) {
      m_closes++;
      m_lastCloseDiscarded = discardPending;
    }
    m_open = false;
  }

  bool isOpen() const override {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_open;
  }

  void failOpen(bool fail) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failOpen = fail;
  }
  void failAfterFrames(size_t frames) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failAfterFrames = frames;
  }

  size_t frames() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_frames;
  }
  int opens() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_opens;
  }
  int closes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closes;
  }
  bool lastCloseDiscarded() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastCloseDiscarded;
  }
  int sampleRate() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sampleRate;
  }
  std::vector<float> samples() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_samples;
  }

private:
  mutable std::mutex m_mutex;
  bool m_realtimePacing;
  bool m_open = false;
  bool m_failOpen = false;
  size_t m_failAfterFrames = 0;
  size_t m_frames = 0;
  int m_opens = 0;
  int m_closes = 0;
  bool m_lastCloseDiscarded = false;
  int m_sampleRate = 0;
  int m_channels = 0;
  std::vector<float> m_samples;
};

#endif
