#ifndef AUDIO_BACKEND_H
#define AUDIO_BACKEND_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

class IAudioSink {
public:
    virtual ~IAudioSink() = default;

    virtual bool open(int sampleRate, int channels) = 0;
    // Blocks until the device accepted the frames.
    virtual bool write(const float* samples, size_t frames) = 0;
    // discardPending drops queued audio instead of letting it play out.
    virtual void close(bool discardPending) = 0;
    virtual bool isOpen() const = 0;
};

// Records every tone of a session into one WAV file. The file is created by
// the first open(); later opens with the same format append to it, and each
// close() rewrites the header so the file stays playable.
class WavFileSink : public IAudioSink {
public:
    explicit WavFileSink(const std::string& filename, bool realtimePacing = true);
    ~WavFileSink() override;

    bool open(int sampleRate, int channels) override;
    bool write(const float* samples, size_t frames) override;
    void close(bool discardPending) override;
    bool isOpen() const override { return m_open; }

    uint32_t dataSize() const { return m_dataSize; }

private:
    void writeHeader();
    void finishFile();

    std::string m_filename;
    bool m_realtimePacing;
    FILE* m_fileHandle = nullptr;
    bool m_open = false;
    uint32_t m_dataSize = 0;
    int m_sampleRate = 44100;
    int m_channels = 1;
    int m_bitsPerSample = 16;
    uint64_t m_framesWritten = 0;
    std::chrono::steady_clock::time_point m_openedAt;
};

// backend: "portaudio", "alsa" or "wav".
std::unique_ptr<IAudioSink> createAudioSink(const std::string& backend, const std::string& device,
                                            const std::string& wavFile, bool verboseLogging);

#endif
