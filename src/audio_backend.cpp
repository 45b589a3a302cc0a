#include "audio_backend.h"

#include <algorithm>
#include <iostream>
#include <thread>
#include <vector>

#include "audio_output.h"

WavFileSink::WavFileSink(const std::string& filename, bool realtimePacing)
    : m_filename(filename)
    , m_realtimePacing(realtimePacing) {
}

WavFileSink::~WavFileSink() {
    finishFile();
}

bool WavFileSink::open(int sampleRate, int channels) {
    close(false);
    sampleRate = std::max(1, sampleRate);
    channels = std::max(1, channels);
    if (m_fileHandle && (sampleRate != m_sampleRate || channels != m_channels)) {
        std::cerr << "[Audio] format changed to " << sampleRate << " Hz, restarting " << m_filename << "\n";
        finishFile();
    }
    if (!m_fileHandle) {
        m_fileHandle = fopen(m_filename.c_str(), "wb");
        if (!m_fileHandle) {
            std::cerr << "[Audio] cannot create WAV file " << m_filename << "\n";
            return false;
        }
        m_sampleRate = sampleRate;
        m_channels = channels;
        m_dataSize = 0;
        writeHeader();
    }
    m_framesWritten = 0;
    m_openedAt = std::chrono::steady_clock::now();
    m_open = true;
    return true;
}

void WavFileSink::writeHeader() {
    if (!m_fileHandle) return;

    uint32_t sampleRate = static_cast<uint32_t>(m_sampleRate);
    uint16_t numChannels = static_cast<uint16_t>(m_channels);
    uint16_t bitsPerSample = static_cast<uint16_t>(m_bitsPerSample);
    uint32_t byteRate = sampleRate * numChannels * bitsPerSample / 8;
    uint16_t blockAlign = numChannels * bitsPerSample / 8;
    uint32_t dataSize = m_dataSize;

    fseek(m_fileHandle, 0, SEEK_SET);

    fwrite("RIFF", 1, 4, m_fileHandle);
    uint32_t fileSize = 36 + dataSize;
    fwrite(&fileSize, 4, 1, m_fileHandle);
    fwrite("WAVE", 1, 4, m_fileHandle);

    fwrite("fmt ", 1, 4, m_fileHandle);
    uint32_t fmtSize = 16;
    fwrite(&fmtSize, 4, 1, m_fileHandle);
    uint16_t audioFormat = 1;
    fwrite(&audioFormat, 2, 1, m_fileHandle);
    fwrite(&numChannels, 2, 1, m_fileHandle);
    fwrite(&sampleRate, 4, 1, m_fileHandle);
    fwrite(&byteRate, 4, 1, m_fileHandle);
    fwrite(&blockAlign, 2, 1, m_fileHandle);
    fwrite(&bitsPerSample, 2, 1, m_fileHandle);

    fwrite("data", 1, 4, m_fileHandle);
    fwrite(&dataSize, 4, 1, m_fileHandle);
    fseek(m_fileHandle, 0, SEEK_END);
}

bool WavFileSink::write(const float* samples, size_t frames) {
    if (!m_open || !samples) return false;

    const size_t count = frames * static_cast<size_t>(m_channels);
    std::vector<int16_t> buffer(count);
    for (size_t i = 0; i < count; i++) {
        const float s = std::max(-1.0f, std::min(1.0f, samples[i]));
        buffer[i] = static_cast<int16_t>(s * 32767.0f);
    }

    const size_t written = fwrite(buffer.data(), sizeof(int16_t), count, m_fileHandle);
    m_dataSize += static_cast<uint32_t>(written * sizeof(int16_t));
    m_framesWritten += frames;
    if (written != count) {
        std::cerr << "[Audio] short write to " << m_filename << "\n";
        return false;
    }

    if (m_realtimePacing) {
        const auto due = m_openedAt + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(static_cast<double>(m_framesWritten) / m_sampleRate));
        std::this_thread::sleep_until(due);
    }
    return true;
}

void WavFileSink::close(bool discardPending) {
    (void)discardPending;
    if (!m_open) return;
    m_open = false;
    writeHeader();
    fflush(m_fileHandle);
}

void WavFileSink::finishFile() {
    if (m_fileHandle) {
        writeHeader();
        fclose(m_fileHandle);
        m_fileHandle = nullptr;
    }
    m_open = false;
}

std::unique_ptr<IAudioSink> createAudioSink(const std::string& backend, const std::string& device,
                                            const std::string& wavFile, bool verboseLogging) {
    if (backend == "wav") {
        if (verboseLogging) {
            std::cout << "[Audio] recording tones to " << wavFile << " (no speaker output)\n";
        }
        return std::make_unique<WavFileSink>(wavFile);
    }
    if (backend == "alsa") {
        return std::make_unique<AudioOutput>(AudioOutput::Backend::Alsa, device, verboseLogging);
    }
    if (backend != "portaudio") {
        std::cerr << "[Audio] unknown backend '" << backend << "', using portaudio\n";
    }
    return std::make_unique<AudioOutput>(AudioOutput::Backend::PortAudio, device, verboseLogging);
}
