#include "audio_output.h"
#include <iostream>
#include <cmath>
#include <cstring>
#include <algorithm>
#include <cctype>

namespace {
std::string trim(const std::string& value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start])) != 0) {
        start++;
    }
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
        end--;
    }
    return value.substr(start, end - start);
}

std::string normalizeSelector(const std::string& rawSelector) {
    std::string selector = trim(rawSelector);
    if (selector.size() >= 2) {
        const char first = selector.front();
        const char last = selector.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            selector = trim(selector.substr(1, selector.size() - 2));
        }
    }
    return selector;
}

#if defined(STAND_HAS_PORTAUDIO)
std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool parseDeviceIndex(const std::string& selector, int& outIndex) {
    if (selector.empty()) {
        return false;
    }
    for (char c : selector) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    outIndex = std::stoi(selector);
    return true;
}

PaDeviceIndex selectOutputDevice(const std::string& selector) {
    if (selector.empty()) {
        return Pa_GetDefaultOutputDevice();
    }

    int requestedIndex = -1;
    if (parseDeviceIndex(selector, requestedIndex)) {
        const int deviceCount = Pa_GetDeviceCount();
        if (requestedIndex >= 0 && requestedIndex < deviceCount) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(requestedIndex);
            if (info && info->maxOutputChannels > 0) {
                return static_cast<PaDeviceIndex>(requestedIndex);
            }
        }
        return paNoDevice;
    }

    const std::string needle = toLower(selector);
    const int deviceCount = Pa_GetDeviceCount();
    for (int i = 0; i < deviceCount; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxOutputChannels <= 0 || !info->name) {
            continue;
        }
        if (toLower(info->name).find(needle) != std::string::npos) {
            return static_cast<PaDeviceIndex>(i);
        }
    }

    return paNoDevice;
}

void printOutputDeviceList() {
    const int deviceCount = Pa_GetDeviceCount();
    std::cerr << "Available PortAudio output devices:\n";
    for (int i = 0; i < deviceCount; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxOutputChannels <= 0 || !info->name) {
            continue;
        }
        std::cerr << "  [" << i << "] " << info->name << "\n";
    }
}
#endif
}  // namespace

AudioOutput::AudioOutput(Backend backend, const std::string& deviceSelector, bool verboseLogging)
    : m_backend(backend)
    , m_deviceSelector(normalizeSelector(deviceSelector))
    , m_verboseLogging(verboseLogging)
    , m_open(false)
    , m_channels(1)
#if defined(STAND_HAS_PORTAUDIO)
    , m_paStream(nullptr)
    , m_portAudioInitialized(false)
#endif
#if defined(__linux__) && defined(STAND_HAS_ALSA)
    , m_alsaPcm(nullptr)
#endif
{
}

AudioOutput::~AudioOutput() {
    close(true);
}

bool AudioOutput::open(int sampleRate, int channels) {
    if (m_open) {
        close(true);
    }
    m_channels = std::max(1, channels);
    const bool ok = (m_backend == Backend::Alsa) ? openAlsa(sampleRate, m_channels)
                                                 : openPortAudio(sampleRate, m_channels);
    m_open = ok;
    return ok;
}

bool AudioOutput::write(const float* samples, size_t frames) {
    if (!m_open || !samples) {
        return false;
    }
    const size_t count = frames * static_cast<size_t>(m_channels);
    m_scratch.resize(count);
    for (size_t i = 0; i < count; i++) {
        m_scratch[i] = std::max(-1.0f, std::min(1.0f, samples[i]));
    }
    return (m_backend == Backend::Alsa) ? writeAlsa(m_scratch.data(), frames)
                                        : writePortAudio(m_scratch.data(), frames);
}

void AudioOutput::close(bool discardPending) {
    if (m_backend == Backend::Alsa) {
        closeAlsa(discardPending);
    } else {
        closePortAudio(discardPending);
    }
    m_open = false;
}

bool AudioOutput::listDevices() {
#if defined(STAND_HAS_PORTAUDIO)
    const PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "PortAudio init failed: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }
    printOutputDeviceList();
    Pa_Terminate();
    return true;
#else
    std::cerr << "[Audio] PortAudio not available in this build (enable STAND_ENABLE_PORTAUDIO)\n";
    return false;
#endif
}

bool AudioOutput::openPortAudio(int sampleRate, int channels) {
#if defined(STAND_HAS_PORTAUDIO)
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "PortAudio init failed: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }
    m_portAudioInitialized = true;

    PaStreamParameters outputParams;
    outputParams.device = selectOutputDevice(m_deviceSelector);
    if (outputParams.device == paNoDevice) {
        std::cerr << "PortAudio device not found for selector: " << m_deviceSelector << std::endl;
        printOutputDeviceList();
        Pa_Terminate();
        m_portAudioInitialized = false;
        return false;
    }
    outputParams.channelCount = channels;
    outputParams.sampleFormat = paFloat32;
    const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(outputParams.device);
    if (!deviceInfo) {
        std::cerr << "PortAudio failed to get device info for selected output device" << std::endl;
        Pa_Terminate();
        m_portAudioInitialized = false;
        return false;
    }
    outputParams.suggestedLatency = deviceInfo->defaultLowOutputLatency;
    outputParams.hostApiSpecificStreamInfo = nullptr;
    if (m_verboseLogging) {
        std::cerr << "[Audio] output device [" << outputParams.device << "]: " << deviceInfo->name
                  << " @ " << sampleRate << " Hz\n";
    }

    err = Pa_OpenStream(&m_paStream, nullptr, &outputParams, sampleRate, FRAMES_PER_BUFFER, paClipOff,
                        nullptr, nullptr);
    if (err != paNoError) {
        std::cerr << "PortAudio open failed: " << Pa_GetErrorText(err) << std::endl;
        m_paStream = nullptr;
        Pa_Terminate();
        m_portAudioInitialized = false;
        return false;
    }
    err = Pa_StartStream(m_paStream);
    if (err != paNoError) {
        std::cerr << "PortAudio start failed: " << Pa_GetErrorText(err) << std::endl;
        Pa_CloseStream(m_paStream);
        m_paStream = nullptr;
        Pa_Terminate();
        m_portAudioInitialized = false;
        return false;
    }
    return true;
#else
    (void)sampleRate;
    (void)channels;
    std::cerr << "[Audio] PortAudio output not available in this build (enable STAND_ENABLE_PORTAUDIO)\n";
    return false;
#endif
}

bool AudioOutput::writePortAudio(const float* samples, size_t frames) {
#if defined(STAND_HAS_PORTAUDIO)
    if (!m_paStream) {
        return false;
    }
    const PaError err = Pa_WriteStream(m_paStream, samples, static_cast<unsigned long>(frames));
    if (err == paOutputUnderflowed) {
        if (m_verboseLogging) {
            std::cerr << "[Audio] output underflow\n";
        }
        return true;
    }
    if (err != paNoError) {
        std::cerr << "[Audio] write failed: " << Pa_GetErrorText(err) << "\n";
        return false;
    }
    return true;
#else
    (void)samples;
    (void)frames;
    return false;
#endif
}

void AudioOutput::closePortAudio(bool discardPending) {
#if defined(STAND_HAS_PORTAUDIO)
    if (m_paStream) {
        if (discardPending) {
            Pa_AbortStream(m_paStream);
        } else {
            Pa_StopStream(m_paStream);
        }
        Pa_CloseStream(m_paStream);
        m_paStream = nullptr;
    }
    if (m_portAudioInitialized) {
        Pa_Terminate();
        m_portAudioInitialized = false;
    }
#else
    (void)discardPending;
#endif
}

bool AudioOutput::openAlsa(int sampleRate, int channels) {
#if defined(__linux__) && defined(STAND_HAS_ALSA)
    const std::string deviceName = m_deviceSelector.empty() ? std::string("default") : m_deviceSelector;
    int err = snd_pcm_open(&m_alsaPcm, deviceName.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
    if (err < 0) {
        std::cerr << "[Audio] ALSA open failed for '" << deviceName << "': " << snd_strerror(err) << "\n";
        m_alsaPcm = nullptr;
        return false;
    }
    err = snd_pcm_set_params(m_alsaPcm, SND_PCM_FORMAT_FLOAT_LE, SND_PCM_ACCESS_RW_INTERLEAVED,
                             static_cast<unsigned int>(channels), static_cast<unsigned int>(sampleRate),
                             1, ALSA_LATENCY_US);
    if (err < 0) {
        std::cerr << "[Audio] ALSA configure failed: " << snd_strerror(err) << "\n";
        snd_pcm_close(m_alsaPcm);
        m_alsaPcm = nullptr;
        return false;
    }
    if (m_verboseLogging) {
        std::cerr << "[Audio] ALSA device '" << deviceName << "' @ " << sampleRate << " Hz\n";
    }
    return true;
#else
    (void)sampleRate;
    (void)channels;
    std::cerr << "[Audio] ALSA output not available in this build (enable STAND_ENABLE_ALSA)\n";
    return false;
#endif
}

bool AudioOutput::writeAlsa(const float* samples, size_t frames) {
#if defined(__linux__) && defined(STAND_HAS_ALSA)
    if (!m_alsaPcm) {
        return false;
    }
    size_t offset = 0;
    while (offset < frames) {
        const snd_pcm_sframes_t written = snd_pcm_writei(
            m_alsaPcm, samples + offset * static_cast<size_t>(m_channels),
            static_cast<snd_pcm_uframes_t>(frames - offset));
        if (written < 0) {
            const int err = snd_pcm_recover(m_alsaPcm, static_cast<int>(written), 1);
            if (err < 0) {
                std::cerr << "[Audio] ALSA write failed: " << snd_strerror(err) << "\n";
                return false;
            }
            if (m_verboseLogging) {
                std::cerr << "[Audio] ALSA underrun recovered\n";
            }
            continue;
        }
        offset += static_cast<size_t>(written);
    }
    return true;
#else
    (void)samples;
    (void)frames;
    return false;
#endif
}

void AudioOutput::closeAlsa(bool discardPending) {
#if defined(__linux__) && defined(STAND_HAS_ALSA)
    if (m_alsaPcm) {
        if (discardPending) {
            snd_pcm_drop(m_alsaPcm);
        } else {
            snd_pcm_drain(m_alsaPcm);
        }
        snd_pcm_close(m_alsaPcm);
        m_alsaPcm = nullptr;
    }
#else
    (void)discardPending;
#endif
}
