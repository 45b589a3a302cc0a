#include <iostream>
#include <csignal>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <thread>

#include <poll.h>
#include <unistd.h>

#include "actuator_link.h"
#include "audio_backend.h"
#include "audio_output.h"
#include "config.h"
#include "execution_state.h"
#include "stand_controller.h"
#include "tone_engine.h"
#include "worker_manager.h"

#ifndef STAND_VERSION
#define STAND_VERSION "dev"
#endif

static std::atomic<bool> g_running(true);

namespace {
constexpr int STDIN_POLL_MS = 100;

// Line reader on fd 0 that gives up when g_running drops, so Ctrl+C at the
// prompt ends the shell without waiting for another line.
class StdinLineReader {
public:
    enum class Status { Line, Eof, Interrupted };

    Status next(std::string& line) {
        while (true) {
            const size_t newline = m_buffer.find('\n');
            if (newline != std::string::npos) {
                line = m_buffer.substr(0, newline);
                m_buffer.erase(0, newline + 1);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                return Status::Line;
            }
            if (m_eof) {
                if (m_buffer.empty()) {
                    return Status::Eof;
                }
                line.swap(m_buffer);
                m_buffer.clear();
                return Status::Line;
            }
            if (!g_running) {
                return Status::Interrupted;
            }

            pollfd pfd{};
            pfd.fd = STDIN_FILENO;
            pfd.events = POLLIN;
            const int ready = poll(&pfd, 1, STDIN_POLL_MS);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                std::cerr << "[CLI] poll on stdin failed: " << std::strerror(errno) << "\n";
                m_eof = true;
                continue;
            }
            if (ready == 0) {
                continue;
            }
            char chunk[512];
            const ssize_t n = read(STDIN_FILENO, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                std::cerr << "[CLI] read from stdin failed: " << std::strerror(errno) << "\n";
                m_eof = true;
                continue;
            }
            if (n == 0) {
                m_eof = true;
                continue;
            }
            m_buffer.append(chunk, static_cast<size_t>(n));
        }
    }

private:
    std::string m_buffer;
    bool m_eof = false;
};
}  // namespace

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>    INI config file (default: stand.conf)\n"
              << "  -p, --port <dev>       Serial port of the IR controller (overrides serial.port)\n"
              << "  -w, --wav <file>       Record tones to a WAV file instead of the sound card\n"
              << "  -l, --list-audio       List available audio output devices\n"
              << "  -h, --help             Show this help\n"
              << "Commands are read from stdin; type 'help' at the prompt.\n";
}

int main(int argc, char* argv[]) {
    std::cout << "Vibration stand version " << STAND_VERSION << "\n";

    std::string configPath = ConfigStore::DEFAULT_PATH;
    std::string portOverride;
    std::string wavOverride;

    auto readValue = [&](int& index, const std::string& current, const std::string& longName) -> std::string {
        const std::string prefix = "--" + longName + "=";
        if (current.rfind(prefix, 0) == 0) {
            return current.substr(prefix.length());
        }
        if (index + 1 < argc) {
            index++;
            return argv[index];
        }
        return std::string();
    };

    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-l" || arg == "--list-audio") {
            if (!AudioOutput::listDevices()) {
                return 1;
            }
            return 0;
        }
        if (arg == "-c" || arg == "--config" || arg.rfind("--config=", 0) == 0) {
            const std::string value = readValue(i, arg, "config");
            if (value.empty()) {
                std::cerr << "[CLI] missing value for --config\n";
                return 1;
            }
            configPath = value;
            continue;
        }
        if (arg == "-p" || arg == "--port" || arg.rfind("--port=", 0) == 0) {
            const std::string value = readValue(i, arg, "port");
            if (value.empty()) {
                std::cerr << "[CLI] missing value for --port\n";
                return 1;
            }
            portOverride = value;
            continue;
        }
        if (arg == "-w" || arg == "--wav" || arg.rfind("--wav=", 0) == 0) {
            const std::string value = readValue(i, arg, "wav");
            if (value.empty()) {
                std::cerr << "[CLI] missing value for --wav\n";
                return 1;
            }
            wavOverride = value;
            continue;
        }

        std::cerr << "[CLI] unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
    }

    ConfigStore config(configPath);
    if (!config.load()) {
        std::cerr << "[Config] could not load " << configPath << ", using defaults\n";
    }
    if (!portOverride.empty()) {
        config.set("serial", "port", portOverride);
    }
    if (!wavOverride.empty()) {
        config.set("sound", "backend", "wav");
        config.set("sound", "wav_file", wavOverride);
    }
    const bool verboseLogging = config.verboseLogging();
    if (verboseLogging) {
        std::cout << "[Config] sound.backend='" << config.getString("sound", "backend", "portaudio") << "'\n";
        std::cout << "[Config] serial.port='" << config.serialPort() << "'\n";
    }

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    std::unique_ptr<IAudioSink> sink = createAudioSink(config.getString("sound", "backend", "portaudio"),
                                                       config.getString("sound", "device", ""),
                                                       config.getString("sound", "wav_file", "stand.wav"),
                                                       verboseLogging);
    ToneEngine toneEngine(*sink, verboseLogging);
    ExecutionStateMachine stateMachine;
    ActuatorLink link;
    WorkerManager workers(config, stateMachine, toneEngine, link, verboseLogging);
    StandController controller(config, stateMachine, link, toneEngine, workers);

    controller.initialize();

    std::atomic<bool> shellDone(false);
    std::thread interruptWatcher([&]() {
        while (g_running && !shellDone) {
            std::this_thread::sleep_for(std::chrono::milliseconds(STDIN_POLL_MS));
        }
        controller.interrupt();
    });

    const bool interactive = isatty(STDIN_FILENO) != 0;
    StdinLineReader reader;
    std::string line;
    while (g_running) {
        if (interactive) {
            std::cout << "stand> " << std::flush;
        }
        const StdinLineReader::Status status = reader.next(line);
        if (status != StdinLineReader::Status::Line) {
            if (status == StdinLineReader::Status::Interrupted) {
                std::cout << "\n";
            }
            break;
        }
        const CommandResult result = controller.execute(line);
        if (!result.message.empty()) {
            if (result.ok) {
                std::cout << result.message << "\n";
            } else {
                std::cerr << result.message << "\n";
            }
        }
        if (result.exit) {
            break;
        }
    }

    shellDone = true;
    interruptWatcher.join();
    controller.shutdown();
    return 0;
}
