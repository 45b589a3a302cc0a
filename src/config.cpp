#include "config.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {
struct DefaultEntry {
    const char* section;
    const char* key;
    const char* value;
};

const DefaultEntry kDefaults[] = {
    {"serial", "port", "/dev/ttyUSB0"},
    {"serial", "baudrate", "115200"},
    {"commands", "ir_engage", "!r\\n"},
    {"sound", "frequency", "440"},
    {"sound", "duration", "1.0"},
    {"sound", "sample_rate", "44100"},
    {"sound", "amplitude", "0.5"},
    {"sound", "fade_seconds", "0.05"},
    {"sound", "backend", "portaudio"},
    {"sound", "device", ""},
    {"sound", "wav_file", "stand.wav"},
    {"sweep", "max_frequency", "150.0"},
    {"sweep", "duration", "60.0"},
    {"sweep", "fade_seconds", "2.0"},
    {"loop", "start_frequency", "1.0"},
    {"loop", "current_frequency", "1.0"},
    {"loop", "max_frequency", "150.0"},
    {"loop", "step", "0.25"},
    {"loop", "duration", "1.0"},
    {"loop", "ir_delay", "10.0"},
    {"loop", "loop_sleep", "5.0"},
    {"loop", "max_loops_per_run", "250"},
    {"loop", "log_file", "stand.log"},
    {"fetch", "output_dir", "./videos"},
    {"fetch", "tolerance", "10"},
    {"debug", "log_level", "1"},
};

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

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}


bool parseInt(const std::string& raw, int& out) {
    try {
        const std::string t = trim(raw);
        size_t idx = 0;
        const int value = std::stoi(t, &idx);
        if (idx != t.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseDouble(const std::string& raw, double& out) {
    try {
        const std::string t = trim(raw);
        size_t idx = 0;
        const double value = std::stod(t, &idx);
        if (idx != t.size() || !std::isfinite(value)) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

void warnInvalid(const std::string& section, const std::string& key,
                 const std::string& value, const std::string& fallback) {
    std::cerr << "[Config] invalid value " << section << "." << key << "='" << value
              << "', using " << fallback << "\n";
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
}  // namespace

ConfigStore::ConfigStore(std::string path)
    : m_path(std::move(path))
    , m_loaded(false) {
}

void ConfigStore::loadDefaults() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sections.clear();
    for (const auto& entry : kDefaults) {
        m_sections[entry.section][entry.key] = entry.value;
    }
}

bool ConfigStore::load() {
    std::ifstream file(m_path);
    if (!file.is_open()) {
        loadDefaults();
        if (!save()) {
            return false;
        }
        std::cout << "[Config] created default config: " << m_path << "\n";
        std::lock_guard<std::mutex> lock(m_mutex);
        m_loaded = true;
        return true;
    }

    if (!parseFile(file)) {
        return false;
    }
    std::cout << "[Config] loaded: " << m_path << "\n";
    std::lock_guard<std::mutex> lock(m_mutex);
    m_loaded = true;
    return true;
}

bool ConfigStore::parseFile(std::istream& in) {
    std::map<std::string, std::map<std::string, std::string>> parsed;
    std::string section;
    std::string line;
    int lineNo = 0;

    while (std::getline(in, line)) {
        lineNo++;

        line = trim(line);
        if (line.empty() || line.front() == '#' || line.front() == ';') {
            continue;
        }

        if (line.front() == '[' && line.back() == ']') {
            section = toLower(trim(line.substr(1, line.size() - 2)));
            parsed[section];
            continue;
        }

        const size_t equalsPos = line.find('=');
        if (equalsPos == std::string::npos || section.empty()) {
            std::cerr << "[Config] parse warning (" << m_path << ":" << lineNo
                      << "): expected key = value inside a [section]\n";
            continue;
        }

        const std::string key = toLower(trim(line.substr(0, equalsPos)));
        parsed[section][key] = trim(line.substr(equalsPos + 1));
    }

    if (in.bad()) {
        std::cerr << "[Config] failed reading " << m_path << "\n";
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_sections = std::move(parsed);
    return true;
}

bool ConfigStore::save() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string tmpPath = m_path + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[Config] cannot write " << tmpPath << "\n";
            return false;
        }
        for (const auto& section : m_sections) {
            out << "[" << section.first << "]\n";
            for (const auto& kv : section.second) {
                out << kv.first << " = " << kv.second << "\n";
            }
            out << "\n";
        }
        out.flush();
        if (!out) {
            std::cerr << "[Config] write failed: " << tmpPath << "\n";
            return false;
        }
    }
    if (std::rename(tmpPath.c_str(), m_path.c_str()) != 0) {
        std::cerr << "[Config] cannot replace " << m_path << "\n";
        std::remove(tmpPath.c_str());
        return false;
    }
    return true;
}

std::string ConfigStore::rawValue(const std::string& section, const std::string& key, bool& found) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    found = false;
    const auto sectionIt = m_sections.find(toLower(section));
    if (sectionIt == m_sections.end()) {
        return std::string();
    }
    const auto keyIt = sectionIt->second.find(toLower(key));
    if (keyIt == sectionIt->second.end()) {
        return std::string();
    }
    found = true;
    return keyIt->second;
}

std::string ConfigStore::getString(const std::string& section, const std::string& key,
                                   const std::string& fallback) const {
    bool found = false;
    std::string value = rawValue(section, key, found);
    return found ? value : fallback;
}

int ConfigStore::getInt(const std::string& section, const std::string& key, int fallback) const {
    bool found = false;
    const std::string value = rawValue(section, key, found);
    if (!found) {
        return fallback;
    }
    int parsed = 0;
    if (!parseInt(value, parsed)) {
        warnInvalid(section, key, value, std::to_string(fallback));
        return fallback;
    }
    return parsed;
}

double ConfigStore::getDouble(const std::string& section, const std::string& key, double fallback) const {
    bool found = false;
    const std::string value = rawValue(section, key, found);
    if (!found) {
        return fallback;
    }
    double parsed = 0.0;
    if (!parseDouble(value, parsed)) {
        warnInvalid(section, key, value, formatNumber(fallback));
        return fallback;
    }
    return parsed;
}

void ConfigStore::set(const std::string& section, const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sections[toLower(trim(section))][toLower(trim(key))] = trim(value);
}

void ConfigStore::setDouble(const std::string& section, const std::string& key, double value) {
    set(section, key, formatNumber(value));
}

bool ConfigStore::hasSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sections.find(toLower(section)) != m_sections.end();
}

bool ConfigStore::hasOption(const std::string& section, const std::string& key) const {
    bool found = false;
    rawValue(section, key, found);
    return found;
}

std::vector<std::string> ConfigStore::sections() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_sections.size());
    for (const auto& section : m_sections) {
        names.push_back(section.first);
    }
    return names;
}

std::vector<std::pair<std::string, std::string>> ConfigStore::items(const std::string& section) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::pair<std::string, std::string>> out;
    const auto it = m_sections.find(toLower(section));
    if (it != m_sections.end()) {
        out.assign(it->second.begin(), it->second.end());
    }
    return out;
}

bool ConfigStore::isLoaded() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_loaded;
}

RunConfig ConfigStore::snapshotRunConfig() const {
    const RunConfig defaults;
    RunConfig cfg;

    const int sampleRate = getInt("sound", "sample_rate", defaults.sample_rate);
    cfg.sample_rate = (sampleRate >= 8000 && sampleRate <= 192000) ? sampleRate : defaults.sample_rate;

    const double amplitude = getDouble("sound", "amplitude", defaults.amplitude);
    cfg.amplitude = static_cast<float>(std::clamp(amplitude, 0.0, 0.8));

    const double fade = getDouble("sound", "fade_seconds", defaults.fade_seconds);
    cfg.fade_seconds = fade >= 0.0 ? fade : defaults.fade_seconds;

    const double startFreq = getDouble("loop", "start_frequency", defaults.start_frequency);
    cfg.start_frequency = startFreq > 0.0 ? startFreq : defaults.start_frequency;

    const double maxFreq = getDouble("loop", "max_frequency", defaults.max_frequency);
    cfg.max_frequency = maxFreq > 0.0 ? maxFreq : defaults.max_frequency;

    const double step = getDouble("loop", "step", defaults.step);
    cfg.step = step > 0.0 ? step : defaults.step;

    const double duration = getDouble("loop", "duration", defaults.tone_duration);
    cfg.tone_duration = duration > 0.0 ? duration : defaults.tone_duration;

    const double irDelay = getDouble("loop", "ir_delay", defaults.ir_delay);
    cfg.ir_delay = irDelay >= 0.0 ? irDelay : defaults.ir_delay;

    const double sleep = getDouble("loop", "loop_sleep", defaults.post_sleep);
    cfg.post_sleep = sleep >= 0.0 ? sleep : defaults.post_sleep;

    const int maxSteps = getInt("loop", "max_loops_per_run", defaults.max_steps_per_run);
    cfg.max_steps_per_run = maxSteps > 0 ? maxSteps : defaults.max_steps_per_run;

    const std::string logFile = getString("loop", "log_file", defaults.log_file);
    cfg.log_file = logFile.empty() ? defaults.log_file : logFile;

    cfg.actuation_command = actuationCommand();
    return cfg;
}

std::string ConfigStore::serialPort() const {
    return getString("serial", "port", "/dev/ttyUSB0");
}

int ConfigStore::baudrate() const {
    const int baud = getInt("serial", "baudrate", 115200);
    return baud > 0 ? baud : 115200;
}

std::string ConfigStore::actuationCommand() const {
    const std::string decoded = unescape(getString("commands", "ir_engage", "!r\\n"));
    return decoded.empty() ? std::string("!r\n") : decoded;
}

bool ConfigStore::verboseLogging() const {
    return getInt("debug", "log_level", 1) > 0;
}

std::string ConfigStore::formatNumber(double value) {
    const double rounded = std::round(value * 1e6) / 1e6;
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.6f", rounded);
    std::string text(buffer);
    const size_t dot = text.find('.');
    if (dot != std::string::npos) {
        size_t end = text.size();
        while (end > dot + 2 && text[end - 1] == '0') {
            end--;
        }
        text.erase(end);
    }
    if (text == "-0.0") {
        text = "0.0";
    }
    return text;
}

std::string ConfigStore::unescape(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); i++) {
        const char c = raw[i];
        if (c != '\\' || i + 1 >= raw.size()) {
            out.push_back(c);
            continue;
        }
        const char next = raw[++i];
        switch (next) {
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case '0':
                out.push_back('\0');
                break;
            case '\\':
                out.push_back('\\');
                break;
            case 'x': {
                const int hi = (i + 1 < raw.size()) ? hexDigit(raw[i + 1]) : -1;
                const int lo = (i + 2 < raw.size()) ? hexDigit(raw[i + 2]) : -1;
                if (hi >= 0 && lo >= 0) {
                    out.push_back(static_cast<char>(hi * 16 + lo));
                    i += 2;
                } else {
                    out += "\\x";
                }
                break;
            }
            default:
                out.push_back('\\');
                out.push_back(next);
                break;
        }
    }
    return out;
}
