#include "trigger_log.h"

#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

TriggerLog::TriggerLog(std::string path)
    : m_path(std::move(path)) {
}

bool TriggerLog::append(double frequency) {
    return append(std::chrono::system_clock::now(), frequency);
}

bool TriggerLog::append(std::chrono::system_clock::time_point when, double frequency) {
    const std::string line = formatEntry(when, frequency);
    std::lock_guard<std::mutex> lock(m_mutex);
    std::ofstream out(m_path, std::ios::app);
    if (!out) {
        std::cerr << "[IR] cannot open log file " << m_path << "\n";
        return false;
    }
    out << line;
    out.flush();
    if (!out) {
        std::cerr << "[IR] failed to write log file " << m_path << "\n";
        return false;
    }
    return true;
}

std::string TriggerLog::formatEntry(std::chrono::system_clock::time_point when, double frequency) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);
    char line[96];
    std::snprintf(line, sizeof(line), "%s: %.1f\n", stamp, frequency);
    return line;
}

bool TriggerLog::parseLine(const std::string& line, LogEntry& out) {
    // The timestamp itself contains ':' so split on the last ": ".
    const size_t sep = line.rfind(": ");
    if (sep == std::string::npos || sep == 0) {
        return false;
    }
    const std::string value = line.substr(sep + 2);
    try {
        size_t used = 0;
        const double frequency = std::stod(value, &used);
        for (size_t i = used; i < value.size(); i++) {
            if (value[i] != '\r' && value[i] != '\n' && value[i] != ' ') {
                return false;
            }
        }
        out.timestamp = line.substr(0, sep);
        out.frequency = frequency;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::vector<LogEntry> TriggerLog::readEntries(const std::string& path) {
    std::vector<LogEntry> entries;
    std::ifstream in(path);
    if (!in) {
        return entries;
    }
    std::string line;
    while (std::getline(in, line)) {
        LogEntry entry;
        if (parseLine(line, entry)) {
            entries.push_back(entry);
        }
    }
    return entries;
}
