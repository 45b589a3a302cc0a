#include "missing_frequency.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <regex>

#include "progress.h"
#include "trigger_log.h"

std::set<double> MissingFrequencyAnalyzer::expected(double start, double end, double step) {
    std::set<double> out;
    for (double frequency : generateRangeFrequencies(start, end, step)) {
        out.insert(roundFrequency(frequency));
    }
    return out;
}

bool MissingFrequencyAnalyzer::parseCaptureName(const std::string& filename, double& frequency) {
    static const std::regex pattern(R"(^(\d+(?:\.\d+)?)[-_])");
    std::smatch match;
    if (!std::regex_search(filename, match, pattern)) {
        return false;
    }
    try {
        frequency = roundFrequency(std::stod(match[1].str()));
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

std::set<double> MissingFrequencyAnalyzer::captured(const std::string& directory) {
    namespace fs = std::filesystem;
    std::set<double> out;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        std::cerr << "[Missing] capture directory " << directory << " does not exist\n";
        return out;
    }
    fs::directory_iterator it(directory, ec);
    if (ec) {
        std::cerr << "[Missing] cannot read " << directory << ": " << ec.message() << "\n";
        return out;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            std::cerr << "[Missing] error while listing " << directory << ": " << ec.message() << "\n";
            break;
        }
        double frequency = 0.0;
        if (parseCaptureName(it->path().filename().string(), frequency)) {
            out.insert(frequency);
        }
    }
    return out;
}

std::set<double> MissingFrequencyAnalyzer::logged(const std::string& logFile, const std::set<double>& expected) {
    const double window = LOG_MATCH_TOLERANCE + kFrequencyEpsilon;
    std::set<double> out;
    for (const LogEntry& entry : TriggerLog::readEntries(logFile)) {
        const double frequency = entry.frequency;
        double nearest = roundFrequency(frequency);
        double bestDistance = window;
        for (auto it = expected.lower_bound(frequency - window);
             it != expected.end() && *it <= frequency + window; ++it) {
            const double distance = std::fabs(*it - frequency);
            if (distance <= bestDistance) {
                bestDistance = distance;
                nearest = *it;
            }
        }
        out.insert(nearest);
    }
    return out;
}

std::vector<double> MissingFrequencyAnalyzer::missing(const std::set<double>& expected,
                                                      const std::set<double>& found) {
    std::vector<double> out;
    std::set_difference(expected.begin(), expected.end(), found.begin(), found.end(),
                        std::back_inserter(out));
    return out;
}

std::vector<FrequencyStep> MissingFrequencyAnalyzer::buildRerunSteps(const std::vector<double>& missing,
                                                                     const RunConfig& config, size_t limit) {
    std::vector<FrequencyStep> steps;
    const size_t count = std::min(limit, missing.size());
    steps.reserve(count);
    for (size_t i = 0; i < count; i++) {
        steps.push_back(FrequencyStep::fromConfig(missing[i], config));
    }
    return steps;
}

std::string MissingFrequencyAnalyzer::formatRanges(const std::vector<double>& frequencies, double step) {
    if (frequencies.empty()) {
        return "";
    }
    std::vector<std::string> ranges;
    double first = frequencies.front();
    double prev = first;
    auto flush = [&]() {
        ranges.push_back(first == prev ? formatHz(first) : formatHz(first) + "-" + formatHz(prev));
    };
    for (size_t i = 1; i < frequencies.size(); i++) {
        const double frequency = frequencies[i];
        if (std::fabs(frequency - prev - step) < 1.0 / kFrequencyScale) {
            prev = frequency;
            continue;
        }
        flush();
        first = frequency;
        prev = frequency;
    }
    flush();

    std::string out;
    const size_t shown = std::min(ranges.size(), MAX_RANGES_SHOWN);
    for (size_t i = 0; i < shown; i++) {
        if (i > 0) {
            out += ", ";
        }
        out += ranges[i];
    }
    if (ranges.size() > MAX_RANGES_SHOWN) {
        out += " ...";
    }
    return out;
}
