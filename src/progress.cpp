#include "progress.h"

#include <cstdio>
#include <ctime>

namespace {
std::string clockTime(std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M", &local);
    return buf;
}

std::chrono::system_clock::time_point after(std::chrono::system_clock::time_point now, double seconds) {
    return now + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                     std::chrono::duration<double>(seconds));
}
}  // namespace

std::string formatHz(double frequency) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", frequency);
    return buf;
}

std::string formatDuration(double seconds) {
    if (seconds < 0.0) {
        return "--:--";
    }
    const long total = static_cast<long>(seconds);
    const long hours = total / 3600;
    const long minutes = (total % 3600) / 60;
    const long secs = total % 60;
    char buf[32];
    if (hours > 0) {
        std::snprintf(buf, sizeof(buf), "%ld:%02ld:%02ld", hours, minutes, secs);
    } else {
        std::snprintf(buf, sizeof(buf), "%02ld:%02ld", minutes, secs);
    }
    return buf;
}

std::string formatRunProgress(double frequency, int stepCount, double maxFrequency, double step,
                              double toneDuration, double postSleep, int maxStepsPerRun,
                              std::chrono::system_clock::time_point now) {
    const double perStep = toneDuration + postSleep;
    const int leftInRun = maxStepsPerRun - stepCount;
    int leftTotal = 0;
    if (step > 0.0 && maxFrequency >= frequency) {
        leftTotal = static_cast<int>((maxFrequency - frequency) / step) + 1;
    }
    const double runSeconds = leftInRun * perStep;
    const double totalSeconds = leftTotal * perStep;

    std::string line = "Run: " + std::to_string(stepCount) + "/" + std::to_string(maxStepsPerRun);
    line += " (" + formatDuration(runSeconds) + " remaining, ends at " + clockTime(after(now, runSeconds)) + ")";
    line += " | Total: " + std::to_string(leftTotal) + " left";
    line += " (" + formatDuration(totalSeconds) + " remaining, ends at " + clockTime(after(now, totalSeconds)) + ")";
    return line;
}

std::string formatRerunProgress(size_t index, size_t total, double toneDuration, double postSleep,
                                std::chrono::system_clock::time_point now) {
    const size_t remaining = total > index ? total - index : 0;
    const double seconds = static_cast<double>(remaining) * (toneDuration + postSleep);
    std::string line = "Rerun: " + std::to_string(index + 1) + "/" + std::to_string(total);
    line += " (" + formatDuration(seconds) + " remaining, ends at " + clockTime(after(now, seconds)) + ")";
    return line;
}
