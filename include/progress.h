#ifndef PROGRESS_H
#define PROGRESS_H

#include <chrono>
#include <cstddef>
#include <string>

// Two decimals, as frequencies appear in every status line.
std::string formatHz(double frequency);

// "MM:SS", or "H:MM:SS" past an hour. Negative values give "--:--".
std::string formatDuration(double seconds);

// "Run: 3/250 (20:45 remaining, ends at 14:05) | Total: 596 left (...)"
std::string formatRunProgress(double frequency, int stepCount, double maxFrequency, double step,
                              double toneDuration, double postSleep, int maxStepsPerRun,
                              std::chrono::system_clock::time_point now =
                                  std::chrono::system_clock::now());

// "Rerun: 2/14 (01:12 remaining, ends at 14:05)"
std::string formatRerunProgress(size_t index, size_t total, double toneDuration, double postSleep,
                                std::chrono::system_clock::time_point now =
                                    std::chrono::system_clock::now());

#endif
