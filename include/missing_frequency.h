#ifndef MISSING_FREQUENCY_H
#define MISSING_FREQUENCY_H

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include "config.h"
#include "frequency_step.h"

// Reconciles the frequency lattice of a sweep against what was actually
// captured, logged or missed, and turns the difference into a rerun plan.
// All sets hold frequencies rounded to 0.01 Hz.
class MissingFrequencyAnalyzer {
public:
  static constexpr size_t MAX_LISTED = 20;
  static constexpr size_t MAX_RANGES_SHOWN = 10;
  // Half the resolution of the trigger log's one-decimal frequencies.
  static constexpr double LOG_MATCH_TOLERANCE = 0.05;

  static std::set<double> expected(double start, double end, double step);
  // Frequencies parsed from file names such as "0012.50-20240101_120000.mp4".
  // Only names are read. A missing directory gives an empty set.
  static std::set<double> captured(const std::string &directory);
  // Each logged frequency is mapped to the nearest expected one within
  // LOG_MATCH_TOLERANCE; values with no such neighbour are kept as read.
  static std::set<double> logged(const std::string &logFile, const std::set<double> &expected);
  static std::vector<double> missing(const std::set<double> &expected, const std::set<double> &found);

  // First `limit` frequencies, timings from the config snapshot.
  static std::vector<FrequencyStep> buildRerunSteps(const std::vector<double> &missing,
                                                    const RunConfig &config, size_t limit);

  // "1.00-2.50, 7.25, 9.00-9.50" with at most MAX_RANGES_SHOWN groups; a
  // trailing " ..." marks truncation.
  static std::string formatRanges(const std::vector<double> &frequencies, double step);

  static bool parseCaptureName(const std::string &filename, double &frequency);
};

#endif
