#ifndef FREQUENCY_STEP_H
#define FREQUENCY_STEP_H

#include <utility>
#include <vector>

#include "config.h"

struct FrequencyStep {
  double frequency = 0.0;
  double tone_duration = 0.0;
  double post_sleep = 0.0;
  double ir_delay = 0.0;

  static FrequencyStep fromConfig(double frequency, const RunConfig &config) {
    return FrequencyStep{frequency, config.tone_duration, config.post_sleep, config.ir_delay};
  }
};

enum class RunMode { Sweep = 0, Rerun = 1 };

// Sweep plans carry no steps: frequencies come from loop.current_frequency.
struct RunPlan {
  RunMode mode = RunMode::Sweep;
  RunConfig config;
  std::vector<FrequencyStep> steps;
  bool save_progress = true;

  static RunPlan sweep(const RunConfig &config, bool saveProgress) {
    RunPlan plan;
    plan.mode = RunMode::Sweep;
    plan.config = config;
    plan.save_progress = saveProgress;
    return plan;
  }

  static RunPlan rerun(const RunConfig &config, std::vector<FrequencyStep> steps) {
    RunPlan plan;
    plan.mode = RunMode::Rerun;
    plan.config = config;
    plan.steps = std::move(steps);
    plan.save_progress = false;
    return plan;
  }
};

// Tolerance on the closed upper bound of a lattice.
constexpr double kFrequencyEpsilon = 1e-6;
// Frequencies are compared as set members at 0.01 Hz resolution.
constexpr double kFrequencyScale = 100.0;

double roundFrequency(double frequency);

// Closed lattice start + i*step, i = 0.. while the value stays <= end.
std::vector<double> generateRangeFrequencies(double start, double end, double step);

#endif
