#ifndef RUN_SIGNALS_H
#define RUN_SIGNALS_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include "frequency_step.h"

// Level-triggered cancellation shared by both workers of a run.
class StopSignal {
public:
  static constexpr std::chrono::milliseconds POLL_INTERVAL{100};

  StopSignal();

  void set();
  void clear();
  bool isSet() const { return m_flag.load(); }

  // Sleeps in slices of at most POLL_INTERVAL. Returns false if the signal
  // was raised before the full duration elapsed.
  bool sleepFor(std::chrono::duration<double> duration) const;

private:
  std::atomic<bool> m_flag;
  mutable std::mutex m_mutex;
  mutable std::condition_variable m_cv;
};

// One-shot handoff of the current step from the loop worker to the IR worker.
class TriggerSignal {
public:
  TriggerSignal();

  // Arms the trigger. Returns the step that was still pending, if any.
  std::optional<FrequencyStep> set(const FrequencyStep &step);

  // Blocks until a step is pending, the trigger is closed with nothing
  // pending, or stop is raised. Consumes and clears the pending step.
  std::optional<FrequencyStep> waitAndConsume(const StopSignal &stop);

  std::optional<FrequencyStep> takePending();

  // No further set() calls for this run; lets a waiting consumer drain.
  void close();
  void reset();
  void wake();

private:
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::optional<FrequencyStep> m_pending;
  bool m_closed;
};

class MissedSet {
public:
  void add(double frequency);
  bool remove(double frequency);
  void clear();
  std::vector<double> sorted() const;

private:
  mutable std::mutex m_mutex;
  std::set<double> m_frequencies;
};

// Misses of the current run plus the retry backlog, which outlives runs
// until a later actuation of the same frequency succeeds.
class MissLedger {
public:
  void record(double frequency);
  void resolve(double frequency);
  void beginRun() { m_run.clear(); }

  const MissedSet &run() const { return m_run; }
  const MissedSet &backlog() const { return m_backlog; }

private:
  MissedSet m_run;
  MissedSet m_backlog;
};

#endif
