#ifndef LOOP_WORKER_H
#define LOOP_WORKER_H

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <vector>

#include "config.h"
#include "execution_state.h"
#include "frequency_step.h"
#include "run_signals.h"
#include "tone_engine.h"
#include "worker_thread.h"

enum class RunOutcome { None = 0, Completed = 1, Capped = 2, Stopped = 3, Aborted = 4 };

const char *runOutcomeName(RunOutcome outcome);

// Plays one tone per step and arms the trigger for the IR worker. In sweep
// mode the next frequency is read from and written back to loop.current_frequency
// so a run can be resumed after a restart.
class LoopWorker {
public:
  static constexpr size_t HISTORY_SIZE = 10;

  LoopWorker(ConfigStore &config, ExecutionStateMachine &stateMachine, ToneEngine &toneEngine,
             StopSignal &stop, TriggerSignal &trigger, MissLedger &misses, bool verboseLogging);

  bool start(const RunPlan &plan);
  // Raises the stop signal. With saveProgress false the persisted progress
  // is left as it was at the last completed step.
  void requestStop(bool saveProgress);

  bool joinFor(std::chrono::milliseconds timeout) { return m_thread.joinFor(timeout); }
  void join() { m_thread.join(); }
  bool isRunning() const { return m_thread.isRunning(); }
  bool joinable() const { return m_thread.joinable(); }

  std::vector<double> history() const;
  RunOutcome lastOutcome() const { return m_outcome.load(); }

private:
  void run(const RunPlan &plan);
  RunOutcome runSteps(const RunPlan &plan);
  void remember(double frequency);
  void persistProgress(double nextFrequency);
  void finish(RunOutcome outcome);

  ConfigStore &m_config;
  ExecutionStateMachine &m_stateMachine;
  ToneEngine &m_toneEngine;
  StopSignal &m_stop;
  TriggerSignal &m_trigger;
  MissLedger &m_misses;
  bool m_verboseLogging;

  WorkerThread m_thread;
  mutable std::mutex m_historyMutex;
  std::deque<double> m_history;
  std::atomic<RunOutcome> m_outcome;
  std::atomic<bool> m_saveProgress;
};

#endif
