#ifndef WORKER_MANAGER_H
#define WORKER_MANAGER_H

#include <chrono>
#include <mutex>
#include <vector>

#include "actuator_link.h"
#include "config.h"
#include "execution_state.h"
#include "ir_worker.h"
#include "loop_worker.h"
#include "run_signals.h"
#include "tone_engine.h"

// Owns the loop/IR worker pair and the signals they share. At most one run
// is active; starting a new one stops the previous run first.
class WorkerManager {
public:
  static constexpr std::chrono::milliseconds LOOP_JOIN_TIMEOUT{5000};
  static constexpr std::chrono::milliseconds IR_JOIN_TIMEOUT{2000};

  WorkerManager(ConfigStore &config, ExecutionStateMachine &stateMachine, ToneEngine &toneEngine,
                ActuatorLink &link, bool verboseLogging = true);
  ~WorkerManager();

  WorkerManager(const WorkerManager &) = delete;
  WorkerManager &operator=(const WorkerManager &) = delete;

  // Returns false without starting when a previous worker could not be joined.
  bool start(const RunPlan &plan);
  // Returns false when a worker did not exit within its join timeout.
  bool stop(bool saveProgress);
  // Waits for a run to end on its own, without raising the stop signal.
  bool waitForCompletion(std::chrono::milliseconds timeout);

  bool isRunning() const;
  std::vector<double> loopHistory() const { return m_loop.history(); }
  std::vector<double> missedFrequencies() const { return m_misses.run().sorted(); }
  std::vector<double> retryBacklog() const { return m_misses.backlog().sorted(); }
  RunOutcome lastOutcome() const { return m_loop.lastOutcome(); }
  size_t actuationCount() const { return m_ir.actuationCount(); }

private:
  bool stopLocked(bool saveProgress);

  StopSignal m_stop;
  TriggerSignal m_trigger;
  MissLedger m_misses;
  LoopWorker m_loop;
  IRWorker m_ir;
  bool m_verboseLogging;

  std::mutex m_lifecycleMutex;
  std::chrono::milliseconds m_loopJoinTimeout;
  std::chrono::milliseconds m_irJoinTimeout;
};

#endif
