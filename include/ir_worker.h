#ifndef IR_WORKER_H
#define IR_WORKER_H

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include "actuator_link.h"
#include "config.h"
#include "run_signals.h"
#include "trigger_log.h"
#include "worker_thread.h"

// Fires the actuation command ir_delay seconds after each trigger and logs
// the frequency carried by that trigger. Failures are recorded as misses
// and never end the worker.
class IRWorker {
public:
  IRWorker(ActuatorLink &link, StopSignal &stop, TriggerSignal &trigger, MissLedger &misses,
           bool verboseLogging);

  bool start(const RunConfig &config);

  bool joinFor(std::chrono::milliseconds timeout) { return m_thread.joinFor(timeout); }
  void join() { m_thread.join(); }
  bool isRunning() const { return m_thread.isRunning(); }
  bool joinable() const { return m_thread.joinable(); }

  size_t actuationCount() const { return m_actuations.load(); }

private:
  void run(const RunConfig &config);
  void actuate(const FrequencyStep &step, const std::string &command, TriggerLog &log);

  ActuatorLink &m_link;
  StopSignal &m_stop;
  TriggerSignal &m_trigger;
  MissLedger &m_misses;
  bool m_verboseLogging;

  WorkerThread m_thread;
  std::atomic<size_t> m_actuations;
};

#endif
