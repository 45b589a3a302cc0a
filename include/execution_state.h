#ifndef EXECUTION_STATE_H
#define EXECUTION_STATE_H

#include <functional>
#include <mutex>
#include <string>
#include <vector>

enum class ExecutionState { Idle = 0, Ready = 1, Running = 2, Paused = 3, Stopped = 4 };

enum class Trigger { Initialize = 0, Start = 1, Pause = 2, Resume = 3, Stop = 4, Reset = 5 };

const char *executionStateName(ExecutionState state);
const char *triggerName(Trigger trigger);

class ExecutionStateMachine {
public:
  using EntryHook = std::function<void(ExecutionState state)>;

  ExecutionStateMachine();

  // Each returns false (state unchanged, lastError() set) when the current
  // state has no such trigger.
  bool initialize() { return fire(Trigger::Initialize); }
  bool start() { return fire(Trigger::Start); }
  bool pause() { return fire(Trigger::Pause); }
  bool resume() { return fire(Trigger::Resume); }
  bool stop() { return fire(Trigger::Stop); }
  bool reset() { return fire(Trigger::Reset); }
  bool fire(Trigger trigger);

  ExecutionState currentState() const;
  std::vector<Trigger> legalTriggers() const;
  static std::vector<Trigger> legalTriggers(ExecutionState state);
  static bool nextState(ExecutionState from, Trigger trigger, ExecutionState &to);

  void setEntryHook(EntryHook hook);
  std::string lastError() const;

private:
  mutable std::mutex m_mutex;
  ExecutionState m_state;
  EntryHook m_entryHook;
  std::string m_lastError;
};

#endif
