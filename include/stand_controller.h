#ifndef STAND_CONTROLLER_H
#define STAND_CONTROLLER_H

#include <string>
#include <vector>

#include "actuator_link.h"
#include "config.h"
#include "execution_state.h"
#include "run_signals.h"
#include "tone_engine.h"
#include "worker_manager.h"

enum class Command {
  Start,
  Pause,
  Resume,
  Stop,
  Reset,
  State,
  Transitions,
  Status,
  Missing,
  Rerun,
  Connect,
  Disconnect,
  Ir,
  Test,
  Sound,
  Sweep,
  Config,
  Set,
  Help,
  Exit,
  Unknown
};

Command parseCommand(const std::string &name);

struct CommandResult {
  bool ok = true;
  std::string message;
  bool exit = false;
};

// Where the missing/rerun commands take their frequency list from.
enum class MissingSource { Captured, Log, Missed };

// Command surface of the interactive shell. Handlers report through the
// returned result and never throw.
class StandController {
public:
  StandController(ConfigStore &config, ExecutionStateMachine &stateMachine, ActuatorLink &link,
                  ToneEngine &toneEngine, WorkerManager &workers);

  // Idle -> Ready and a first connection attempt with the configured port.
  bool initialize();
  CommandResult execute(const std::string &line);
  CommandResult dispatch(Command command, const std::vector<std::string> &args);

  // Cuts a manual sound or sweep short. Safe to call from another thread.
  void interrupt();
  void shutdown();

  static bool parseMissingSource(const std::string &name, MissingSource &out);

private:
  CommandResult handleStart();
  CommandResult handlePause();
  CommandResult handleResume();
  CommandResult handleStop();
  CommandResult handleReset(const std::vector<std::string> &args);
  CommandResult handleState();
  CommandResult handleTransitions();
  CommandResult handleStatus();
  CommandResult handleMissing(const std::vector<std::string> &args);
  CommandResult handleRerun(const std::vector<std::string> &args);
  CommandResult handleConnect(const std::vector<std::string> &args);
  CommandResult handleDisconnect();
  CommandResult handleIr();
  CommandResult handleTest();
  CommandResult handleSound(const std::vector<std::string> &args);
  CommandResult handleSweep(const std::vector<std::string> &args);
  CommandResult handleConfig();
  CommandResult handleSet(const std::vector<std::string> &args);
  CommandResult handleHelp();

  bool collectMissing(MissingSource source, std::vector<double> &out, std::string &summary);
  RenderResult playManual(const stand::dsp::ToneSpec &spec);

  ConfigStore &m_config;
  ExecutionStateMachine &m_stateMachine;
  ActuatorLink &m_link;
  ToneEngine &m_toneEngine;
  WorkerManager &m_workers;
  StopSignal m_manualStop;
};

#endif
