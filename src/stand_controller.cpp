#include "stand_controller.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <utility>

#include "missing_frequency.h"
#include "progress.h"

namespace {
std::string trim(const std::string& value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start])) != 0) {
        start++;
    }
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
        end--;
    }
    return value.substr(start, end - start);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool parseNumber(const std::string& text, double& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') {
        return false;
    }
    out = value;
    return true;
}


CommandResult fail(const std::string& message) {
    CommandResult result;
    result.ok = false;
    result.message = message;
    return result;
}

CommandResult done(const std::string& message) {
    CommandResult result;
    result.message = message;
    return result;
}

const char* sourceName(MissingSource source) {
    switch (source) {
        case MissingSource::Captured:
            return "captured";
        case MissingSource::Log:
            return "log";
        case MissingSource::Missed:
            return "missed";
    }
    return "captured";
}
}  // namespace

Command parseCommand(const std::string& name) {
    const std::string key = toLower(name);
    if (key == "start") return Command::Start;
    if (key == "pause") return Command::Pause;
    if (key == "resume") return Command::Resume;
    if (key == "stop") return Command::Stop;
    if (key == "reset") return Command::Reset;
    if (key == "state") return Command::State;
    if (key == "transitions") return Command::Transitions;
    if (key == "status") return Command::Status;
    if (key == "missing") return Command::Missing;
    if (key == "rerun") return Command::Rerun;
    if (key == "connect") return Command::Connect;
    if (key == "disconnect") return Command::Disconnect;
    if (key == "ir") return Command::Ir;
    if (key == "test") return Command::Test;
    if (key == "sound") return Command::Sound;
    if (key == "sweep") return Command::Sweep;
    if (key == "config") return Command::Config;
    if (key == "set") return Command::Set;
    if (key == "help" || key == "?") return Command::Help;
    if (key == "exit" || key == "quit") return Command::Exit;
    return Command::Unknown;
}

StandController::StandController(ConfigStore& config, ExecutionStateMachine& stateMachine, ActuatorLink& link,
                                 ToneEngine& toneEngine, WorkerManager& workers)
    : m_config(config)
    , m_stateMachine(stateMachine)
    , m_link(link)
    , m_toneEngine(toneEngine)
    , m_workers(workers) {
}

bool StandController::initialize() {
    if (!m_config.isLoaded() && !m_config.load()) {
        std::cerr << "[Config] continuing with built-in defaults\n";
    }
    const bool ready = m_stateMachine.initialize();
    if (!m_link.connect(m_config.serialPort(), m_config.baudrate())) {
        std::cerr << "[Serial] not connected; use 'connect [port] [baud]' to retry\n";
    }
    return ready;
}

bool StandController::parseMissingSource(const std::string& name, MissingSource& out) {
    const std::string key = toLower(name);
    if (key.empty() || key == "captured" || key == "videos") {
        out = MissingSource::Captured;
        return true;
    }
    if (key == "log") {
        out = MissingSource::Log;
        return true;
    }
    if (key == "missed" || key == "failed") {
        out = MissingSource::Missed;
        return true;
    }
    return false;
}

CommandResult StandController::execute(const std::string& line) {
    const std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return done("");
    }
    const size_t split = trimmed.find_first_of(" \t");
    const std::string name = trimmed.substr(0, split);
    const std::string rest = split == std::string::npos ? std::string() : trim(trimmed.substr(split));

    const Command command = parseCommand(name);
    std::vector<std::string> args;
    if (command == Command::Set) {
        const size_t keyEnd = rest.find_first_of(" \t");
        if (!rest.empty()) {
            args.push_back(rest.substr(0, keyEnd));
        }
        if (keyEnd != std::string::npos) {
            args.push_back(trim(rest.substr(keyEnd)));
        }
    } else {
        std::istringstream in(rest);
        std::string token;
        while (in >> token) {
            args.push_back(token);
        }
    }

    if (command == Command::Unknown) {
        return fail("Unknown command: " + name + "\nType 'help' for available commands.");
    }
    try {
        return dispatch(command, args);
    } catch (const std::exception& e) {
        return fail(name + " failed: " + e.what());
    }
}

CommandResult StandController::dispatch(Command command, const std::vector<std::string>& args) {
    switch (command) {
        case Command::Start:
            return handleStart();
        case Command::Pause:
            return handlePause();
        case Command::Resume:
            return handleResume();
        case Command::Stop:
            return handleStop();
        case Command::Reset:
            return handleReset(args);
        case Command::State:
            return handleState();
        case Command::Transitions:
            return handleTransitions();
        case Command::Status:
            return handleStatus();
        case Command::Missing:
            return handleMissing(args);
        case Command::Rerun:
            return handleRerun(args);
        case Command::Connect:
            return handleConnect(args);
        case Command::Disconnect:
            return handleDisconnect();
        case Command::Ir:
            return handleIr();
        case Command::Test:
            return handleTest();
        case Command::Sound:
            return handleSound(args);
        case Command::Sweep:
            return handleSweep(args);
        case Command::Config:
            return handleConfig();
        case Command::Set:
            return handleSet(args);
        case Command::Help:
            return handleHelp();
        case Command::Exit: {
            CommandResult result = done("Goodbye!");
            result.exit = true;
            return result;
        }
        case Command::Unknown:
            break;
    }
    return fail("Unknown command");
}

void StandController::interrupt() {
    m_manualStop.set();
}

void StandController::shutdown() {
    m_manualStop.set();
    m_workers.stop(false);
    m_link.disconnect();
}

CommandResult StandController::handleStart() {
    if (!m_stateMachine.start()) {
        return fail(m_stateMachine.lastError());
    }
    if (!m_workers.start(RunPlan::sweep(m_config.snapshotRunConfig(), true))) {
        m_stateMachine.stop();
        return fail("could not start the sweep workers");
    }
    return done("Sweep started at " + formatHz(m_config.getDouble("loop", "current_frequency", 0.0)) + " Hz");
}

CommandResult StandController::handlePause() {
    if (m_stateMachine.currentState() != ExecutionState::Running) {
        return fail(std::string("cannot pause from '") + executionStateName(m_stateMachine.currentState()) + "'");
    }
    m_workers.stop(false);
    if (!m_stateMachine.pause()) {
        return fail(m_stateMachine.lastError());
    }
    return done("Paused at " + formatHz(m_config.getDouble("loop", "current_frequency", 0.0)) + " Hz");
}

CommandResult StandController::handleResume() {
    if (!m_stateMachine.resume()) {
        return fail(m_stateMachine.lastError());
    }
    if (!m_workers.start(RunPlan::sweep(m_config.snapshotRunConfig(), true))) {
        m_stateMachine.stop();
        return fail("could not restart the sweep workers");
    }
    return done("Resumed at " + formatHz(m_config.getDouble("loop", "current_frequency", 0.0)) + " Hz");
}

CommandResult StandController::handleStop() {
    const ExecutionState state = m_stateMachine.currentState();
    if (state != ExecutionState::Running && state != ExecutionState::Paused) {
        return fail(std::string("cannot stop from '") + executionStateName(state) + "'");
    }
    m_workers.stop(false);
    if (!m_stateMachine.stop()) {
        return fail(m_stateMachine.lastError());
    }
    return done("Stopped");
}

CommandResult StandController::handleReset(const std::vector<std::string>& args) {
    const bool resetProgress = !args.empty() && toLower(args[0]) == "progress";
    if (!args.empty() && !resetProgress) {
        return fail("Usage: reset [progress]");
    }
    m_workers.stop(false);
    m_stateMachine.reset();
    if (!resetProgress) {
        return done("Reset to idle");
    }
    const double start = m_config.getDouble("loop", "start_frequency", RunConfig().start_frequency);
    m_config.setDouble("loop", "current_frequency", start);
    if (!m_config.save()) {
        return fail("Reset to idle, but the progress reset could not be saved");
    }
    return done("Reset to idle, progress back to " + formatHz(start) + " Hz");
}

CommandResult StandController::handleState() {
    return done(std::string("Current state: ") + executionStateName(m_stateMachine.currentState()));
}

CommandResult StandController::handleTransitions() {
    const ExecutionState state = m_stateMachine.currentState();
    const std::vector<Trigger> triggers = ExecutionStateMachine::legalTriggers(state);
    if (triggers.empty()) {
        return done(std::string("No transitions available from '") + executionStateName(state) + "'");
    }
    std::string out = std::string("Available transitions from '") + executionStateName(state) + "':";
    for (Trigger trigger : triggers) {
        out += "\n  ";
        out += triggerName(trigger);
    }
    return done(out);
}

CommandResult StandController::handleStatus() {
    std::ostringstream out;
    out << "State:     " << executionStateName(m_stateMachine.currentState()) << "\n";
    out << "Progress:  " << formatHz(m_config.getDouble("loop", "current_frequency", 0.0)) << " / "
        << formatHz(m_config.getDouble("loop", "max_frequency", RunConfig().max_frequency)) << " Hz\n";
    out << "Serial:    " << (m_link.isConnected() ? "connected to " + m_link.portName() : "not connected") << "\n";
    out << "Workers:   " << (m_workers.isRunning() ? "running" : "idle")
        << " (last run " << runOutcomeName(m_workers.lastOutcome()) << ", "
        << m_workers.actuationCount() << " actuations)\n";

    const std::vector<double> history = m_workers.loopHistory();
    out << "History:  ";
    if (history.empty()) {
        out << " -";
    }
    for (double frequency : history) {
        out << " " << formatHz(frequency);
    }
    out << "\n";

    const std::vector<double> missed = m_workers.missedFrequencies();
    const std::vector<double> backlog = m_workers.retryBacklog();
    const double step = m_config.getDouble("loop", "step", RunConfig().step);
    out << "Missed:    " << missed.size() << " this run";
    if (!missed.empty()) {
        out << " (" << MissingFrequencyAnalyzer::formatRanges(missed, step) << " Hz)";
    }
    out << ", " << backlog.size() << " awaiting rerun";

    // An aborted run leaves the machine in Running with no workers behind it.
    if (m_workers.lastOutcome() == RunOutcome::Aborted && !m_workers.isRunning()
        && m_stateMachine.currentState() == ExecutionState::Running) {
        out << "\nLast run aborted by an audio device error; use 'stop' or 'pause' before starting again";
    }
    return done(out.str());
}

bool StandController::collectMissing(MissingSource source, std::vector<double>& out, std::string& summary) {
    if (source == MissingSource::Missed) {
        out = m_workers.retryBacklog();
        summary = "  Missed (failed or skipped actuations): " + std::to_string(out.size()) + " frequencies";
        return true;
    }

    const double start = m_config.getDouble("loop", "start_frequency", RunConfig().start_frequency);
    const double end = m_config.getDouble("loop", "max_frequency", RunConfig().max_frequency);
    const double step = m_config.getDouble("loop", "step", RunConfig().step);
    if (!(step > 0.0)) {
        summary = "  loop.step must be positive";
        return false;
    }
    const std::set<double> expected = MissingFrequencyAnalyzer::expected(start, end, step);

    std::set<double> found;
    std::ostringstream text;
    if (source == MissingSource::Captured) {
        const std::string directory = m_config.getString("fetch", "output_dir", "./videos");
        found = MissingFrequencyAnalyzer::captured(directory);
        text << "  Checking " << directory << " for missing frequencies...\n";
        text << "  Expected range: " << formatHz(start) << " Hz to " << formatHz(end) << " Hz (step "
             << ConfigStore::formatNumber(step) << ")\n";
        text << "  Captured: " << found.size() << " frequencies\n";
    } else {
        const std::string logFile = m_config.getString("loop", "log_file", RunConfig().log_file);
        found = MissingFrequencyAnalyzer::logged(logFile, expected);
        text << "  Checking " << logFile << " for missing frequencies...\n";
        text << "  Expected range: " << formatHz(start) << " Hz to " << formatHz(end) << " Hz (step "
             << ConfigStore::formatNumber(step) << ")\n";
        text << "  Logged:   " << found.size() << " frequencies\n";
    }
    out = MissingFrequencyAnalyzer::missing(expected, found);
    text << "  Expected: " << expected.size() << " frequencies\n";
    text << "  Missing:  " << out.size() << " frequencies";
    summary = text.str();
    return true;
}

CommandResult StandController::handleMissing(const std::vector<std::string>& args) {
    MissingSource source = MissingSource::Captured;
    if (!parseMissingSource(args.empty() ? std::string() : args[0], source)) {
        return fail("Usage: missing [captured|log|missed]");
    }
    std::vector<double> missing;
    std::string summary;
    if (!collectMissing(source, missing, summary)) {
        return fail(summary);
    }
    std::string out = summary;
    if (missing.empty()) {
        out += "\n\n  All frequencies accounted for!";
        return done(out);
    }
    out += "\n\n  Missing frequencies:";
    if (missing.size() <= MissingFrequencyAnalyzer::MAX_LISTED) {
        for (double frequency : missing) {
            out += "\n    " + formatHz(frequency) + " Hz";
        }
    } else {
        const double step = m_config.getDouble("loop", "step", RunConfig().step);
        out += "\n    " + MissingFrequencyAnalyzer::formatRanges(missing, step) + " Hz";
    }
    out += std::string("\n\n  Use 'rerun ") + sourceName(source) + "' to loop through missing frequencies";
    return done(out);
}

CommandResult StandController::handleRerun(const std::vector<std::string>& args) {
    MissingSource source = MissingSource::Captured;
    if (!parseMissingSource(args.empty() ? std::string() : args[0], source)) {
        return fail("Usage: rerun [captured|log|missed]");
    }
    const ExecutionState state = m_stateMachine.currentState();
    if (state != ExecutionState::Ready && state != ExecutionState::Paused && state != ExecutionState::Stopped) {
        return fail(std::string("cannot rerun from '") + executionStateName(state) + "'");
    }

    std::vector<double> missing;
    std::string summary;
    if (!collectMissing(source, missing, summary)) {
        return fail(summary);
    }
    if (missing.empty()) {
        return done("  No missing frequencies found");
    }

    const RunConfig cfg = m_config.snapshotRunConfig();
    std::vector<FrequencyStep> steps = MissingFrequencyAnalyzer::buildRerunSteps(
        missing, cfg, static_cast<size_t>(cfg.max_steps_per_run));

    const bool transitioned = (state == ExecutionState::Ready) ? m_stateMachine.start() : m_stateMachine.resume();
    if (!transitioned) {
        return fail(m_stateMachine.lastError());
    }
    const size_t planned = steps.size();
    if (!m_workers.start(RunPlan::rerun(cfg, std::move(steps)))) {
        m_stateMachine.stop();
        return fail("could not start the rerun workers");
    }

    std::string out = "  Found " + std::to_string(missing.size()) + " missing frequencies to rerun";
    out += "\n  First: " + formatHz(missing.front()) + " Hz, Last: " + formatHz(missing.back()) + " Hz";
    if (planned < missing.size()) {
        out += "\n  This run covers the first " + std::to_string(planned) + "; rerun again for the rest";
    }
    return done(out);
}

CommandResult StandController::handleConnect(const std::vector<std::string>& args) {
    const std::string port = args.empty() ? m_config.serialPort() : args[0];
    int baudrate = m_config.baudrate();
    if (args.size() > 1) {
        double parsed = 0.0;
        if (!parseNumber(args[1], parsed) || parsed <= 0.0) {
            return fail("Usage: connect [port] [baudrate]");
        }
        baudrate = static_cast<int>(parsed);
    }
    if (!m_link.connect(port, baudrate)) {
        return fail("could not connect to " + port);
    }
    return done("Connected to " + port + " at " + std::to_string(baudrate) + " baud");
}

CommandResult StandController::handleDisconnect() {
    if (!m_link.isConnected()) {
        return done("Not connected");
    }
    m_link.disconnect();
    return done("Disconnected");
}

CommandResult StandController::handleIr() {
    if (!m_link.isConnected()) {
        return fail("Error: Not connected.");
    }
    if (!m_link.write(m_config.actuationCommand())) {
        return fail("IR command write failed");
    }
    return done("IR command sent to " + m_link.portName());
}

CommandResult StandController::handleTest() {
    if (!m_link.isConnected()) {
        return fail("Error: Not connected.");
    }
    m_link.resetInputBuffer();
    if (!m_link.write(m_config.actuationCommand())) {
        return fail("Test command write failed");
    }
    std::string out = "Test command sent to " + m_link.portName();
    const std::optional<std::string> reply = m_link.readLine(std::chrono::milliseconds(1000));
    out += reply ? "\n  Reply: " + *reply : std::string("\n  No reply within 1 s");
    if (!m_workers.isRunning()) {
        CommandResult sound = handleSound({});
        if (!sound.ok) {
            out += "\n  " + sound.message;
            return fail(out);
        }
        out += "\n  Confirmation sound played";
    }
    return done(out);
}

RenderResult StandController::playManual(const stand::dsp::ToneSpec& spec) {
    m_manualStop.clear();
    return m_toneEngine.render(spec, m_manualStop);
}

CommandResult StandController::handleSound(const std::vector<std::string>& args) {
    if (m_workers.isRunning()) {
        return fail("sound is not available while a run is active");
    }
    double frequency = m_config.getDouble("sound", "frequency", 440.0);
    double duration = m_config.getDouble("sound", "duration", 1.0);
    if ((args.size() > 0 && !parseNumber(args[0], frequency)) ||
        (args.size() > 1 && !parseNumber(args[1], duration)) || frequency <= 0.0 || duration <= 0.0) {
        return fail("Usage: sound [frequency] [duration]");
    }
    const RunConfig cfg = m_config.snapshotRunConfig();
    const double fade = m_config.getDouble("sound", "fade_seconds", cfg.fade_seconds);
    const RenderResult result = playManual(
        stand::dsp::ToneSpec::fixed(frequency, duration, fade, cfg.amplitude, cfg.sample_rate));
    if (result != RenderResult::Completed) {
        return fail(std::string("sound ") + renderResultName(result));
    }
    return done("Played " + formatHz(frequency) + " Hz for " + ConfigStore::formatNumber(duration) + " s");
}

CommandResult StandController::handleSweep(const std::vector<std::string>& args) {
    if (m_workers.isRunning()) {
        return fail("sweep is not available while a run is active");
    }
    static constexpr double kSweepStart = 1.0;
    double maxFrequency = m_config.getDouble("sweep", "max_frequency", 150.0);
    double duration = m_config.getDouble("sweep", "duration", 60.0);
    if ((args.size() > 0 && !parseNumber(args[0], maxFrequency)) ||
        (args.size() > 1 && !parseNumber(args[1], duration)) || maxFrequency <= kSweepStart || duration <= 0.0) {
        return fail("Usage: sweep [max_frequency] [duration]");
    }
    const RunConfig cfg = m_config.snapshotRunConfig();
    const double fade = m_config.getDouble("sweep", "fade_seconds", 2.0);
    std::cout << "  Sweeping " << formatHz(kSweepStart) << " Hz -> " << formatHz(maxFrequency) << " Hz in "
              << ConfigStore::formatNumber(duration) << " seconds (Ctrl+C to stop)\n";
    const RenderResult result = playManual(
        stand::dsp::ToneSpec::sweep(kSweepStart, maxFrequency, duration, fade, cfg.amplitude, cfg.sample_rate));
    if (result == RenderResult::Cancelled) {
        return done("Sweep interrupted");
    }
    if (result != RenderResult::Completed) {
        return fail(std::string("sweep ") + renderResultName(result));
    }
    return done("Sweep complete");
}

CommandResult StandController::handleConfig() {
    std::string out = "Current configuration (" + m_config.path() + "):";
    for (const std::string& section : m_config.sections()) {
        out += "\n  [" + section + "]";
        for (const auto& item : m_config.items(section)) {
            out += "\n    " + item.first + " = " + item.second;
        }
    }
    return done(out);
}

CommandResult StandController::handleSet(const std::vector<std::string>& args) {
    if (args.size() < 2 || args[1].empty()) {
        return fail("Usage: set <section>.<key> <value>\n  Example: set serial.port /dev/ttyUSB0");
    }
    const size_t dot = args[0].find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= args[0].size()) {
        return fail("Error: Key must be in format <section>.<key>");
    }
    const std::string section = args[0].substr(0, dot);
    const std::string key = args[0].substr(dot + 1);
    std::string out;
    if (!m_config.hasSection(section)) {
        out = "  Created new section [" + section + "]\n";
    }
    m_config.set(section, key, args[1]);
    if (!m_config.save()) {
        return fail(out + "  Set " + section + "." + key + " = " + args[1] + " (not saved)");
    }
    out += "  Set " + section + "." + key + " = " + args[1];
    if (m_workers.isRunning()) {
        out += "\n  Takes effect with the next run";
    }
    return done(out);
}

CommandResult StandController::handleHelp() {
    return done(
        "Commands:\n"
        "  start                   Start the sweep (ready -> running)\n"
        "  pause                   Stop the sweep, keep progress (running -> paused)\n"
        "  resume                  Continue from loop.current_frequency\n"
        "  stop                    Stop the sweep (running/paused -> stopped)\n"
        "  reset [progress]        Back to idle; 'progress' also rewinds to loop.start_frequency\n"
        "  state | transitions     Show the state or the allowed transitions\n"
        "  status                  State, progress, recent frequencies and misses\n"
        "  missing [captured|log|missed]\n"
        "                          Frequencies without a capture, log entry, or actuation\n"
        "  rerun [captured|log|missed]\n"
        "                          Loop through the missing frequencies only\n"
        "  connect [port] [baud] | disconnect\n"
        "  ir                      Send the IR command once\n"
        "  test                    Send the IR command, show the reply, play a sound\n"
        "  sound [freq] [duration] Play a sine tone\n"
        "  sweep [max] [duration]  Chirp from 1 Hz to max\n"
        "  config | set <section>.<key> <value>\n"
        "  help | exit");
}
