#include "loop_worker.h"

#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include "progress.h"

const char *runOutcomeName(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::None:
            return "none";
        case RunOutcome::Completed:
            return "completed";
        case RunOutcome::Capped:
            return "capped";
        case RunOutcome::Stopped:
            return "stopped";
        case RunOutcome::Aborted:
            return "aborted";
    }
    return "unknown";
}

LoopWorker::LoopWorker(ConfigStore& config, ExecutionStateMachine& stateMachine, ToneEngine& toneEngine,
                       StopSignal& stop, TriggerSignal& trigger, MissLedger& misses, bool verboseLogging)
    : m_config(config)
    , m_stateMachine(stateMachine)
    , m_toneEngine(toneEngine)
    , m_stop(stop)
    , m_trigger(trigger)
    , m_misses(misses)
    , m_verboseLogging(verboseLogging)
    , m_outcome(RunOutcome::None)
    , m_saveProgress(true) {
}

bool LoopWorker::start(const RunPlan& plan) {
    m_saveProgress = plan.save_progress;
    m_outcome = RunOutcome::None;
    return m_thread.launch([this, plan]() { run(plan); });
}

void LoopWorker::requestStop(bool saveProgress) {
    if (!saveProgress) {
        m_saveProgress = false;
    }
    m_stop.set();
}

std::vector<double> LoopWorker::history() const {
    std::lock_guard<std::mutex> lock(m_historyMutex);
    return std::vector<double>(m_history.begin(), m_history.end());
}

void LoopWorker::remember(double frequency) {
    std::lock_guard<std::mutex> lock(m_historyMutex);
    m_history.push_back(frequency);
    while (m_history.size() > HISTORY_SIZE) {
        m_history.pop_front();
    }
}

void LoopWorker::persistProgress(double nextFrequency) {
    m_config.setDouble("loop", "current_frequency", nextFrequency);
    if (m_saveProgress.load() && !m_config.save()) {
        std::cerr << "[Loop] failed to save progress (" << formatHz(nextFrequency) << " Hz)\n";
    }
}

void LoopWorker::run(const RunPlan& plan) {
    RunOutcome outcome = RunOutcome::Aborted;
    try {
        outcome = runSteps(plan);
    } catch (const std::exception& e) {
        std::cerr << "[Loop] error: " << e.what() << "\n";
    }
    finish(outcome);
}

RunOutcome LoopWorker::runSteps(const RunPlan& plan) {
    const RunConfig& cfg = plan.config;
    size_t cursor = 0;
    int stepCount = 0;

    while (true) {
        if (m_stop.isSet()) {
            return RunOutcome::Stopped;
        }

        FrequencyStep step;
        if (plan.mode == RunMode::Sweep) {
            const double frequency = m_config.getDouble("loop", "current_frequency", cfg.start_frequency);
            if (frequency > cfg.max_frequency + kFrequencyEpsilon) {
                std::cout << "[Loop] completed (reached " << formatHz(cfg.max_frequency) << " Hz)\n";
                return RunOutcome::Completed;
            }
            step = FrequencyStep::fromConfig(frequency, cfg);
        } else {
            if (cursor >= plan.steps.size()) {
                std::cout << "[Loop] rerun complete, processed " << plan.steps.size() << " frequencies\n";
                return RunOutcome::Completed;
            }
            step = plan.steps[cursor];
        }

        if (stepCount >= cfg.max_steps_per_run) {
            std::cout << "[Loop] paused after " << cfg.max_steps_per_run
                      << " steps (use 'resume' to continue)\n";
            return RunOutcome::Capped;
        }

        remember(step.frequency);
        const std::string progress = (plan.mode == RunMode::Sweep)
            ? formatRunProgress(step.frequency, stepCount, cfg.max_frequency, cfg.step,
                                step.tone_duration, step.post_sleep, cfg.max_steps_per_run)
            : formatRerunProgress(cursor, plan.steps.size(), step.tone_duration, step.post_sleep);
        std::cout << "[Loop] " << formatHz(step.frequency) << " Hz | " << progress << "\n";

        const std::optional<FrequencyStep> superseded = m_trigger.set(step);
        if (superseded) {
            std::cerr << "[Loop] trigger for " << formatHz(superseded->frequency)
                      << " Hz superseded before it fired\n";
            m_misses.record(superseded->frequency);
        }

        const stand::dsp::ToneSpec tone = stand::dsp::ToneSpec::fixed(
            step.frequency, step.tone_duration, cfg.fade_seconds, cfg.amplitude, cfg.sample_rate);
        const RenderResult rendered = m_toneEngine.render(tone, m_stop);
        if (rendered == RenderResult::Cancelled) {
            std::cout << "[Loop] stopped at " << formatHz(step.frequency) << " Hz\n";
            return RunOutcome::Stopped;
        }
        if (rendered == RenderResult::DeviceError) {
            std::cerr << "[Loop] audio device error at " << formatHz(step.frequency) << " Hz, run aborted\n";
            return RunOutcome::Aborted;
        }

        stepCount++;
        if (plan.mode == RunMode::Sweep) {
            persistProgress(step.frequency + cfg.step);
        } else {
            cursor++;
        }

        if (m_verboseLogging) {
            std::cout << "[Loop] sleeping " << step.post_sleep << " s\n";
        }
        if (!m_stop.sleepFor(std::chrono::duration<double>(step.post_sleep))) {
            return RunOutcome::Stopped;
        }
    }
}

void LoopWorker::finish(RunOutcome outcome) {
    m_outcome = outcome;
    m_trigger.close();

    const ExecutionState state = m_stateMachine.currentState();
    if (outcome == RunOutcome::Capped && state == ExecutionState::Running) {
        m_stateMachine.pause();
    } else if (outcome == RunOutcome::Completed && state == ExecutionState::Running) {
        m_stateMachine.stop();
    }
    if (m_verboseLogging) {
        std::cout << "[Loop] run ended: " << runOutcomeName(outcome) << "\n";
    }
}
