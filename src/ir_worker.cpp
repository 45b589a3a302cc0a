#include "ir_worker.h"

#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include "progress.h"

IRWorker::IRWorker(ActuatorLink& link, StopSignal& stop, TriggerSignal& trigger, MissLedger& misses,
                   bool verboseLogging)
    : m_link(link)
    , m_stop(stop)
    , m_trigger(trigger)
    , m_misses(misses)
    , m_verboseLogging(verboseLogging)
    , m_actuations(0) {
}

bool IRWorker::start(const RunConfig& config) {
    return m_thread.launch([this, config]() { run(config); });
}

void IRWorker::run(const RunConfig& config) {
    TriggerLog log(config.log_file);
    while (true) {
        const std::optional<FrequencyStep> step = m_trigger.waitAndConsume(m_stop);
        if (!step) {
            break;
        }
        if (!m_stop.sleepFor(std::chrono::duration<double>(step->ir_delay))) {
            std::cerr << "[IR] cancelled before firing at " << formatHz(step->frequency) << " Hz\n";
            m_misses.record(step->frequency);
            break;
        }
        try {
            actuate(*step, config.actuation_command, log);
        } catch (const std::exception& e) {
            std::cerr << "[IR] error at " << formatHz(step->frequency) << " Hz: " << e.what() << "\n";
            m_misses.record(step->frequency);
        }
    }
    if (m_verboseLogging) {
        std::cout << "[IR] worker finished\n";
    }
}

void IRWorker::actuate(const FrequencyStep& step, const std::string& command, TriggerLog& log) {
    if (!m_link.isConnected()) {
        std::cerr << "[IR] skipped " << formatHz(step.frequency) << " Hz (not connected)\n";
        m_misses.record(step.frequency);
        return;
    }
    if (!m_link.write(command)) {
        std::cerr << "[IR] write failed at " << formatHz(step.frequency) << " Hz\n";
        m_misses.record(step.frequency);
        return;
    }

    m_actuations++;
    m_misses.resolve(step.frequency);
    if (!log.append(step.frequency)) {
        std::cerr << "[IR] fired at " << formatHz(step.frequency) << " Hz but the log entry was not written\n";
        return;
    }
    std::cout << "[IR] sent @ " << formatHz(step.frequency) << " Hz\n";
}
