#include "worker_manager.h"

#include <iostream>
#include <optional>

#include "progress.h"

WorkerManager::WorkerManager(ConfigStore& config, ExecutionStateMachine& stateMachine, ToneEngine& toneEngine,
                             ActuatorLink& link, bool verboseLogging)
    : m_loop(config, stateMachine, toneEngine, m_stop, m_trigger, m_misses, verboseLogging)
    , m_ir(link, m_stop, m_trigger, m_misses, verboseLogging)
    , m_verboseLogging(verboseLogging)
    , m_loopJoinTimeout(LOOP_JOIN_TIMEOUT)
    , m_irJoinTimeout(IR_JOIN_TIMEOUT) {
}

WorkerManager::~WorkerManager() {
    {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        stopLocked(false);
    }
    m_loop.join();
    m_ir.join();
}

bool WorkerManager::start(const RunPlan& plan) {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    if (!stopLocked(true)) {
        std::cerr << "[Workers] previous run has not exited yet, refusing to start\n";
        return false;
    }

    m_stop.clear();
    m_trigger.reset();
    m_misses.beginRun();

    if (!m_ir.start(plan.config)) {
        std::cerr << "[Workers] failed to start IR worker\n";
        return false;
    }
    if (!m_loop.start(plan)) {
        std::cerr << "[Workers] failed to start loop worker\n";
        m_stop.set();
        m_trigger.wake();
        m_ir.joinFor(m_irJoinTimeout);
        return false;
    }
    if (m_verboseLogging) {
        std::cout << "[Workers] started " << (plan.mode == RunMode::Sweep ? "sweep" : "rerun") << " run\n";
    }
    return true;
}

bool WorkerManager::stop(bool saveProgress) {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    return stopLocked(saveProgress);
}

bool WorkerManager::stopLocked(bool saveProgress) {
    if (!m_loop.joinable() && !m_ir.joinable()) {
        return true;
    }

    m_loop.requestStop(saveProgress);
    m_stop.set();
    m_trigger.wake();

    const bool loopJoined = m_loop.joinFor(m_loopJoinTimeout);
    if (!loopJoined) {
        std::cerr << "[Workers] loop worker did not exit within " << m_loopJoinTimeout.count() << " ms\n";
    }
    const bool irJoined = m_ir.joinFor(m_irJoinTimeout);
    if (!irJoined) {
        std::cerr << "[Workers] IR worker did not exit within " << m_irJoinTimeout.count() << " ms\n";
    }

    const std::optional<FrequencyStep> pending = m_trigger.takePending();
    if (pending) {
        std::cerr << "[Workers] trigger for " << formatHz(pending->frequency) << " Hz cancelled before it fired\n";
        m_misses.record(pending->frequency);
    }
    return loopJoined && irJoined;
}

bool WorkerManager::waitForCompletion(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    if (!m_loop.joinFor(timeout)) {
        return false;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return m_ir.joinFor(left.count() > 0 ? left : std::chrono::milliseconds(0));
}

bool WorkerManager::isRunning() const {
    return m_loop.isRunning();
}
