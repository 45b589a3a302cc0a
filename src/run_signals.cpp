#include "run_signals.h"

#include <algorithm>

StopSignal::StopSignal()
    : m_flag(false) {
}

void StopSignal::set() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_flag = true;
    }
    m_cv.notify_all();
}

void StopSignal::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_flag = false;
}

bool StopSignal::sleepFor(std::chrono::duration<double> duration) const {
    const auto deadline = std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(duration);
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_flag.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, POLL_INTERVAL);
        m_cv.wait_for(lock, slice, [this]() { return m_flag.load(); });
    }
    return false;
}

TriggerSignal::TriggerSignal()
    : m_closed(false) {
}

std::optional<FrequencyStep> TriggerSignal::set(const FrequencyStep& step) {
    std::optional<FrequencyStep> superseded;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        superseded = m_pending;
        m_pending = step;
    }
    m_cv.notify_all();
    return superseded;
}

std::optional<FrequencyStep> TriggerSignal::waitAndConsume(const StopSignal& stop) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [&]() { return m_pending.has_value() || m_closed || stop.isSet(); });
    if (stop.isSet() || !m_pending) {
        return std::nullopt;
    }
    std::optional<FrequencyStep> step = m_pending;
    m_pending.reset();
    return step;
}

std::optional<FrequencyStep> TriggerSignal::takePending() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::optional<FrequencyStep> step = m_pending;
    m_pending.reset();
    return step;
}

void TriggerSignal::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_cv.notify_all();
}

void TriggerSignal::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pending.reset();
    m_closed = false;
}

void TriggerSignal::wake() {
    // Taking the lock orders the notify after a waiter's predicate check.
    {
        std::lock_guard<std::mutex> lock(m_mutex);
    }
    m_cv.notify_all();
}

void MissedSet::add(double frequency) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_frequencies.insert(roundFrequency(frequency));
}

bool MissedSet::remove(double frequency) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_frequencies.erase(roundFrequency(frequency)) > 0;
}

void MissedSet::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_frequencies.clear();
}

std::vector<double> MissedSet::sorted() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<double>(m_frequencies.begin(), m_frequencies.end());
}

void MissLedger::record(double frequency) {
    m_run.add(frequency);
    m_backlog.add(frequency);
}

void MissLedger::resolve(double frequency) {
    m_backlog.remove(frequency);
}
