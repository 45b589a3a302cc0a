#include "execution_state.h"

#include <iostream>

namespace {
constexpr Trigger kAllTriggers[] = {Trigger::Initialize, Trigger::Start, Trigger::Pause,
                                    Trigger::Resume, Trigger::Stop, Trigger::Reset};

void printStateEntry(ExecutionState state) {
    switch (state) {
        case ExecutionState::Idle:
            std::cout << "[State] Entered idle state\n";
            break;
        case ExecutionState::Ready:
            std::cout << "[State] System initialized and ready\n";
            break;
        case ExecutionState::Running:
            std::cout << "[State] Execution started\n";
            break;
        case ExecutionState::Paused:
            std::cout << "[State] Execution paused\n";
            break;
        case ExecutionState::Stopped:
            std::cout << "[State] Execution stopped\n";
            break;
    }
}
}  // namespace

const char* executionStateName(ExecutionState state) {
    switch (state) {
        case ExecutionState::Idle:
            return "idle";
        case ExecutionState::Ready:
            return "ready";
        case ExecutionState::Running:
            return "running";
        case ExecutionState::Paused:
            return "paused";
        case ExecutionState::Stopped:
            return "stopped";
    }
    return "idle";
}

const char* triggerName(Trigger trigger) {
    switch (trigger) {
        case Trigger::Initialize:
            return "initialize";
        case Trigger::Start:
            return "start";
        case Trigger::Pause:
            return "pause";
        case Trigger::Resume:
            return "resume";
        case Trigger::Stop:
            return "stop";
        case Trigger::Reset:
            return "reset";
    }
    return "reset";
}

ExecutionStateMachine::ExecutionStateMachine()
    : m_state(ExecutionState::Idle)
    , m_entryHook(printStateEntry) {
}

bool ExecutionStateMachine::nextState(ExecutionState from, Trigger trigger, ExecutionState& to) {
    switch (trigger) {
        case Trigger::Initialize:
            if (from == ExecutionState::Idle) {
                to = ExecutionState::Ready;
                return true;
            }
            return false;
        case Trigger::Start:
            if (from == ExecutionState::Ready) {
                to = ExecutionState::Running;
                return true;
            }
            return false;
        case Trigger::Pause:
            if (from == ExecutionState::Running) {
                to = ExecutionState::Paused;
                return true;
            }
            return false;
        case Trigger::Resume:
            if (from == ExecutionState::Paused || from == ExecutionState::Stopped) {
                to = ExecutionState::Running;
                return true;
            }
            return false;
        case Trigger::Stop:
            if (from == ExecutionState::Running || from == ExecutionState::Paused) {
                to = ExecutionState::Stopped;
                return true;
            }
            return false;
        case Trigger::Reset:
            to = ExecutionState::Idle;
            return true;
    }
    return false;
}

bool ExecutionStateMachine::fire(Trigger trigger) {
    ExecutionState entered = ExecutionState::Idle;
    EntryHook hook;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!nextState(m_state, trigger, entered)) {
            m_lastError = std::string("cannot ") + triggerName(trigger) + " from '" +
                          executionStateName(m_state) + "'";
            std::cerr << "[State] " << m_lastError << "\n";
            return false;
        }
        m_state = entered;
        m_lastError.clear();
        hook = m_entryHook;
    }
    if (hook) {
        hook(entered);
    }
    return true;
}

ExecutionState ExecutionStateMachine::currentState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::vector<Trigger> ExecutionStateMachine::legalTriggers() const {
    return legalTriggers(currentState());
}

std::vector<Trigger> ExecutionStateMachine::legalTriggers(ExecutionState state) {
    std::vector<Trigger> triggers;
    for (Trigger trigger : kAllTriggers) {
        ExecutionState to = ExecutionState::Idle;
        if (nextState(state, trigger, to)) {
            triggers.push_back(trigger);
        }
    }
    return triggers;
}

void ExecutionStateMachine::setEntryHook(EntryHook hook) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entryHook = std::move(hook);
}

std::string ExecutionStateMachine::lastError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}
