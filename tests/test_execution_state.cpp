#include <catch2/catch_test_macros.hpp>
#include <vector>
#include "execution_state.h"

TEST_CASE("ExecutionStateMachine follows the legal lifecycle", "[state]") {
    ExecutionStateMachine sm;
    std::vector<ExecutionState> entered;
    sm.setEntryHook([&](ExecutionState state) { entered.push_back(state); });

    REQUIRE(sm.currentState() == ExecutionState::Idle);
    REQUIRE(sm.initialize());
    REQUIRE(sm.start());
    REQUIRE(sm.pause());
    REQUIRE(sm.resume());
    REQUIRE(sm.stop());
    REQUIRE(sm.resume());
    REQUIRE(sm.stop());
    REQUIRE(sm.reset());

    const std::vector<ExecutionState> expected = {
        ExecutionState::Ready,   ExecutionState::Running, ExecutionState::Paused,
        ExecutionState::Running, ExecutionState::Stopped, ExecutionState::Running,
        ExecutionState::Stopped, ExecutionState::Idle};
    REQUIRE(entered == expected);
}

TEST_CASE("ExecutionStateMachine rejects illegal triggers without changing state", "[state]") {
    ExecutionStateMachine sm;
    sm.setEntryHook(nullptr);

    REQUIRE_FALSE(sm.start());
    REQUIRE(sm.currentState() == ExecutionState::Idle);
    REQUIRE(sm.lastError() == "cannot start from 'idle'");

    REQUIRE(sm.initialize());
    REQUIRE_FALSE(sm.pause());
    REQUIRE_FALSE(sm.resume());
    REQUIRE_FALSE(sm.stop());
    REQUIRE(sm.currentState() == ExecutionState::Ready);

    REQUIRE(sm.start());
    REQUIRE_FALSE(sm.initialize());
    REQUIRE_FALSE(sm.start());
    REQUIRE(sm.currentState() == ExecutionState::Running);
    REQUIRE(sm.lastError() == "cannot start from 'running'");
}

TEST_CASE("ExecutionStateMachine reset is legal from every state", "[state]") {
    ExecutionStateMachine sm;
    sm.setEntryHook(nullptr);

    REQUIRE(sm.reset());
    REQUIRE(sm.currentState() == ExecutionState::Idle);

    REQUIRE(sm.initialize());
    REQUIRE(sm.start());
    REQUIRE(sm.pause());
    REQUIRE(sm.reset());
    REQUIRE(sm.currentState() == ExecutionState::Idle);
}

TEST_CASE("ExecutionStateMachine lists the triggers of each state", "[state]") {
    const auto paused = ExecutionStateMachine::legalTriggers(ExecutionState::Paused);
    REQUIRE(paused == std::vector<Trigger>{Trigger::Resume, Trigger::Stop, Trigger::Reset});

    const auto idle = ExecutionStateMachine::legalTriggers(ExecutionState::Idle);
    REQUIRE(idle == std::vector<Trigger>{Trigger::Initialize, Trigger::Reset});

    ExecutionState to = ExecutionState::Idle;
    REQUIRE(ExecutionStateMachine::nextState(ExecutionState::Stopped, Trigger::Resume, to));
    REQUIRE(to == ExecutionState::Running);
    REQUIRE_FALSE(ExecutionStateMachine::nextState(ExecutionState::Stopped, Trigger::Pause, to));
}
