// xarb - Operation Records
// Lifecycle states, transitions and the per-operation context

#pragma once

#include <xarb/opportunity.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace xarb {

/// Lifecycle state of an arbitrage operation
enum class OperationState : uint8_t {
    Idle = 0,
    Detecting = 1,
    OpportunityFound = 2,
    Executing = 3,
    PositionOpen = 4,
    Recovering = 5,
    Completed = 6,
    Failed = 7
};

inline constexpr const char* to_string(OperationState s) noexcept {
    switch (s) {
        case OperationState::Idle: return "idle";
        case OperationState::Detecting: return "detecting";
        case OperationState::OpportunityFound: return "opportunity_found";
        case OperationState::Executing: return "executing";
        case OperationState::PositionOpen: return "position_open";
        case OperationState::Recovering: return "recovering";
        case OperationState::Completed: return "completed";
        case OperationState::Failed: return "failed";
    }
    return "unknown";
}

inline constexpr OperationState kAllOperationStates[] = {
    OperationState::Idle,
    OperationState::Detecting,
    OperationState::OpportunityFound,
    OperationState::Executing,
    OperationState::PositionOpen,
    OperationState::Recovering,
    OperationState::Completed,
    OperationState::Failed,
};

/// What caused a state transition
enum class TransitionTrigger : uint8_t {
    OpportunityDetected = 0,
    ExecutionStarted = 1,
    ExecutionCompleted = 2,
    ExecutionFailed = 3,
    RecoveryInitiated = 4,
    RecoveryCompleted = 5,
    ManualIntervention = 6,
    SystemShutdown = 7,
    CircuitBreaker = 8
};

inline constexpr const char* to_string(TransitionTrigger t) noexcept {
    switch (t) {
        case TransitionTrigger::OpportunityDetected: return "opportunity_detected";
        case TransitionTrigger::ExecutionStarted: return "execution_started";
        case TransitionTrigger::ExecutionCompleted: return "execution_completed";
        case TransitionTrigger::ExecutionFailed: return "execution_failed";
        case TransitionTrigger::RecoveryInitiated: return "recovery_initiated";
        case TransitionTrigger::RecoveryCompleted: return "recovery_completed";
        case TransitionTrigger::ManualIntervention: return "manual_intervention";
        case TransitionTrigger::SystemShutdown: return "system_shutdown";
        case TransitionTrigger::CircuitBreaker: return "circuit_breaker";
    }
    return "unknown";
}

using ContextMap = std::map<std::string, std::string>;

// One attempted state change, successful or not
struct StateTransition {
    std::string transition_id;
    std::string operation_id;
    OperationState from{OperationState::Idle};
    OperationState to{OperationState::Idle};
    TransitionTrigger trigger{TransitionTrigger::OpportunityDetected};
    int64_t timestamp{0};
    ContextMap context;
    bool success{false};
    std::optional<std::string> error;
    int64_t duration_us{0};
};

// Mutable lifecycle record, owned by OperationStateMachine
struct OperationContext {
    std::string operation_id;
    std::string opportunity_id;
    OperationState state{OperationState::Idle};
    ExecutionStage stage{ExecutionStage::Preparing};
    int64_t created_at{0};
    int64_t updated_at{0};
    std::vector<StateTransition> history;
    int recovery_attempts{0};
    int max_recovery_attempts{3};
    bool requires_manual_intervention{false};
    std::optional<std::string> last_error;
    ContextMap metadata;

    [[nodiscard]] bool is_terminal() const noexcept {
        return state == OperationState::Completed || state == OperationState::Failed;
    }

    [[nodiscard]] bool is_active() const noexcept {
        return !is_terminal() && state != OperationState::Idle;
    }

    [[nodiscard]] int64_t age_ms(int64_t now) const noexcept { return now - created_at; }
};

}  // namespace xarb
