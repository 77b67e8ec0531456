// xarb - Operation State Machine
// Validated lifecycle transitions for every arbitrage operation

#pragma once

#include <xarb/alerts.hpp>
#include <xarb/config.hpp>
#include <xarb/operation.hpp>
#include <deque>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace xarb {

struct StateMachineStats {
    size_t total_operations{0};
    size_t active_operations{0};
    size_t recovering{0};
    size_t manual_intervention{0};
    uint64_t total_transitions{0};
    uint64_t failed_transitions{0};
    double avg_transition_us{0.0};
    std::map<OperationState, size_t> by_state;
};

class OperationStateMachine {
public:
    OperationStateMachine(const Settings& settings, AlertSink& alerts);

    OperationStateMachine(const OperationStateMachine&) = delete;
    OperationStateMachine& operator=(const OperationStateMachine&) = delete;

    [[nodiscard]] static bool is_valid_transition(OperationState from, OperationState to) noexcept;

    // New operation in IDLE
    OperationContext create_operation(const ArbitrageOpportunity& opportunity,
                                      ExecutionStage initial_stage = ExecutionStage::Preparing);

    // Throws UnknownOperation or InvalidTransition. A refused transition
    // leaves the state unchanged but is still recorded in history.
    StateTransition transition(const std::string& operation_id,
                               OperationState target,
                               TransitionTrigger trigger,
                               ContextMap context = {});

    void set_stage(const std::string& operation_id, ExecutionStage stage);

    // Counts the attempt, flags manual intervention past the cap, then moves to RECOVERING
    StateTransition transition_to_recovery(const std::string& operation_id,
                                           const std::string& reason,
                                           ContextMap context = {});

    // Requires RECOVERING
    StateTransition complete_recovery(const std::string& operation_id,
                                      OperationState target,
                                      bool success);

    void flag_manual_intervention(const std::string& operation_id, const std::string& reason);

    // Queries
    [[nodiscard]] std::optional<OperationContext> get(const std::string& operation_id) const;
    [[nodiscard]] OperationState state(const std::string& operation_id) const;
    [[nodiscard]] std::vector<OperationContext> by_state(OperationState state) const;
    [[nodiscard]] std::vector<std::string> recovering() const;
    [[nodiscard]] std::vector<std::string> manual_intervention() const;
    [[nodiscard]] size_t active_count() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::vector<StateTransition> history(size_t limit = 100) const;
    [[nodiscard]] StateMachineStats statistics() const;

    // Removes COMPLETED and FAILED operations older than max_age_ms
    size_t cleanup(std::optional<int64_t> max_age_ms = std::nullopt);

private:
    StateTransition apply_locked(OperationContext& operation,
                                 OperationState target,
                                 TransitionTrigger trigger,
                                 ContextMap context);
    OperationContext& find_locked(const std::string& operation_id);
    void notify(const OperationContext& operation, const StateTransition& transition);

    static constexpr size_t kMaxGlobalHistory = 10000;

    const Settings& settings_;
    AlertSink& alerts_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, OperationContext> operations_;
    std::deque<StateTransition> global_history_;
    uint64_t total_transitions_{0};
    uint64_t failed_transitions_{0};
    int64_t total_transition_us_{0};
};

}  // namespace xarb
