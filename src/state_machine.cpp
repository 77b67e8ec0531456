// xarb - Operation State Machine Implementation

#include <xarb/state_machine.hpp>
#include <xarb/errors.hpp>
#include <xarb/logging.hpp>
#include <algorithm>
#include <cstddef>
#include <mutex>

namespace xarb {

using S = OperationState;

OperationStateMachine::OperationStateMachine(const Settings& settings, AlertSink& alerts)
    : settings_(settings), alerts_(alerts) {}

bool OperationStateMachine::is_valid_transition(OperationState from, OperationState to) noexcept {
    switch (from) {
        case S::Idle:
            return to == S::Detecting || to == S::Failed;
        case S::Detecting:
            return to == S::OpportunityFound || to == S::Idle ||
                   to == S::Failed || to == S::Recovering;
        case S::OpportunityFound:
            return to == S::Executing || to == S::Detecting || to == S::Idle ||
                   to == S::Failed || to == S::Recovering;
        case S::Executing:
            return to == S::PositionOpen || to == S::Completed ||
                   to == S::Failed || to == S::Recovering;
        case S::PositionOpen:
            return to == S::Executing || to == S::Completed ||
                   to == S::Failed || to == S::Recovering;
        case S::Recovering:
            return to == S::Idle || to == S::Detecting || to == S::Executing ||
                   to == S::Completed || to == S::Failed;
        case S::Completed:
            return to == S::Idle;
        case S::Failed:
            return to == S::Idle || to == S::Recovering;
    }
    return false;
}

OperationContext OperationStateMachine::create_operation(const ArbitrageOpportunity& opportunity,
                                                         ExecutionStage initial_stage) {
    OperationContext op;
    op.operation_id = make_id("op");
    op.opportunity_id = opportunity.id;
    op.stage = initial_stage;
    op.created_at = now_ms();
    op.updated_at = op.created_at;
    op.max_recovery_attempts = settings_.risk.max_recovery_attempts;
    op.metadata["opportunity_type"] = to_string(opportunity.type);
    op.metadata["symbol"] = opportunity.symbol;
    op.metadata["profit_margin_bps"] = opportunity.profit_margin_bps.to_string();
    op.metadata["buy_exchange"] = opportunity.buy_exchange;
    op.metadata["sell_exchange"] = opportunity.sell_exchange;

    {
        std::unique_lock lock(mutex_);
        operations_[op.operation_id] = op;
    }

    Logger::info("Created operation {} for opportunity {}", op.operation_id, opportunity.id);
    return op;
}

StateTransition OperationStateMachine::transition(const std::string& operation_id,
                                                  OperationState target,
                                                  TransitionTrigger trigger,
                                                  ContextMap context) {
    StateTransition record;
    OperationContext snapshot;
    {
        std::unique_lock lock(mutex_);
        auto& op = find_locked(operation_id);
        record = apply_locked(op, target, trigger, std::move(context));
        snapshot = op;
    }

    notify(snapshot, record);
    if (!record.success) {
        throw InvalidTransition(*record.error);
    }
    return record;
}

void OperationStateMachine::set_stage(const std::string& operation_id, ExecutionStage stage) {
    std::unique_lock lock(mutex_);
    auto& op = find_locked(operation_id);
    op.stage = stage;
    op.updated_at = now_ms();
}

StateTransition OperationStateMachine::transition_to_recovery(const std::string& operation_id,
                                                              const std::string& reason,
                                                              ContextMap context) {
    StateTransition record;
    OperationContext snapshot;
    bool escalated = false;
    {
        std::unique_lock lock(mutex_);
        auto& op = find_locked(operation_id);
        context["reason"] = reason;

        if (is_valid_transition(op.state, S::Recovering)) {
            ++op.recovery_attempts;
            if (op.recovery_attempts > op.max_recovery_attempts &&
                !op.requires_manual_intervention) {
                op.requires_manual_intervention = true;
                escalated = true;
            }
            op.last_error = reason;
            context["recovery_attempt"] = std::to_string(op.recovery_attempts);
        }

        record = apply_locked(op, S::Recovering, TransitionTrigger::RecoveryInitiated,
                              std::move(context));
        snapshot = op;
    }

    notify(snapshot, record);
    if (!record.success) {
        throw InvalidTransition(*record.error);
    }

    if (escalated) {
        Logger::error("Operation {} exceeded {} recovery attempts; manual intervention required",
                      operation_id, snapshot.max_recovery_attempts);
    } else {
        Logger::warn("Operation {} entering recovery (attempt {}): {}",
                     operation_id, snapshot.recovery_attempts, reason);
    }
    return record;
}

StateTransition OperationStateMachine::complete_recovery(const std::string& operation_id,
                                                         OperationState target,
                                                         bool success) {
    StateTransition record;
    OperationContext snapshot;
    {
        std::unique_lock lock(mutex_);
        auto& op = find_locked(operation_id);
        if (op.state != S::Recovering) {
            throw InvalidTransition("Operation " + operation_id + " is not recovering (state " +
                                    to_string(op.state) + ")");
        }

        if (success) {
            op.last_error.reset();
        }
        record = apply_locked(op, target, TransitionTrigger::RecoveryCompleted,
                              {{"recovery_success", success ? "true" : "false"}});
        snapshot = op;
    }

    notify(snapshot, record);
    if (!record.success) {
        throw InvalidTransition(*record.error);
    }
    return record;
}

void OperationStateMachine::flag_manual_intervention(const std::string& operation_id,
                                                     const std::string& reason) {
    {
        std::unique_lock lock(mutex_);
        auto& op = find_locked(operation_id);
        op.requires_manual_intervention = true;
        op.last_error = reason;
        op.metadata["manual_intervention_reason"] = reason;
        op.updated_at = now_ms();
    }
    Logger::error("Operation {} flagged for manual intervention: {}", operation_id, reason);
}

std::optional<OperationContext> OperationStateMachine::get(const std::string& operation_id) const {
    std::shared_lock lock(mutex_);
    auto it = operations_.find(operation_id);
    if (it == operations_.end()) return std::nullopt;
    return it->second;
}

OperationState OperationStateMachine::state(const std::string& operation_id) const {
    std::shared_lock lock(mutex_);
    auto it = operations_.find(operation_id);
    if (it == operations_.end()) {
        throw UnknownOperation(operation_id);
    }
    return it->second.state;
}

std::vector<OperationContext> OperationStateMachine::by_state(OperationState state) const {
    std::shared_lock lock(mutex_);
    std::vector<OperationContext> result;
    for (const auto& [id, op] : operations_) {
        if (op.state == state) result.push_back(op);
    }
    return result;
}

std::vector<std::string> OperationStateMachine::recovering() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [id, op] : operations_) {
        if (op.state == S::Recovering) result.push_back(id);
    }
    return result;
}

std::vector<std::string> OperationStateMachine::manual_intervention() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [id, op] : operations_) {
        if (op.requires_manual_intervention) result.push_back(id);
    }
    return result;
}

size_t OperationStateMachine::active_count() const {
    std::shared_lock lock(mutex_);
    size_t count = 0;
    for (const auto& [id, op] : operations_) {
        if (!op.is_terminal()) ++count;
    }
    return count;
}

size_t OperationStateMachine::size() const {
    std::shared_lock lock(mutex_);
    return operations_.size();
}

std::vector<StateTransition> OperationStateMachine::history(size_t limit) const {
    std::shared_lock lock(mutex_);
    size_t n = std::min(limit, global_history_.size());
    return std::vector<StateTransition>(global_history_.end() - static_cast<std::ptrdiff_t>(n),
                                        global_history_.end());
}

StateMachineStats OperationStateMachine::statistics() const {
    std::shared_lock lock(mutex_);
    StateMachineStats stats;
    stats.total_operations = operations_.size();
    for (auto s : kAllOperationStates) {
        stats.by_state[s] = 0;
    }
    for (const auto& [id, op] : operations_) {
        ++stats.by_state[op.state];
        if (!op.is_terminal()) ++stats.active_operations;
        if (op.state == S::Recovering) ++stats.recovering;
        if (op.requires_manual_intervention) ++stats.manual_intervention;
    }
    stats.total_transitions = total_transitions_;
    stats.failed_transitions = failed_transitions_;
    if (total_transitions_ > 0) {
        stats.avg_transition_us = static_cast<double>(total_transition_us_) /
                                  static_cast<double>(total_transitions_);
    }
    return stats;
}

size_t OperationStateMachine::cleanup(std::optional<int64_t> max_age_ms) {
    int64_t max_age = max_age_ms.value_or(settings_.timing.operation_retention_ms);
    int64_t now = now_ms();
    size_t removed = 0;
    {
        std::unique_lock lock(mutex_);
        for (auto it = operations_.begin(); it != operations_.end();) {
            if (it->second.is_terminal() && it->second.age_ms(now) > max_age) {
                it = operations_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }

    if (removed > 0) {
        Logger::info("Cleaned up {} finished operations", removed);
    }
    return removed;
}

StateTransition OperationStateMachine::apply_locked(OperationContext& operation,
                                                    OperationState target,
                                                    TransitionTrigger trigger,
                                                    ContextMap context) {
    int64_t start = now_us();

    StateTransition record;
    record.transition_id = make_id("tr");
    record.operation_id = operation.operation_id;
    record.from = operation.state;
    record.to = target;
    record.trigger = trigger;
    record.timestamp = now_ms();
    record.context = std::move(context);

    if (is_valid_transition(operation.state, target)) {
        operation.state = target;
        operation.updated_at = record.timestamp;
        record.success = true;
    } else {
        record.error = std::string("Invalid transition ") + to_string(record.from) + " -> " +
                       to_string(target) + " for operation " + operation.operation_id;
        ++failed_transitions_;
    }

    record.duration_us = now_us() - start;
    ++total_transitions_;
    total_transition_us_ += record.duration_us;

    operation.history.push_back(record);
    global_history_.push_back(record);
    if (global_history_.size() > kMaxGlobalHistory) {
        global_history_.pop_front();
    }
    return record;
}

OperationContext& OperationStateMachine::find_locked(const std::string& operation_id) {
    auto it = operations_.find(operation_id);
    if (it == operations_.end()) {
        throw UnknownOperation(operation_id);
    }
    return it->second;
}

void OperationStateMachine::notify(const OperationContext& operation,
                                   const StateTransition& transition) {
    if (transition.success) {
        Logger::debug("Operation {} {} -> {} ({})", operation.operation_id,
                      to_string(transition.from), to_string(transition.to),
                      to_string(transition.trigger));
    } else {
        Logger::warn("{}", *transition.error);
    }
    alerts_.on_transition(operation, transition);
}

}  // namespace xarb
