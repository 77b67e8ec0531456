// xarb - Alerts Implementation

#include <xarb/alerts.hpp>
#include <xarb/logging.hpp>
#include <xarb/operation.hpp>
#include <xarb/position_ledger.hpp>
#include <xarb/recovery.hpp>
#include <nlohmann/json.hpp>

namespace xarb {

using json = nlohmann::json;

// ============================================================================
// Rendering
// ============================================================================

std::string render_alert(const OperationContext& operation, const StateTransition& transition) {
    json j;
    j["type"] = "transition";
    j["operation_id"] = operation.operation_id;
    j["opportunity_id"] = operation.opportunity_id;
    j["transition_id"] = transition.transition_id;
    j["from"] = to_string(transition.from);
    j["to"] = to_string(transition.to);
    j["trigger"] = to_string(transition.trigger);
    j["success"] = transition.success;
    j["timestamp"] = transition.timestamp;
    j["duration_us"] = transition.duration_us;
    j["stage"] = to_string(operation.stage);
    j["recovery_attempts"] = operation.recovery_attempts;
    j["requires_manual_intervention"] = operation.requires_manual_intervention;
    if (transition.error) j["error"] = *transition.error;
    if (!transition.context.empty()) j["context"] = transition.context;
    return j.dump();
}

std::string render_alert(const RecoveryContext& recovery) {
    json j;
    j["type"] = "recovery";
    j["recovery_id"] = recovery.recovery_id;
    j["operation_id"] = recovery.operation_id;
    j["opportunity_id"] = recovery.opportunity_id;
    j["strategy"] = to_string(recovery.strategy);
    j["status"] = to_string(recovery.status);
    j["failure_stage"] = to_string(recovery.failure_stage);
    j["failure_reason"] = recovery.failure_reason;
    j["attempts"] = recovery.attempts;
    j["estimated_loss"] = recovery.estimated_loss.to_string();
    j["requires_manual_approval"] = recovery.requires_manual_approval;
    j["actions"] = recovery.actions.size();
    j["updated_at"] = recovery.updated_at;
    if (recovery.error) j["error"] = *recovery.error;
    return j.dump();
}

std::string render_alert(const PositionEntry& position) {
    json j;
    j["type"] = "stale_position";
    j["position_id"] = position.position_id;
    j["opportunity_id"] = position.opportunity_id;
    j["exchange"] = position.exchange;
    j["symbol"] = position.symbol;
    j["side"] = to_string(position.side);
    j["quantity"] = position.quantity.to_string();
    j["entry_price"] = position.entry_price.to_string();
    j["is_hedge"] = position.is_hedge;
    j["filled_at"] = position.filled_at;
    return j.dump();
}

// ============================================================================
// LogAlertSink
// ============================================================================

void LogAlertSink::on_transition(const OperationContext& operation,
                                 const StateTransition& transition) {
    if (transition.success) {
        Logger::info("alert {}", render_alert(operation, transition));
    } else {
        Logger::warn("alert {}", render_alert(operation, transition));
    }
}

void LogAlertSink::on_recovery(const RecoveryContext& recovery) {
    if (recovery.status == RecoveryStatus::Escalated) {
        Logger::error("alert {}", render_alert(recovery));
    } else {
        Logger::warn("alert {}", render_alert(recovery));
    }
}

void LogAlertSink::on_stale_position(const PositionEntry& position) {
    Logger::warn("alert {}", render_alert(position));
}

// ============================================================================
// AlertFanout
// ============================================================================

void AlertFanout::on_transition(const OperationContext& operation,
                                const StateTransition& transition) {
    for (auto* sink : sinks_) sink->on_transition(operation, transition);
}

void AlertFanout::on_recovery(const RecoveryContext& recovery) {
    for (auto* sink : sinks_) sink->on_recovery(recovery);
}

void AlertFanout::on_stale_position(const PositionEntry& position) {
    for (auto* sink : sinks_) sink->on_stale_position(position);
}

// ============================================================================
// AlertDispatcher
// ============================================================================

AlertDispatcher::AlertDispatcher(AlertSink& downstream, size_t capacity)
    : downstream_(downstream), capacity_(capacity > 0 ? capacity : 1) {}

AlertDispatcher::~AlertDispatcher() {
    stop();
}

void AlertDispatcher::start() {
    if (running_.exchange(true)) return;
    worker_ = std::make_unique<std::thread>([this] { run_loop(); });
}

void AlertDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.exchange(false)) return;
    }
    queue_cv_.notify_all();

    if (worker_ && worker_->joinable()) {
        worker_->join();
    }
    worker_.reset();

    // Anything enqueued while the worker was exiting
    std::deque<Delivery> rest;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        rest.swap(queue_);
    }
    for (const auto& delivery : rest) {
        deliver(delivery);
    }
}

size_t AlertDispatcher::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void AlertDispatcher::on_transition(const OperationContext& operation,
                                    const StateTransition& transition) {
    enqueue([operation, transition](AlertSink& sink) {
        sink.on_transition(operation, transition);
    });
}

void AlertDispatcher::on_recovery(const RecoveryContext& recovery) {
    enqueue([recovery](AlertSink& sink) { sink.on_recovery(recovery); });
}

void AlertDispatcher::on_stale_position(const PositionEntry& position) {
    enqueue([position](AlertSink& sink) { sink.on_stale_position(position); });
}

void AlertDispatcher::enqueue(Delivery delivery) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (running_.load(std::memory_order_acquire)) {
            if (queue_.size() >= capacity_) {
                queue_.pop_front();
                dropped_.fetch_add(1, std::memory_order_relaxed);
            }
            queue_.push_back(std::move(delivery));
            queue_cv_.notify_one();
            return;
        }
    }
    deliver(delivery);
}

void AlertDispatcher::deliver(const Delivery& delivery) {
    try {
        delivery(downstream_);
        delivered_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& e) {
        Logger::error("Alert delivery failed: {}", e.what());
    }
}

void AlertDispatcher::run_loop() {
    while (true) {
        Delivery next;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return !queue_.empty() || !running_.load(std::memory_order_acquire);
            });
            if (queue_.empty()) return;
            next = std::move(queue_.front());
            queue_.pop_front();
        }
        deliver(next);
    }
}

}  // namespace xarb
