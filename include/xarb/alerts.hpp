// xarb - Alerts
// Observer interface for transitions, recoveries and stale positions

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace xarb {

struct OperationContext;
struct StateTransition;
struct RecoveryContext;
struct PositionEntry;

// Receives lifecycle events. Implementations must not call back into the
// component that raised the event.
class AlertSink {
public:
    virtual ~AlertSink() = default;

    virtual void on_transition(const OperationContext& operation,
                               const StateTransition& transition) = 0;
    virtual void on_recovery(const RecoveryContext& recovery) = 0;
    virtual void on_stale_position(const PositionEntry& position) = 0;
};

class NullAlertSink : public AlertSink {
public:
    void on_transition(const OperationContext&, const StateTransition&) override {}
    void on_recovery(const RecoveryContext&) override {}
    void on_stale_position(const PositionEntry&) override {}
};

// Writes every alert as a JSON line through Logger
class LogAlertSink : public AlertSink {
public:
    void on_transition(const OperationContext& operation,
                       const StateTransition& transition) override;
    void on_recovery(const RecoveryContext& recovery) override;
    void on_stale_position(const PositionEntry& position) override;
};

// Forwards every alert to each registered sink in order
class AlertFanout : public AlertSink {
public:
    void add(AlertSink& sink) { sinks_.push_back(&sink); }
    [[nodiscard]] size_t size() const noexcept { return sinks_.size(); }

    void on_transition(const OperationContext& operation,
                       const StateTransition& transition) override;
    void on_recovery(const RecoveryContext& recovery) override;
    void on_stale_position(const PositionEntry& position) override;

private:
    std::vector<AlertSink*> sinks_;
};

// JSON renderings used by LogAlertSink
std::string render_alert(const OperationContext& operation, const StateTransition& transition);
std::string render_alert(const RecoveryContext& recovery);
std::string render_alert(const PositionEntry& position);

// Decouples producers from a slow sink
//
// Alerts are copied into a bounded queue and delivered to the downstream sink
// on a dedicated thread. When the queue is full the oldest alert is dropped.
// Before start() and after stop() alerts are delivered inline.
class AlertDispatcher : public AlertSink {
public:
    AlertDispatcher(AlertSink& downstream, size_t capacity);
    ~AlertDispatcher() override;

    AlertDispatcher(const AlertDispatcher&) = delete;
    AlertDispatcher& operator=(const AlertDispatcher&) = delete;

    void start();
    // Delivers everything still queued, then joins the worker
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] size_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }
    [[nodiscard]] size_t delivered() const noexcept { return delivered_.load(std::memory_order_relaxed); }
    [[nodiscard]] size_t pending() const;

    void on_transition(const OperationContext& operation,
                       const StateTransition& transition) override;
    void on_recovery(const RecoveryContext& recovery) override;
    void on_stale_position(const PositionEntry& position) override;

private:
    using Delivery = std::function<void(AlertSink&)>;

    void enqueue(Delivery delivery);
    void deliver(const Delivery& delivery);
    void run_loop();

    AlertSink& downstream_;
    size_t capacity_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Delivery> queue_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> dropped_{0};
    std::atomic<size_t> delivered_{0};
    std::unique_ptr<std::thread> worker_;
};

}  // namespace xarb
