// xarb - Recovery Coordinator
// Failure analysis and compensating actions for partially executed operations

#pragma once

#include <xarb/alerts.hpp>
#include <xarb/balance_ledger.hpp>
#include <xarb/config.hpp>
#include <xarb/exchange.hpp>
#include <xarb/orchestrator.hpp>
#include <xarb/position_ledger.hpp>
#include <xarb/state_machine.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace xarb {

/// Compensating action family
enum class RecoveryStrategy : uint8_t {
    /// Re-execute the legs that never filled
    CompleteExecution = 0,
    /// Close every affected position at market
    UnwindPositions = 1,
    /// Place the missing hedge at the current market price
    HedgeImmediately = 2,
    /// Back off, then run the original plan again
    WaitAndRetry = 3,
    /// Hand over to an operator
    ManualIntervention = 4,
    /// Close every live position of the opportunity at market
    EmergencyLiquidation = 5
};

inline constexpr const char* to_string(RecoveryStrategy s) noexcept {
    switch (s) {
        case RecoveryStrategy::CompleteExecution: return "complete_execution";
        case RecoveryStrategy::UnwindPositions: return "unwind_positions";
        case RecoveryStrategy::HedgeImmediately: return "hedge_immediately";
        case RecoveryStrategy::WaitAndRetry: return "wait_and_retry";
        case RecoveryStrategy::ManualIntervention: return "manual_intervention";
        case RecoveryStrategy::EmergencyLiquidation: return "emergency_liquidation";
    }
    return "unknown";
}

enum class RecoveryStatus : uint8_t {
    Initiated = 0,
    InProgress = 1,
    PartiallyComplete = 2,
    CompletedSuccess = 3,
    CompletedFailure = 4,
    Escalated = 5,
    Cancelled = 6
};

inline constexpr const char* to_string(RecoveryStatus s) noexcept {
    switch (s) {
        case RecoveryStatus::Initiated: return "initiated";
        case RecoveryStatus::InProgress: return "in_progress";
        case RecoveryStatus::PartiallyComplete: return "partially_complete";
        case RecoveryStatus::CompletedSuccess: return "completed_success";
        case RecoveryStatus::CompletedFailure: return "completed_failure";
        case RecoveryStatus::Escalated: return "escalated";
        case RecoveryStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

// COMPLETED_FAILURE is followed by ESCALATED, so it is not terminal
inline constexpr bool is_terminal(RecoveryStatus s) noexcept {
    return s == RecoveryStatus::CompletedSuccess ||
           s == RecoveryStatus::Escalated ||
           s == RecoveryStatus::Cancelled;
}

// One compensating order
struct RecoveryAction {
    std::string action_id;
    RecoveryStrategy strategy{RecoveryStrategy::UnwindPositions};
    std::string exchange;
    std::string symbol;
    Side side{Side::Buy};
    Decimal quantity;
    std::optional<Decimal> price;
    std::optional<std::string> order_id;
    bool success{false};
    std::string result;
    int64_t timestamp{0};
};

struct RecoveryContext {
    std::string recovery_id;
    std::string operation_id;
    std::string opportunity_id;
    std::string failure_reason;
    ExecutionStage failure_stage{ExecutionStage::Preparing};
    std::vector<PositionEntry> affected_positions;
    RecoveryStrategy strategy{RecoveryStrategy::UnwindPositions};
    RecoveryStatus status{RecoveryStatus::Initiated};
    int attempts{0};
    int max_attempts{3};
    Decimal estimated_loss;
    std::vector<RecoveryAction> actions;
    bool requires_manual_approval{false};
    std::optional<std::string> error;
    int64_t created_at{0};
    int64_t updated_at{0};
    int64_t completed_at{0};
    ContextMap metadata;

    [[nodiscard]] bool is_terminal() const noexcept { return xarb::is_terminal(status); }
};

// Everything a recovery needs to act on a failed execution
struct RecoveryRequest {
    std::string operation_id;
    std::string opportunity_id;
    std::string failure_reason;
    ExecutionStage failure_stage{ExecutionStage::Preparing};
    std::vector<PositionEntry> affected_positions;
    std::shared_ptr<const ArbitrageOpportunity> opportunity;
    std::optional<ExecutionPlan> plan;               // required for complete/retry
    std::optional<RecoveryStrategy> strategy;        // overrides the stage mapping
};

struct RecoveryStats {
    size_t total{0};
    size_t active{0};
    size_t awaiting_approval{0};
    size_t succeeded{0};
    size_t escalated{0};
    size_t cancelled{0};
    std::map<RecoveryStrategy, size_t> by_strategy;
    Decimal total_estimated_loss;
};

// Runs each recovery on its own thread
//
// Outcomes are reported back to the state machine: COMPLETED for hedge,
// complete and retry; FAILED for unwind; FAILED plus the manual-intervention
// flag on escalation and cancellation. The operation's reservations are
// released when the recovery reaches a terminal status.
class RecoveryCoordinator {
public:
    RecoveryCoordinator(const Settings& settings,
                        const ExchangeRegistry& exchanges,
                        PriceSource& prices,
                        OperationStateMachine& state_machine,
                        ExecutionOrchestrator& orchestrator,
                        PositionLedger& positions,
                        BalanceLedger& balances,
                        AlertSink& alerts);
    ~RecoveryCoordinator();

    RecoveryCoordinator(const RecoveryCoordinator&) = delete;
    RecoveryCoordinator& operator=(const RecoveryCoordinator&) = delete;

    [[nodiscard]] static RecoveryStrategy select_strategy(ExecutionStage stage) noexcept;

    // Fraction of the slippage allowance a strategy is expected to pay
    [[nodiscard]] static int slippage_multiplier(RecoveryStrategy strategy) noexcept;

    // Mark-to-market loss of the positions plus the expected cost of closing them
    Decimal estimate_loss(const std::vector<PositionEntry>& positions, RecoveryStrategy strategy);

    // Starts the recovery unless it needs manual approval
    RecoveryContext initiate(RecoveryRequest request);

    // Starts a recovery held for approval; false if it was not waiting
    bool approve(const std::string& recovery_id);

    // False if the recovery already finished
    bool cancel(const std::string& recovery_id, const std::string& reason);

    [[nodiscard]] std::optional<RecoveryContext> get(const std::string& recovery_id) const;
    [[nodiscard]] std::vector<RecoveryContext> active() const;
    [[nodiscard]] std::vector<RecoveryContext> for_operation(const std::string& operation_id) const;
    [[nodiscard]] RecoveryStats statistics() const;

    // Blocks until the recovery is terminal; nullopt on timeout. Throws RecoveryNotFound.
    std::optional<RecoveryContext> wait(const std::string& recovery_id,
                                        std::chrono::milliseconds timeout);

    // Removes terminal recoveries older than max_age_ms
    size_t cleanup(int64_t max_age_ms);

    // Cancels running recoveries and joins their threads
    void shutdown();

private:
    struct Entry {
        RecoveryContext context;
        RecoveryRequest request;
        std::shared_ptr<std::atomic<bool>> cancelled = std::make_shared<std::atomic<bool>>(false);
        std::future<void> task;
    };

    using Deadline = std::chrono::steady_clock::time_point;

    void start(const std::string& recovery_id);
    void run(const std::string& recovery_id);

    bool execute_strategy(const std::string& recovery_id,
                          RecoveryStrategy strategy,
                          const RecoveryRequest& request,
                          Deadline deadline,
                          const std::atomic<bool>& cancelled);
    bool hedge_immediately(const std::string& recovery_id, const RecoveryRequest& request,
                           Deadline deadline, const std::atomic<bool>& cancelled);
    bool unwind(const std::string& recovery_id, RecoveryStrategy strategy,
                const std::vector<PositionEntry>& positions,
                Deadline deadline, const std::atomic<bool>& cancelled);
    bool complete_execution(const std::string& recovery_id, const RecoveryRequest& request,
                            Deadline deadline);
    bool wait_and_retry(const std::string& recovery_id, const RecoveryRequest& request,
                        Deadline deadline, const std::atomic<bool>& cancelled);

    // Refreshes both exchanges, reserves what the operation lacks and validates
    // the plan. Throws ExchangeError or InsufficientBalance.
    void prepare_retry(const RecoveryRequest& request, const ExecutionPlan& plan);
    // Copy of the plan whose legs finish before the recovery deadline
    ExecutionPlan bounded(const ExecutionPlan& plan, Deadline deadline) const;

    Order submit_and_confirm(const std::string& exchange, const OrderRequest& request,
                             Deadline deadline, const std::atomic<bool>& cancelled);
    Decimal fetch_price(const std::string& symbol, const std::string& exchange, Deadline deadline);

    void report_success(const std::string& recovery_id, RecoveryStrategy strategy,
                        const RecoveryRequest& request);
    void escalate(const std::string& recovery_id, const RecoveryRequest& request,
                  const std::string& reason);
    void finish(const std::string& recovery_id, RecoveryStatus status,
                std::optional<std::string> error = std::nullopt);
    // Ends a cancelled recovery's operation in FAILED with the manual flag
    void abandon(const std::string& operation_id, const std::string& reason);

    void set_status(const std::string& recovery_id, RecoveryStatus status,
                    std::optional<std::string> error = std::nullopt);
    void set_strategy(const std::string& recovery_id, RecoveryStrategy strategy);
    void record_action(const std::string& recovery_id, RecoveryAction action);
    int next_attempt(const std::string& recovery_id);

    const Settings& settings_;
    const ExchangeRegistry& exchanges_;
    PriceSource& prices_;
    OperationStateMachine& state_machine_;
    ExecutionOrchestrator& orchestrator_;
    PositionLedger& positions_;
    BalanceLedger& balances_;
    AlertSink& alerts_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace xarb
