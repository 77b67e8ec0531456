// xarb - Arbitrage Engine
// Wires the ledgers, state machine, orchestrator and recovery into one pipeline

#pragma once

#include <xarb/alerts.hpp>
#include <xarb/balance_ledger.hpp>
#include <xarb/config.hpp>
#include <xarb/exchange.hpp>
#include <xarb/opportunity.hpp>
#include <xarb/orchestrator.hpp>
#include <xarb/periodic.hpp>
#include <xarb/position_ledger.hpp>
#include <xarb/recovery.hpp>
#include <xarb/state_machine.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace xarb {

// What run() did with one opportunity
struct OperationOutcome {
    std::string operation_id;
    OperationState final_state{OperationState::Idle};
    std::optional<ExecutionReport> report;
    std::optional<std::string> recovery_id;  // set when execution fell short

    [[nodiscard]] bool is_completed() const noexcept { return final_state == OperationState::Completed; }
    [[nodiscard]] bool is_recovering() const noexcept { return recovery_id.has_value(); }
};

struct EngineStats {
    uint64_t opportunities_seen{0};
    uint64_t opportunities_rejected{0};
    uint64_t operations_completed{0};
    uint64_t operations_failed{0};
    uint64_t recoveries_started{0};
    StateMachineStats operations;
    BalanceStats balances;
    PositionStats positions;
    OrchestratorStats execution;
    RecoveryStats recovery;
};

class ArbitrageEngine {
public:
    // Throws ConfigError if the settings do not validate
    ArbitrageEngine(Settings settings,
                    const ExchangeRegistry& exchanges,
                    PriceSource& prices,
                    AlertSink& alerts);
    ~ArbitrageEngine();

    ArbitrageEngine(const ArbitrageEngine&) = delete;
    ArbitrageEngine& operator=(const ArbitrageEngine&) = delete;

    // Starts alert delivery and the background sweeps
    void start();
    // Stops the sweeps, cancels running recoveries and flushes alerts
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // Throws OpportunityRejected or ConcurrencyLimit before an operation exists.
    // Execution failures are handed to recovery, not thrown.
    OperationOutcome run(const ArbitrageOpportunity& opportunity,
                         ExecutionStrategy strategy = ExecutionStrategy::Simultaneous);

    // Throws OpportunityRejected or ConcurrencyLimit
    void screen(const ArbitrageOpportunity& opportunity) const;

    [[nodiscard]] EngineStats statistics() const;

    [[nodiscard]] const Settings& settings() const noexcept { return settings_; }
    OperationStateMachine& operations() noexcept { return state_machine_; }
    BalanceLedger& balances() noexcept { return balances_; }
    PositionLedger& positions() noexcept { return positions_; }
    ExecutionOrchestrator& orchestrator() noexcept { return orchestrator_; }
    RecoveryCoordinator& recovery() noexcept { return recovery_; }

private:
    OperationOutcome fail(OperationOutcome outcome, const std::string& reason);
    OperationOutcome recover(OperationOutcome outcome,
                             const std::shared_ptr<const ArbitrageOpportunity>& opportunity,
                             const ExecutionPlan& plan,
                             ExecutionStage stage,
                             const std::string& reason);

    void sweep();

    const Settings settings_;
    const ExchangeRegistry& exchanges_;
    PriceSource& prices_;

    AlertFanout fanout_;
    LogAlertSink log_sink_;
    AlertDispatcher dispatcher_;

    OperationStateMachine state_machine_;
    PositionLedger positions_;
    BalanceLedger balances_;
    ExecutionOrchestrator orchestrator_;
    RecoveryCoordinator recovery_;

    std::mutex admission_mutex_;
    std::vector<std::unique_ptr<PeriodicTask>> tasks_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> seen_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> recoveries_{0};
};

}  // namespace xarb
