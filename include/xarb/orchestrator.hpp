// xarb - Execution Orchestrator
// Builds ordered multi-leg plans and executes them across exchanges

#pragma once

#include <xarb/balance_ledger.hpp>
#include <xarb/config.hpp>
#include <xarb/exchange.hpp>
#include <xarb/opportunity.hpp>
#include <xarb/position_ledger.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace xarb {

/// How the legs of a plan are sequenced
enum class ExecutionStrategy : uint8_t {
    /// Every leg submitted at once
    Simultaneous = 0,
    /// Legs submitted back to back in priority order without waiting
    SequentialFast = 1,
    /// Next leg only after the previous fill is confirmed by the exchange
    SequentialSafe = 2,
    /// Hedge leg first, directional leg once the hedge filled
    HedgeFirst = 3,
    /// Directional leg first, hedge leg once it filled
    DirectionalFirst = 4
};

inline constexpr const char* to_string(ExecutionStrategy s) noexcept {
    switch (s) {
        case ExecutionStrategy::Simultaneous: return "simultaneous";
        case ExecutionStrategy::SequentialFast: return "sequential_fast";
        case ExecutionStrategy::SequentialSafe: return "sequential_safe";
        case ExecutionStrategy::HedgeFirst: return "hedge_first";
        case ExecutionStrategy::DirectionalFirst: return "directional_first";
    }
    return "unknown";
}

enum class LegRole : uint8_t {
    Directional = 0,  // buy leg
    Hedge = 1         // sell or futures leg offsetting it
};

inline constexpr const char* to_string(LegRole r) noexcept {
    return r == LegRole::Directional ? "directional" : "hedge";
}

// One order of a plan
struct OrderInstruction {
    std::string instruction_id;
    std::string exchange;
    std::string symbol;
    Side side{Side::Buy};
    OrderType order_type{OrderType::Market};
    Decimal quantity;
    std::optional<Decimal> price;  // expected price; reference only for market orders
    TimeInForce time_in_force{TimeInForce::IOC};
    LegRole role{LegRole::Directional};
    ExecutionStage fill_stage{ExecutionStage::SpotFilled};
    int priority{1};               // lower executes first
    std::optional<std::string> depends_on;
    int64_t max_execution_ms{30000};
    int precision{8};
    std::string required_asset;
    Decimal required_amount;

    [[nodiscard]] OrderRequest to_request() const;
};

// Immutable once built
struct ExecutionPlan {
    std::string plan_id;
    std::string opportunity_id;
    std::string operation_id;
    std::shared_ptr<const ArbitrageOpportunity> opportunity;
    ExecutionStrategy strategy{ExecutionStrategy::Simultaneous};
    std::vector<OrderInstruction> instructions;
    int64_t estimated_total_ms{0};
    int slippage_tolerance_bps{0};
    bool require_atomic_completion{true};
    int64_t created_at{0};

    // Instructions sorted by priority, plan order kept among equals
    [[nodiscard]] std::vector<const OrderInstruction*> ordered() const;
    [[nodiscard]] const OrderInstruction* find(LegRole role) const noexcept;

    // Copy with fresh plan and instruction ids, for sending the same legs again
    [[nodiscard]] ExecutionPlan reissued() const;
};

enum class LegStatus : uint8_t {
    Filled = 0,
    PartiallyFilled = 1,
    Rejected = 2,
    TimedOut = 3,
    NotSent = 4
};

inline constexpr const char* to_string(LegStatus s) noexcept {
    switch (s) {
        case LegStatus::Filled: return "filled";
        case LegStatus::PartiallyFilled: return "partially_filled";
        case LegStatus::Rejected: return "rejected";
        case LegStatus::TimedOut: return "timed_out";
        case LegStatus::NotSent: return "not_sent";
    }
    return "unknown";
}

struct LegResult {
    OrderInstruction instruction;
    LegStatus status{LegStatus::NotSent};
    std::optional<Order> order;
    std::optional<std::string> position_id;
    std::string error;
    int64_t latency_ms{0};

    [[nodiscard]] bool is_filled() const noexcept { return status == LegStatus::Filled; }
    [[nodiscard]] bool has_fill() const noexcept {
        return status == LegStatus::Filled || status == LegStatus::PartiallyFilled;
    }
    [[nodiscard]] bool was_sent() const noexcept { return status != LegStatus::NotSent; }
};

enum class ExecutionOutcome : uint8_t {
    Complete = 0,
    AtomicityViolation = 1,
    NoFill = 2
};

inline constexpr const char* to_string(ExecutionOutcome o) noexcept {
    switch (o) {
        case ExecutionOutcome::Complete: return "complete";
        case ExecutionOutcome::AtomicityViolation: return "atomicity_violation";
        case ExecutionOutcome::NoFill: return "no_fill";
    }
    return "unknown";
}

// Result of executing a plan; leg failures are reported here, never thrown
struct ExecutionReport {
    std::string plan_id;
    std::string operation_id;
    ExecutionStrategy strategy{ExecutionStrategy::Simultaneous};
    ExecutionOutcome outcome{ExecutionOutcome::NoFill};
    std::vector<LegResult> legs;
    std::vector<PositionEntry> positions;
    int64_t started_at{0};
    int64_t finished_at{0};

    [[nodiscard]] bool is_complete() const noexcept { return outcome == ExecutionOutcome::Complete; }
    [[nodiscard]] int64_t duration_ms() const noexcept { return finished_at - started_at; }

    // Stage the operation was in when execution stopped short
    [[nodiscard]] ExecutionStage failure_stage() const noexcept;
    [[nodiscard]] std::string failure_reason() const;

    // Throws AtomicityViolation unless complete
    void require_complete() const;
};

struct OrchestratorStats {
    uint64_t plans_built{0};
    uint64_t plans_executed{0};
    uint64_t plans_complete{0};
    uint64_t atomicity_violations{0};
    uint64_t legs_sent{0};
    uint64_t legs_filled{0};
    uint64_t legs_failed{0};
    size_t open_orders{0};
};

class ExecutionOrchestrator {
public:
    ExecutionOrchestrator(const Settings& settings,
                          const ExchangeRegistry& exchanges,
                          BalanceLedger& balances,
                          PositionLedger& positions);

    ExecutionOrchestrator(const ExecutionOrchestrator&) = delete;
    ExecutionOrchestrator& operator=(const ExecutionOrchestrator&) = delete;

    // Reserves the funds every leg needs that the operation does not already
    // hold. Throws InsufficientBalance and releases whatever this call reserved.
    std::vector<std::string> reserve(const ArbitrageOpportunity& opportunity,
                                     const std::string& operation_id);

    // Throws UnsupportedOpportunity for triangular opportunities
    ExecutionPlan build_plan(const ArbitrageOpportunity& opportunity,
                             ExecutionStrategy strategy,
                             const std::string& operation_id);

    // Throws ExchangeUnavailable or InsufficientBalance
    void validate(const ExecutionPlan& plan) const;

    ExecutionReport execute(const ExecutionPlan& plan);

    // Executes only the legs without a matching held position
    ExecutionReport execute_remaining(const ExecutionPlan& plan,
                                      const std::vector<PositionEntry>& held);

    // Best-effort cancel of orders still tracked as open
    size_t cancel_all(const std::optional<std::string>& exchange = std::nullopt);

    [[nodiscard]] OrchestratorStats statistics() const;

private:
    struct PendingLeg {
        const OrderInstruction* instruction{nullptr};
        std::future<Order> future;
        std::chrono::steady_clock::time_point deadline;
        int64_t sent_at{0};
        std::optional<LegResult> failed;  // set when submission itself failed
    };

    OrderInstruction make_leg(const ArbitrageOpportunity& opportunity, LegRole role) const;
    PendingLeg submit(const OrderInstruction& instruction);
    LegResult await_leg(PendingLeg& pending, bool confirm_fill);
    void cancel_best_effort(ExchangePort& port, const std::string& order_id, const std::string& symbol);
    void record_position(const ExecutionPlan& plan, LegResult& leg, ExecutionReport& report);
    void track_open(const std::string& order_id, const std::string& exchange, const std::string& symbol);
    void untrack(const std::string& order_id);

    const Settings& settings_;
    const ExchangeRegistry& exchanges_;
    BalanceLedger& balances_;
    PositionLedger& positions_;

    mutable std::mutex mutex_;
    // order id -> (exchange, symbol)
    std::unordered_map<std::string, std::pair<std::string, std::string>> open_orders_;
    OrchestratorStats stats_;
};

}  // namespace xarb
