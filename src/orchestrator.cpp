// xarb - Execution Orchestrator Implementation

#include <xarb/orchestrator.hpp>
#include <xarb/errors.hpp>
#include <xarb/logging.hpp>
#include <algorithm>
#include <thread>

namespace xarb {

namespace {

constexpr int64_t kLegLatencyEstimateMs = 20;

// Truncate toward zero to the given number of fractional digits
Decimal round_down(Decimal value, int precision) {
    int64_t step = 1;
    for (int i = precision; i < Decimal::PRECISION; ++i) step *= 10;
    return Decimal((value.scaled_value() / step) * step);
}

bool waits_between_legs(ExecutionStrategy strategy) noexcept {
    switch (strategy) {
        case ExecutionStrategy::Simultaneous:
        case ExecutionStrategy::SequentialFast:
            return false;
        case ExecutionStrategy::SequentialSafe:
        case ExecutionStrategy::HedgeFirst:
        case ExecutionStrategy::DirectionalFirst:
            return true;
    }
    return true;
}

}  // namespace

// ============================================================================
// Plan types
// ============================================================================

OrderRequest OrderInstruction::to_request() const {
    OrderRequest request = (order_type == OrderType::Limit && price)
        ? OrderRequest::limit(symbol, side, quantity, *price)
        : OrderRequest::market(symbol, side, quantity);
    request.with_time_in_force(time_in_force).with_client_id(instruction_id);
    return request;
}

std::vector<const OrderInstruction*> ExecutionPlan::ordered() const {
    std::vector<const OrderInstruction*> result;
    result.reserve(instructions.size());
    for (const auto& instr : instructions) {
        result.push_back(&instr);
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const OrderInstruction* a, const OrderInstruction* b) {
                         return a->priority < b->priority;
                     });
    return result;
}

const OrderInstruction* ExecutionPlan::find(LegRole role) const noexcept {
    for (const auto& instr : instructions) {
        if (instr.role == role) return &instr;
    }
    return nullptr;
}

ExecutionPlan ExecutionPlan::reissued() const {
    ExecutionPlan copy = *this;
    copy.plan_id = make_id("plan");
    copy.created_at = now_ms();

    std::unordered_map<std::string, std::string> renamed;
    for (auto& instr : copy.instructions) {
        auto fresh = make_id("leg");
        renamed[instr.instruction_id] = fresh;
        instr.instruction_id = fresh;
    }
    for (auto& instr : copy.instructions) {
        if (!instr.depends_on) continue;
        auto it = renamed.find(*instr.depends_on);
        if (it != renamed.end()) {
            instr.depends_on = it->second;
        } else {
            instr.depends_on.reset();
        }
    }
    return copy;
}

ExecutionStage ExecutionReport::failure_stage() const noexcept {
    bool any_sent = false;
    bool directional_fill = false;
    bool hedge_fill = false;
    bool directional_failed = false;

    for (const auto& leg : legs) {
        any_sent = any_sent || leg.was_sent();
        if (leg.instruction.role == LegRole::Directional) {
            directional_fill = directional_fill || leg.has_fill();
            directional_failed = directional_failed || (leg.was_sent() && !leg.has_fill());
        } else {
            hedge_fill = hedge_fill || leg.has_fill();
        }
    }

    if (!any_sent) return ExecutionStage::Preparing;
    if (directional_fill && !hedge_fill) return ExecutionStage::SpotFilled;
    if (hedge_fill && !directional_fill) return ExecutionStage::FuturesFilled;
    if (!directional_fill && !hedge_fill) {
        return directional_failed ? ExecutionStage::SpotOrdering
                                  : ExecutionStage::FuturesOrdering;
    }
    // Both sides hold fills but at least one is partial
    return ExecutionStage::ClosingPosition;
}

std::string ExecutionReport::failure_reason() const {
    std::string reason;
    for (const auto& leg : legs) {
        if (leg.is_filled()) continue;
        if (!reason.empty()) reason += "; ";
        reason += std::string(to_string(leg.instruction.role)) + " leg on " +
                  leg.instruction.exchange + " " + to_string(leg.status);
        if (!leg.error.empty()) reason += ": " + leg.error;
    }
    return reason.empty() ? std::string(to_string(outcome)) : reason;
}

void ExecutionReport::require_complete() const {
    if (outcome != ExecutionOutcome::Complete) {
        throw AtomicityViolation(
            "Plan " + plan_id + " created " + std::to_string(positions.size()) +
            " positions for " + std::to_string(legs.size()) + " legs: " + failure_reason());
    }
}

// ============================================================================
// ExecutionOrchestrator
// ============================================================================

ExecutionOrchestrator::ExecutionOrchestrator(const Settings& settings,
                                             const ExchangeRegistry& exchanges,
                                             BalanceLedger& balances,
                                             PositionLedger& positions)
    : settings_(settings),
      exchanges_(exchanges),
      balances_(balances),
      positions_(positions) {}

std::vector<std::string> ExecutionOrchestrator::reserve(const ArbitrageOpportunity& opportunity,
                                                        const std::string& operation_id) {
    auto directional = make_leg(opportunity, LegRole::Directional);
    auto hedge = make_leg(opportunity, LegRole::Hedge);

    // Legs the operation already holds are not reserved twice
    bool held[] = {
        balances_.holds(operation_id, directional.exchange, directional.required_asset),
        balances_.holds(operation_id, hedge.exchange, hedge.required_asset),
    };

    std::vector<std::string> ids;
    try {
        size_t i = 0;
        for (const auto* leg : {&directional, &hedge}) {
            if (!held[i++]) {
                ids.push_back(balances_.reserve(leg->exchange, leg->required_asset,
                                                leg->required_amount, operation_id));
            }
        }
    } catch (const InsufficientBalance&) {
        for (const auto& id : ids) {
            balances_.release(id);
        }
        throw;
    }
    return ids;
}

ExecutionPlan ExecutionOrchestrator::build_plan(const ArbitrageOpportunity& opportunity,
                                                ExecutionStrategy strategy,
                                                const std::string& operation_id) {
    auto directional = make_leg(opportunity, LegRole::Directional);
    auto hedge = make_leg(opportunity, LegRole::Hedge);

    ExecutionPlan plan;
    plan.plan_id = make_id("plan");
    plan.opportunity_id = opportunity.id;
    plan.operation_id = operation_id;
    plan.opportunity = std::make_shared<const ArbitrageOpportunity>(opportunity);
    plan.strategy = strategy;
    plan.slippage_tolerance_bps = settings_.risk.max_slippage_bps;
    plan.require_atomic_completion = true;
    plan.created_at = now_ms();

    switch (strategy) {
        case ExecutionStrategy::Simultaneous:
            directional.priority = 1;
            hedge.priority = 1;
            plan.instructions = {directional, hedge};
            break;
        case ExecutionStrategy::HedgeFirst:
            hedge.priority = 1;
            directional.priority = 2;
            directional.depends_on = hedge.instruction_id;
            plan.instructions = {hedge, directional};
            break;
        case ExecutionStrategy::SequentialFast:
        case ExecutionStrategy::SequentialSafe:
        case ExecutionStrategy::DirectionalFirst:
            directional.priority = 1;
            hedge.priority = 2;
            hedge.depends_on = directional.instruction_id;
            plan.instructions = {directional, hedge};
            break;
    }

    auto legs = static_cast<int64_t>(plan.instructions.size());
    plan.estimated_total_ms = strategy == ExecutionStrategy::Simultaneous
        ? kLegLatencyEstimateMs * 2
        : kLegLatencyEstimateMs * legs;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.plans_built;
    }

    Logger::debug("Built plan {} for {} ({}, {} legs, ~{}ms)",
                  plan.plan_id, opportunity.id, to_string(strategy), legs,
                  plan.estimated_total_ms);
    return plan;
}

void ExecutionOrchestrator::validate(const ExecutionPlan& plan) const {
    for (const auto& instr : plan.instructions) {
        if (!exchanges_.is_available(instr.exchange)) {
            throw ExchangeUnavailable(instr.exchange);
        }
    }

    for (const auto& instr : plan.instructions) {
        if (!balances_.holds(plan.operation_id, instr.exchange, instr.required_asset)) {
            throw InsufficientBalance(
                "No " + instr.required_asset + " reservation held on " + instr.exchange +
                " for operation " + plan.operation_id);
        }
    }
}

ExecutionReport ExecutionOrchestrator::execute(const ExecutionPlan& plan) {
    if (!plan.opportunity) {
        throw Error("Plan " + plan.plan_id + " carries no opportunity");
    }

    ExecutionReport report;
    report.plan_id = plan.plan_id;
    report.operation_id = plan.operation_id;
    report.strategy = plan.strategy;
    report.started_at = now_ms();

    Logger::info("Executing plan {} for {} ({}, {} legs)",
                 plan.plan_id, plan.opportunity_id, to_string(plan.strategy),
                 plan.instructions.size());

    auto legs = plan.ordered();

    if (!waits_between_legs(plan.strategy)) {
        std::vector<PendingLeg> pending;
        pending.reserve(legs.size());
        for (const auto* instr : legs) {
            pending.push_back(submit(*instr));
        }
        for (auto& p : pending) {
            auto result = await_leg(p, false);
            record_position(plan, result, report);
            report.legs.push_back(std::move(result));
        }
    } else {
        bool confirm = plan.strategy == ExecutionStrategy::SequentialSafe;
        bool blocked = false;
        for (const auto* instr : legs) {
            if (blocked) {
                LegResult skipped;
                skipped.instruction = *instr;
                skipped.status = LegStatus::NotSent;
                skipped.error = "previous leg did not fill";
                report.legs.push_back(std::move(skipped));
                continue;
            }

            auto p = submit(*instr);
            auto result = await_leg(p, confirm);
            record_position(plan, result, report);
            blocked = !result.is_filled();
            report.legs.push_back(std::move(result));
        }
    }

    bool any_partial = std::any_of(report.legs.begin(), report.legs.end(),
                                   [](const LegResult& l) {
                                       return l.status == LegStatus::PartiallyFilled;
                                   });

    if (report.positions.empty()) {
        report.outcome = ExecutionOutcome::NoFill;
    } else if (!plan.require_atomic_completion ||
               (report.positions.size() == plan.instructions.size() && !any_partial)) {
        report.outcome = ExecutionOutcome::Complete;
    } else {
        report.outcome = ExecutionOutcome::AtomicityViolation;
    }
    report.finished_at = now_ms();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.plans_executed;
        if (report.outcome == ExecutionOutcome::Complete) ++stats_.plans_complete;
        if (report.outcome == ExecutionOutcome::AtomicityViolation) ++stats_.atomicity_violations;
        for (const auto& leg : report.legs) {
            if (leg.is_filled()) {
                ++stats_.legs_filled;
            } else if (leg.was_sent()) {
                ++stats_.legs_failed;
            }
        }
    }

    switch (report.outcome) {
        case ExecutionOutcome::Complete:
            Logger::info("Plan {} complete in {}ms", plan.plan_id, report.duration_ms());
            break;
        case ExecutionOutcome::AtomicityViolation:
            Logger::error("Plan {} violated atomicity: {}", plan.plan_id, report.failure_reason());
            break;
        case ExecutionOutcome::NoFill:
            Logger::warn("Plan {} filled nothing: {}", plan.plan_id, report.failure_reason());
            break;
    }
    return report;
}

ExecutionReport ExecutionOrchestrator::execute_remaining(const ExecutionPlan& plan,
                                                         const std::vector<PositionEntry>& held) {
    ExecutionPlan remaining = plan.reissued();
    auto candidates = std::move(remaining.instructions);
    remaining.instructions.clear();

    std::vector<bool> used(held.size(), false);
    for (const auto& instr : candidates) {
        bool covered = false;
        for (size_t i = 0; i < held.size(); ++i) {
            if (!used[i] && held[i].exchange == instr.exchange &&
                held[i].symbol == instr.symbol && held[i].side == instr.side) {
                used[i] = true;
                covered = true;
                break;
            }
        }
        if (!covered) {
            remaining.instructions.push_back(instr);
        }
    }

    // Dependencies on legs that already filled are satisfied
    for (auto& instr : remaining.instructions) {
        if (!instr.depends_on) continue;
        bool pending = std::any_of(remaining.instructions.begin(), remaining.instructions.end(),
                                   [&](const OrderInstruction& other) {
                                       return other.instruction_id == *instr.depends_on;
                                   });
        if (!pending) instr.depends_on.reset();
    }

    if (remaining.instructions.empty()) {
        ExecutionReport report;
        report.plan_id = remaining.plan_id;
        report.operation_id = plan.operation_id;
        report.strategy = plan.strategy;
        report.outcome = ExecutionOutcome::Complete;
        report.started_at = report.finished_at = now_ms();
        return report;
    }

    Logger::info("Re-executing {} of {} legs of plan {}",
                 remaining.instructions.size(), plan.instructions.size(), plan.plan_id);
    return execute(remaining);
}

size_t ExecutionOrchestrator::cancel_all(const std::optional<std::string>& exchange) {
    std::vector<std::pair<std::string, std::pair<std::string, std::string>>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [order_id, where] : open_orders_) {
            if (!exchange || where.first == *exchange) {
                targets.emplace_back(order_id, where);
            }
        }
    }

    size_t cancelled = 0;
    for (const auto& [order_id, where] : targets) {
        auto* port = exchanges_.find(where.first);
        if (!port) continue;
        cancel_best_effort(*port, order_id, where.second);
        untrack(order_id);
        ++cancelled;
    }
    return cancelled;
}

OrchestratorStats ExecutionOrchestrator::statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    OrchestratorStats stats = stats_;
    stats.open_orders = open_orders_.size();
    return stats;
}

OrderInstruction ExecutionOrchestrator::make_leg(const ArbitrageOpportunity& opportunity,
                                                 LegRole role) const {
    if (opportunity.type == OpportunityType::Triangular) {
        throw UnsupportedOpportunity("Triangular opportunity " + opportunity.id +
                                     " cannot be executed across exchanges");
    }

    auto pair = TradingPair::from_symbol(opportunity.symbol);
    if (!pair) {
        throw UnsupportedOpportunity("Invalid symbol: " + opportunity.symbol);
    }

    int precision = settings_.general.quantity_precision;
    Decimal quantity = round_down(opportunity.max_quantity, precision);

    OrderInstruction leg;
    leg.instruction_id = make_id("leg");
    leg.order_type = OrderType::Market;
    leg.time_in_force = TimeInForce::IOC;
    leg.role = role;
    leg.max_execution_ms = settings_.general.leg_timeout_ms;
    leg.precision = precision;

    if (role == LegRole::Directional) {
        leg.exchange = opportunity.buy_exchange;
        leg.symbol = opportunity.symbol;
        leg.side = Side::Buy;
        leg.quantity = quantity;
        leg.price = opportunity.buy_price;
        leg.fill_stage = ExecutionStage::SpotFilled;
        leg.required_asset = pair->quote_asset();
        leg.required_amount = opportunity.required_balance_buy.is_positive()
            ? opportunity.required_balance_buy
            : quantity * opportunity.buy_price;
        return leg;
    }

    leg.exchange = opportunity.sell_exchange;
    leg.side = Side::Sell;

    if (opportunity.is_hedged()) {
        if (!opportunity.futures) {
            throw UnsupportedOpportunity("Opportunity " + opportunity.id + " has no futures leg");
        }
        const auto& futures = *opportunity.futures;
        leg.symbol = futures.symbol;
        leg.quantity = round_down(quantity * futures.hedge_ratio, precision);
        leg.price = futures.price;
        leg.fill_stage = ExecutionStage::FuturesFilled;
        // Futures margin is posted in the quote asset
        leg.required_asset = pair->quote_asset();
        leg.required_amount = opportunity.required_balance_sell.is_positive()
            ? opportunity.required_balance_sell
            : leg.quantity * futures.price;
        return leg;
    }

    leg.symbol = opportunity.symbol;
    leg.quantity = quantity;
    leg.price = opportunity.sell_price;
    leg.fill_stage = ExecutionStage::SpotFilled;
    leg.required_asset = pair->base_asset();
    leg.required_amount = opportunity.required_balance_sell.is_positive()
        ? opportunity.required_balance_sell
        : quantity;
    return leg;
}

ExecutionOrchestrator::PendingLeg ExecutionOrchestrator::submit(const OrderInstruction& instruction) {
    PendingLeg pending;
    pending.instruction = &instruction;
    pending.sent_at = now_ms();
    pending.deadline = std::chrono::steady_clock::now() +
                       std::chrono::milliseconds(instruction.max_execution_ms);

    try {
        auto& port = exchanges_.get(instruction.exchange);
        pending.future = port.place_order(instruction.to_request());
    } catch (const std::exception& e) {
        LegResult failed;
        failed.instruction = instruction;
        failed.status = LegStatus::Rejected;
        failed.error = e.what();
        pending.failed = std::move(failed);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.legs_sent;
    }
    Logger::debug("Sent {} {} {} {} on {}", instruction.instruction_id,
                  to_string(instruction.side), instruction.quantity.to_string(),
                  instruction.symbol, instruction.exchange);
    return pending;
}

LegResult ExecutionOrchestrator::await_leg(PendingLeg& pending, bool confirm_fill) {
    if (pending.failed) {
        Logger::warn("Leg {} rejected on submit: {}",
                     pending.failed->instruction.instruction_id, pending.failed->error);
        return *pending.failed;
    }

    const auto& instr = *pending.instruction;
    LegResult result;
    result.instruction = instr;

    auto* port = exchanges_.find(instr.exchange);

    Order order;
    try {
        order = await_until(pending.future, pending.deadline,
                            "order " + instr.instruction_id + " on " + instr.exchange);
    } catch (const OrderTimeout& e) {
        result.status = LegStatus::TimedOut;
        result.error = e.what();
        result.latency_ms = now_ms() - pending.sent_at;
        if (port) cancel_best_effort(*port, instr.instruction_id, instr.symbol);
        Logger::warn("Leg {} timed out after {}ms", instr.instruction_id, result.latency_ms);
        return result;
    } catch (const std::exception& e) {
        result.status = LegStatus::Rejected;
        result.error = e.what();
        result.latency_ms = now_ms() - pending.sent_at;
        Logger::warn("Leg {} rejected: {}", instr.instruction_id, e.what());
        return result;
    }

    if (order.is_open()) track_open(order.order_id, instr.exchange, instr.symbol);

    // Poll until the order is final, and always once when a fill confirmation is required
    bool confirmed = !confirm_fill && order.is_done();
    auto poll_interval = std::chrono::milliseconds(settings_.timing.status_poll_interval_ms);
    while (!confirmed && port) {
        if (std::chrono::steady_clock::now() >= pending.deadline) break;
        try {
            auto status = port->get_order_status(order.order_id, instr.symbol);
            order = await_until(status, pending.deadline, "status of " + order.order_id);
            if (order.is_done()) {
                confirmed = true;
                break;
            }
        } catch (const OrderTimeout&) {
            break;
        } catch (const ExchangeError& e) {
            Logger::warn("Status query for {} failed: {}", order.order_id, e.what());
        }
        auto remaining = pending.deadline - std::chrono::steady_clock::now();
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(poll_interval, remaining));
    }

    if (!order.is_done() && port) {
        cancel_best_effort(*port, order.order_id, instr.symbol);
    }
    untrack(order.order_id);

    result.latency_ms = now_ms() - pending.sent_at;
    if (order.status == OrderStatus::Filled ||
        (order.has_fill() && order.filled_quantity >= instr.quantity)) {
        result.status = LegStatus::Filled;
    } else if (order.has_fill()) {
        result.status = LegStatus::PartiallyFilled;
        result.error = "filled " + order.filled_quantity.to_string() + " of " +
                       instr.quantity.to_string();
    } else if (!order.is_done()) {
        result.status = LegStatus::TimedOut;
        result.error = "not filled within " + std::to_string(instr.max_execution_ms) + "ms";
    } else {
        result.status = LegStatus::Rejected;
        result.error = std::string("order ") + to_string(order.status);
    }
    result.order = std::move(order);
    return result;
}

void ExecutionOrchestrator::cancel_best_effort(ExchangePort& port,
                                               const std::string& order_id,
                                               const std::string& symbol) {
    try {
        auto future = port.cancel_order(order_id, symbol);
        bool ok = await_for(future, std::chrono::milliseconds(settings_.general.leg_timeout_ms),
                            "cancel of " + order_id);
        if (!ok) {
            Logger::warn("Cancel of {} on {} was refused", order_id, port.name());
        }
    } catch (const std::exception& e) {
        Logger::warn("Cancel of {} on {} failed: {}", order_id, port.name(), e.what());
    }
}

void ExecutionOrchestrator::record_position(const ExecutionPlan& plan,
                                            LegResult& leg,
                                            ExecutionReport& report) {
    if (!leg.has_fill() || !leg.order) return;

    const auto& order = *leg.order;
    const auto& instr = leg.instruction;
    Decimal price = order.fill_price().value_or(instr.price.value_or(Decimal::zero()));
    Decimal remaining = leg.status == LegStatus::PartiallyFilled
        ? instr.quantity - order.filled_quantity
        : Decimal::zero();
    bool is_hedge = instr.role == LegRole::Hedge && plan.opportunity->is_hedged();

    auto position = positions_.open(*plan.opportunity, instr.exchange, instr.symbol, instr.side,
                                    order.filled_quantity, price, order.order_id,
                                    instr.fill_stage, is_hedge, order.fee, remaining);
    leg.position_id = position.position_id;
    report.positions.push_back(std::move(position));
}

void ExecutionOrchestrator::track_open(const std::string& order_id,
                                       const std::string& exchange,
                                       const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_orders_[order_id] = {exchange, symbol};
}

void ExecutionOrchestrator::untrack(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_orders_.erase(order_id);
}

}  // namespace xarb
