// xarb - Recovery Coordinator Implementation

#include <xarb/recovery.hpp>
#include <xarb/errors.hpp>
#include <xarb/logging.hpp>
#include <algorithm>
#include <thread>

namespace xarb {

using Clock = std::chrono::steady_clock;

RecoveryCoordinator::RecoveryCoordinator(const Settings& settings,
                                         const ExchangeRegistry& exchanges,
                                         PriceSource& prices,
                                         OperationStateMachine& state_machine,
                                         ExecutionOrchestrator& orchestrator,
                                         PositionLedger& positions,
                                         BalanceLedger& balances,
                                         AlertSink& alerts)
    : settings_(settings),
      exchanges_(exchanges),
      prices_(prices),
      state_machine_(state_machine),
      orchestrator_(orchestrator),
      positions_(positions),
      balances_(balances),
      alerts_(alerts) {}

RecoveryCoordinator::~RecoveryCoordinator() {
    shutdown();
}

RecoveryStrategy RecoveryCoordinator::select_strategy(ExecutionStage stage) noexcept {
    switch (stage) {
        case ExecutionStage::SpotFilled: return RecoveryStrategy::HedgeImmediately;
        case ExecutionStage::FuturesOrdering: return RecoveryStrategy::CompleteExecution;
        case ExecutionStage::Preparing: return RecoveryStrategy::WaitAndRetry;
        case ExecutionStage::SpotOrdering:
        case ExecutionStage::FuturesFilled:
        case ExecutionStage::ClosingPosition:
            return RecoveryStrategy::UnwindPositions;
    }
    return RecoveryStrategy::UnwindPositions;
}

int RecoveryCoordinator::slippage_multiplier(RecoveryStrategy strategy) noexcept {
    switch (strategy) {
        case RecoveryStrategy::WaitAndRetry: return 0;
        case RecoveryStrategy::CompleteExecution:
        case RecoveryStrategy::UnwindPositions:
        case RecoveryStrategy::HedgeImmediately:
            return 1;
        case RecoveryStrategy::ManualIntervention:
        case RecoveryStrategy::EmergencyLiquidation:
            return 2;
    }
    return 1;
}

Decimal RecoveryCoordinator::estimate_loss(const std::vector<PositionEntry>& positions,
                                           RecoveryStrategy strategy) {
    Decimal loss;
    Decimal slippage = Decimal::bps(settings_.risk.recovery_slippage_bps) *
                       Decimal::from_int(slippage_multiplier(strategy));
    auto deadline = Clock::now() + std::chrono::milliseconds(settings_.general.leg_timeout_ms);

    for (const auto& pos : positions) {
        Decimal price = pos.entry_price;
        try {
            price = fetch_price(pos.symbol, pos.exchange, deadline);
        } catch (const std::exception& e) {
            Logger::warn("No current price for {} on {}, valuing at entry: {}",
                         pos.symbol, pos.exchange, e.what());
        }

        Decimal pnl = pos.unrealized_pnl(price) - pos.fees;
        if (pnl.is_negative()) loss += -pnl;
        loss += pos.notional().abs() * slippage;
    }
    return loss;
}

RecoveryContext RecoveryCoordinator::initiate(RecoveryRequest request) {
    RecoveryContext ctx;
    ctx.recovery_id = make_id("rec");
    ctx.operation_id = request.operation_id;
    ctx.opportunity_id = request.opportunity_id;
    ctx.failure_reason = request.failure_reason;
    ctx.failure_stage = request.failure_stage;
    ctx.affected_positions = request.affected_positions;
    ctx.strategy = request.strategy.value_or(select_strategy(request.failure_stage));
    ctx.status = RecoveryStatus::Initiated;
    ctx.max_attempts = settings_.risk.max_recovery_attempts;
    ctx.estimated_loss = estimate_loss(request.affected_positions, ctx.strategy);
    ctx.requires_manual_approval =
        ctx.strategy == RecoveryStrategy::ManualIntervention ||
        ctx.strategy == RecoveryStrategy::EmergencyLiquidation ||
        ctx.estimated_loss > settings_.risk.max_single_loss;
    ctx.created_at = now_ms();
    ctx.updated_at = ctx.created_at;
    ctx.metadata["failure_stage"] = to_string(request.failure_stage);
    if (request.opportunity) {
        ctx.metadata["opportunity_type"] = to_string(request.opportunity->type);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry entry;
        entry.context = ctx;
        entry.request = std::move(request);
        entries_.emplace(ctx.recovery_id, std::move(entry));
    }

    Logger::warn("Recovery {} for operation {}: {} at stage {}, estimated loss {} ({})",
                 ctx.recovery_id, ctx.operation_id, to_string(ctx.strategy),
                 to_string(ctx.failure_stage), ctx.estimated_loss.to_string(),
                 ctx.failure_reason);
    alerts_.on_recovery(ctx);

    if (ctx.requires_manual_approval) {
        Logger::error("Recovery {} awaits manual approval (estimated loss {}, limit {})",
                      ctx.recovery_id, ctx.estimated_loss.to_string(),
                      settings_.risk.max_single_loss.to_string());
    } else {
        start(ctx.recovery_id);
    }
    return ctx;
}

bool RecoveryCoordinator::approve(const std::string& recovery_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(recovery_id);
        if (it == entries_.end()) {
            throw RecoveryNotFound(recovery_id);
        }
        auto& ctx = it->second.context;
        if (ctx.status != RecoveryStatus::Initiated || !ctx.requires_manual_approval ||
            ctx.metadata.count("approved") > 0) {
            return false;
        }
        ctx.metadata["approved"] = "true";
        ctx.updated_at = now_ms();
    }

    Logger::info("Recovery {} approved", recovery_id);
    start(recovery_id);
    return true;
}

bool RecoveryCoordinator::cancel(const std::string& recovery_id, const std::string& reason) {
    bool running = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(recovery_id);
        if (it == entries_.end()) {
            throw RecoveryNotFound(recovery_id);
        }
        auto& entry = it->second;
        if (entry.context.is_terminal() || entry.cancelled->load()) {
            return false;
        }
        entry.cancelled->store(true);
        entry.context.metadata["cancel_reason"] = reason;
        running = entry.task.valid();
    }
    cv_.notify_all();

    Logger::warn("Recovery {} cancelled: {}", recovery_id, reason);
    // A running task observes the flag and finishes itself
    if (!running) {
        finish(recovery_id, RecoveryStatus::Cancelled, reason);
    }
    return true;
}

std::optional<RecoveryContext> RecoveryCoordinator::get(const std::string& recovery_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(recovery_id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.context;
}

std::vector<RecoveryContext> RecoveryCoordinator::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RecoveryContext> result;
    for (const auto& [id, entry] : entries_) {
        if (!entry.context.is_terminal()) result.push_back(entry.context);
    }
    return result;
}

std::vector<RecoveryContext> RecoveryCoordinator::for_operation(const std::string& operation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RecoveryContext> result;
    for (const auto& [id, entry] : entries_) {
        if (entry.context.operation_id == operation_id) result.push_back(entry.context);
    }
    std::sort(result.begin(), result.end(),
              [](const RecoveryContext& a, const RecoveryContext& b) {
                  return a.created_at < b.created_at;
              });
    return result;
}

RecoveryStats RecoveryCoordinator::statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RecoveryStats stats;
    stats.total = entries_.size();
    for (const auto& [id, entry] : entries_) {
        const auto& ctx = entry.context;
        ++stats.by_strategy[ctx.strategy];
        stats.total_estimated_loss += ctx.estimated_loss;
        switch (ctx.status) {
            case RecoveryStatus::Initiated:
                if (ctx.requires_manual_approval) ++stats.awaiting_approval;
                ++stats.active;
                break;
            case RecoveryStatus::InProgress:
            case RecoveryStatus::PartiallyComplete:
            case RecoveryStatus::CompletedFailure:
                ++stats.active;
                break;
            case RecoveryStatus::CompletedSuccess: ++stats.succeeded; break;
            case RecoveryStatus::Escalated: ++stats.escalated; break;
            case RecoveryStatus::Cancelled: ++stats.cancelled; break;
        }
    }
    return stats;
}

std::optional<RecoveryContext> RecoveryCoordinator::wait(const std::string& recovery_id,
                                                         std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (entries_.find(recovery_id) == entries_.end()) {
        throw RecoveryNotFound(recovery_id);
    }

    cv_.wait_for(lock, timeout, [&] {
        auto it = entries_.find(recovery_id);
        return it == entries_.end() || it->second.context.is_terminal();
    });

    auto it = entries_.find(recovery_id);
    if (it == entries_.end()) {
        throw RecoveryNotFound(recovery_id);
    }
    if (!it->second.context.is_terminal()) return std::nullopt;
    return it->second.context;
}

size_t RecoveryCoordinator::cleanup(int64_t max_age_ms) {
    int64_t now = now_ms();
    std::vector<std::future<void>> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            const auto& ctx = it->second.context;
            if (ctx.is_terminal() && now - ctx.completed_at > max_age_ms) {
                if (it->second.task.valid()) finished.push_back(std::move(it->second.task));
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }
    // Joined outside the lock
    for (auto& task : finished) task.wait();
    return finished.size();
}

void RecoveryCoordinator::shutdown() {
    std::vector<std::future<void>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, entry] : entries_) {
            if (!entry.task.valid()) continue;
            if (!entry.context.is_terminal() && !entry.cancelled->exchange(true)) {
                entry.context.metadata["cancel_reason"] = "shutdown";
            }
            tasks.push_back(std::move(entry.task));
        }
    }
    cv_.notify_all();

    for (auto& task : tasks) {
        task.wait();
    }
}

// ============================================================================
// Execution
// ============================================================================

void RecoveryCoordinator::start(const std::string& recovery_id) {
    auto task = std::async(std::launch::async, [this, recovery_id] { run(recovery_id); });
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(recovery_id);
    if (it != entries_.end()) {
        it->second.task = std::move(task);
    }
}

void RecoveryCoordinator::run(const std::string& recovery_id) {
    RecoveryRequest request;
    RecoveryStrategy strategy;
    std::shared_ptr<std::atomic<bool>> cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(recovery_id);
        if (it == entries_.end()) return;
        request = it->second.request;
        strategy = it->second.context.strategy;
        cancelled = it->second.cancelled;
    }

    set_status(recovery_id, RecoveryStatus::InProgress);
    auto deadline = Clock::now() + std::chrono::milliseconds(settings_.risk.recovery_timeout_ms);

    bool success = false;
    std::string failure;
    try {
        bool done = execute_strategy(recovery_id, strategy, request, deadline, *cancelled);
        if (done && !cancelled->load()) {
            report_success(recovery_id, strategy, request);
        }
        success = done;
        if (!done) {
            failure = std::string("strategy ") + to_string(strategy) + " did not complete";
        }
    } catch (const RecoveryExhausted& e) {
        set_strategy(recovery_id, RecoveryStrategy::ManualIntervention);
        failure = e.what();
    } catch (const std::exception& e) {
        failure = e.what();
    }

    if (cancelled->load()) {
        finish(recovery_id, RecoveryStatus::Cancelled, "cancelled");
    } else if (success) {
        finish(recovery_id, RecoveryStatus::CompletedSuccess);
    } else {
        escalate(recovery_id, request, failure);
    }
}

bool RecoveryCoordinator::execute_strategy(const std::string& recovery_id,
                                           RecoveryStrategy strategy,
                                           const RecoveryRequest& request,
                                           Deadline deadline,
                                           const std::atomic<bool>& cancelled) {
    switch (strategy) {
        case RecoveryStrategy::HedgeImmediately:
            return hedge_immediately(recovery_id, request, deadline, cancelled);
        case RecoveryStrategy::UnwindPositions:
            return unwind(recovery_id, strategy, request.affected_positions, deadline, cancelled);
        case RecoveryStrategy::EmergencyLiquidation:
            return unwind(recovery_id, strategy, positions_.positions_for(request.opportunity_id),
                          deadline, cancelled);
        case RecoveryStrategy::CompleteExecution:
            return complete_execution(recovery_id, request, deadline);
        case RecoveryStrategy::WaitAndRetry:
            return wait_and_retry(recovery_id, request, deadline, cancelled);
        case RecoveryStrategy::ManualIntervention:
            Logger::warn("Recovery {} is left to an operator", recovery_id);
            return false;
    }
    return false;
}

bool RecoveryCoordinator::hedge_immediately(const std::string& recovery_id,
                                            const RecoveryRequest& request,
                                            Deadline deadline,
                                            const std::atomic<bool>& cancelled) {
    next_attempt(recovery_id);
    const auto& opportunity = request.opportunity;
    if (!opportunity) {
        throw Error("Hedge recovery " + recovery_id + " has no opportunity");
    }

    bool futures = opportunity->is_hedged() && opportunity->futures.has_value();
    bool all_hedged = true;

    for (const auto& pos : request.affected_positions) {
        if (cancelled.load()) return false;
        if (pos.is_hedge || !positions_.get(pos.position_id)) continue;

        RecoveryAction action;
        action.action_id = make_id("act");
        action.strategy = RecoveryStrategy::HedgeImmediately;
        action.exchange = opportunity->sell_exchange;
        action.symbol = futures ? opportunity->futures->symbol : pos.symbol;
        action.side = opposite(pos.side);
        action.quantity = futures ? pos.quantity * opportunity->futures->hedge_ratio : pos.quantity;
        action.timestamp = now_ms();

        Decimal market = fetch_price(action.symbol, action.exchange, deadline);
        action.price = market;

        auto request_order = OrderRequest::market(action.symbol, action.side, action.quantity);
        request_order.with_client_id(action.action_id);

        try {
            Order order = submit_and_confirm(action.exchange, request_order, deadline, cancelled);
            action.order_id = order.order_id;
            if (order.has_fill()) {
                Decimal fill = order.fill_price().value_or(market);
                Decimal remaining = max(action.quantity - order.filled_quantity, Decimal::zero());
                positions_.open(*opportunity, action.exchange, action.symbol, action.side,
                                order.filled_quantity, fill, order.order_id,
                                futures ? ExecutionStage::FuturesFilled : ExecutionStage::SpotFilled,
                                futures, order.fee, remaining);
                action.price = fill;
            }
            action.success = order.status == OrderStatus::Filled ||
                             order.filled_quantity >= action.quantity;
            action.result = to_string(order.status);
        } catch (const ExchangeError& e) {
            action.result = e.what();
        }

        all_hedged = all_hedged && action.success;
        record_action(recovery_id, std::move(action));
    }
    return all_hedged;
}

bool RecoveryCoordinator::unwind(const std::string& recovery_id,
                                 RecoveryStrategy strategy,
                                 const std::vector<PositionEntry>& positions,
                                 Deadline deadline,
                                 const std::atomic<bool>& cancelled) {
    next_attempt(recovery_id);
    size_t closed = 0;
    bool all_closed = true;

    for (const auto& pos : positions) {
        if (cancelled.load()) return false;
        if (!positions_.get(pos.position_id)) {
            ++closed;
            continue;
        }

        RecoveryAction action;
        action.action_id = make_id("act");
        action.strategy = strategy;
        action.exchange = pos.exchange;
        action.symbol = pos.symbol;
        action.side = opposite(pos.side);
        action.quantity = pos.quantity;
        action.timestamp = now_ms();

        auto request_order = OrderRequest::market(pos.symbol, action.side, pos.quantity);
        request_order.with_client_id(action.action_id);
        if (pos.is_hedge) request_order.with_reduce_only();

        try {
            Order order = submit_and_confirm(pos.exchange, request_order, deadline, cancelled);
            action.order_id = order.order_id;
            if (order.status == OrderStatus::Filled || order.filled_quantity >= pos.quantity) {
                auto fill = order.fill_price();
                Decimal close_price = fill ? *fill : fetch_price(pos.symbol, pos.exchange, deadline);
                auto result = positions_.close(pos.position_id, close_price, order.order_id);
                action.price = result.close_price;
                action.success = true;
                action.result = "closed, realized " + result.realized_pnl.to_string();
            } else {
                action.result = std::string("order ") + to_string(order.status);
            }
        } catch (const ExchangeError& e) {
            action.result = e.what();
        }

        bool ok = action.success;
        record_action(recovery_id, std::move(action));
        if (ok) {
            ++closed;
            if (closed < positions.size()) {
                set_status(recovery_id, RecoveryStatus::PartiallyComplete);
            }
        } else {
            all_closed = false;
        }
    }
    return all_closed;
}

bool RecoveryCoordinator::complete_execution(const std::string& recovery_id,
                                             const RecoveryRequest& request,
                                             Deadline deadline) {
    next_attempt(recovery_id);
    if (!request.plan) {
        throw Error("Complete-execution recovery " + recovery_id + " has no plan");
    }

    auto held = positions_.positions_for(request.opportunity_id);
    auto report = orchestrator_.execute_remaining(bounded(*request.plan, deadline), held);

    for (const auto& leg : report.legs) {
        RecoveryAction action;
        action.action_id = make_id("act");
        action.strategy = RecoveryStrategy::CompleteExecution;
        action.exchange = leg.instruction.exchange;
        action.symbol = leg.instruction.symbol;
        action.side = leg.instruction.side;
        action.quantity = leg.instruction.quantity;
        if (leg.order) {
            action.order_id = leg.order->order_id;
            action.price = leg.order->fill_price();
        }
        action.success = leg.is_filled();
        action.result = leg.error.empty() ? to_string(leg.status) : leg.error;
        action.timestamp = now_ms();
        record_action(recovery_id, std::move(action));
    }
    return report.is_complete();
}

bool RecoveryCoordinator::wait_and_retry(const std::string& recovery_id,
                                         const RecoveryRequest& request,
                                         Deadline deadline,
                                         const std::atomic<bool>& cancelled) {
    if (!request.plan || !request.opportunity) {
        throw Error("Retry recovery " + recovery_id + " has no plan");
    }

    const auto& operation_id = request.operation_id;
    while (true) {
        if (cancelled.load()) return false;

        auto operation = state_machine_.get(operation_id);
        if (!operation) {
            throw UnknownOperation(operation_id);
        }

        int attempt = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            attempt = entries_.at(recovery_id).context.attempts;
        }
        if (operation->requires_manual_intervention ||
            attempt >= settings_.risk.max_recovery_attempts) {
            throw RecoveryExhausted("Operation " + operation_id + " exhausted " +
                                    std::to_string(attempt) + " retry attempts");
        }

        int64_t factor = std::min<int64_t>(int64_t{1} << std::min(attempt, 30),
                                           settings_.timing.retry_backoff_cap);
        auto backoff = std::chrono::milliseconds(factor * settings_.timing.retry_backoff_unit_ms);
        if (Clock::now() + backoff > deadline) {
            throw Error("Recovery " + recovery_id + " would exceed its timeout");
        }

        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, backoff, [&] { return cancelled.load(); })) {
                return false;
            }
        }

        int current = next_attempt(recovery_id);
        Logger::info("Recovery {} retry {} for operation {}", recovery_id, current, operation_id);

        RecoveryAction action;
        action.action_id = make_id("act");
        action.strategy = RecoveryStrategy::WaitAndRetry;
        if (const auto* leg = request.plan->find(LegRole::Directional)) {
            action.exchange = leg->exchange;
            action.symbol = leg->symbol;
            action.side = leg->side;
            action.quantity = leg->quantity;
        }

        // Nothing is sent until the ledger holds funds for every leg
        auto plan = bounded(*request.plan, deadline);
        try {
            prepare_retry(request, plan);
        } catch (const ExchangeError& e) {
            action.result = std::string("not ready: ") + e.what();
        } catch (const InsufficientBalance& e) {
            action.result = std::string("not ready: ") + e.what();
        }
        if (!action.result.empty()) {
            action.timestamp = now_ms();
            Logger::warn("Recovery {} retry {} skipped: {}", recovery_id, current, action.result);
            record_action(recovery_id, std::move(action));
            continue;
        }

        state_machine_.transition(operation_id, OperationState::Executing,
                                  TransitionTrigger::ExecutionStarted,
                                  {{"recovery_id", recovery_id}});

        auto held = positions_.positions_for(request.opportunity_id);
        auto report = held.empty() ? orchestrator_.execute(plan.reissued())
                                   : orchestrator_.execute_remaining(plan, held);

        action.success = report.is_complete();
        action.result = report.is_complete() ? std::string("complete") : report.failure_reason();
        action.timestamp = now_ms();
        record_action(recovery_id, std::move(action));

        if (report.is_complete()) {
            state_machine_.transition(operation_id, OperationState::Completed,
                                      TransitionTrigger::ExecutionCompleted,
                                      {{"recovery_id", recovery_id}});
            return true;
        }

        state_machine_.transition_to_recovery(operation_id, report.failure_reason(),
                                              {{"recovery_id", recovery_id}});
    }
}

void RecoveryCoordinator::prepare_retry(const RecoveryRequest& request, const ExecutionPlan& plan) {
    const auto& opportunity = *request.opportunity;
    balances_.refresh(opportunity.buy_exchange);
    if (opportunity.sell_exchange != opportunity.buy_exchange) {
        balances_.refresh(opportunity.sell_exchange);
    }
    orchestrator_.reserve(opportunity, request.operation_id);
    orchestrator_.validate(plan);
}

ExecutionPlan RecoveryCoordinator::bounded(const ExecutionPlan& plan, Deadline deadline) const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    if (left <= 0) {
        throw OrderTimeout("Recovery deadline passed before plan " + plan.plan_id + " was re-executed");
    }

    ExecutionPlan capped = plan;
    for (auto& instr : capped.instructions) {
        instr.max_execution_ms = std::min<int64_t>(instr.max_execution_ms, left);
    }
    return capped;
}

Order RecoveryCoordinator::submit_and_confirm(const std::string& exchange,
                                              const OrderRequest& request,
                                              Deadline deadline,
                                              const std::atomic<bool>& cancelled) {
    auto& port = exchanges_.get(exchange);
    auto placed = port.place_order(request);
    Order order = await_until(placed, deadline, "recovery order on " + exchange);

    auto poll = std::chrono::milliseconds(settings_.timing.status_poll_interval_ms);
    while (order.is_open() && !cancelled.load()) {
        auto remaining = deadline - Clock::now();
        if (remaining <= Clock::duration::zero()) break;
        std::this_thread::sleep_for(std::min<Clock::duration>(poll, remaining));

        auto status = port.get_order_status(order.order_id, request.symbol);
        order = await_until(status, deadline, "status of " + order.order_id);
    }

    if (order.is_open()) {
        try {
            auto cancel = port.cancel_order(order.order_id, request.symbol);
            await_for(cancel, std::chrono::milliseconds(settings_.general.leg_timeout_ms),
                      "cancel of " + order.order_id);
        } catch (const std::exception& e) {
            Logger::warn("Cancel of recovery order {} failed: {}", order.order_id, e.what());
        }
        throw OrderTimeout("Recovery order " + order.order_id + " on " + exchange +
                           " not final before the recovery deadline");
    }
    return order;
}

Decimal RecoveryCoordinator::fetch_price(const std::string& symbol,
                                         const std::string& exchange,
                                         Deadline deadline) {
    auto future = prices_.current_price(symbol, exchange);
    return await_until(future, deadline, "price of " + symbol + " on " + exchange);
}

// ============================================================================
// Reporting
// ============================================================================

void RecoveryCoordinator::report_success(const std::string& recovery_id,
                                         RecoveryStrategy strategy,
                                         const RecoveryRequest& request) {
    OperationState target = (strategy == RecoveryStrategy::UnwindPositions ||
                             strategy == RecoveryStrategy::EmergencyLiquidation)
        ? OperationState::Failed
        : OperationState::Completed;

    // Retries drive the operation to COMPLETED themselves
    if (state_machine_.state(request.operation_id) == OperationState::Recovering) {
        state_machine_.complete_recovery(request.operation_id, target, true);
    }

    if (target == OperationState::Completed && request.opportunity &&
        request.opportunity->type == OpportunityType::SpotSpot) {
        auto group = positions_.group(request.opportunity_id);
        if (group && group->is_complete) {
            positions_.settle_group(request.opportunity_id);
        }
    }

    Logger::info("Recovery {} succeeded ({}), operation {} -> {}",
                 recovery_id, to_string(strategy), request.operation_id, to_string(target));
}

void RecoveryCoordinator::escalate(const std::string& recovery_id,
                                   const RecoveryRequest& request,
                                   const std::string& reason) {
    set_status(recovery_id, RecoveryStatus::CompletedFailure, reason);
    Logger::error("Recovery {} failed, escalating: {}", recovery_id, reason);

    try {
        state_machine_.flag_manual_intervention(request.operation_id, reason);
        if (state_machine_.state(request.operation_id) == OperationState::Recovering) {
            state_machine_.complete_recovery(request.operation_id, OperationState::Failed, false);
        }
    } catch (const Error& e) {
        Logger::critical("Escalation of recovery {} not recorded on operation {}: {}",
                         recovery_id, request.operation_id, e.what());
    }

    finish(recovery_id, RecoveryStatus::Escalated, reason);
}

void RecoveryCoordinator::finish(const std::string& recovery_id,
                                 RecoveryStatus status,
                                 std::optional<std::string> error) {
    std::string operation_id;
    std::string cancel_reason = "recovery cancelled";
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(recovery_id);
        if (it == entries_.end()) return;
        const auto& ctx = it->second.context;
        operation_id = ctx.operation_id;
        auto reason = ctx.metadata.find("cancel_reason");
        if (reason != ctx.metadata.end()) cancel_reason = reason->second;
    }

    if (status == RecoveryStatus::Cancelled) {
        abandon(operation_id, "recovery " + recovery_id + " cancelled: " + cancel_reason);
    }

    // Released before the terminal status becomes visible to waiters
    size_t released = balances_.release_operation(operation_id);

    RecoveryContext snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(recovery_id);
        if (it == entries_.end()) return;
        auto& ctx = it->second.context;
        ctx.status = status;
        if (error) ctx.error = std::move(error);
        ctx.updated_at = now_ms();
        ctx.completed_at = ctx.updated_at;
        snapshot = ctx;
    }
    cv_.notify_all();

    Logger::info("Recovery {} {} (released {} reservations)",
                 recovery_id, to_string(status), released);
    alerts_.on_recovery(snapshot);
}

void RecoveryCoordinator::abandon(const std::string& operation_id, const std::string& reason) {
    try {
        auto operation = state_machine_.get(operation_id);
        if (!operation || operation->is_terminal()) return;

        state_machine_.flag_manual_intervention(operation_id, reason);
        if (operation->state == OperationState::Recovering) {
            state_machine_.complete_recovery(operation_id, OperationState::Failed, false);
        } else {
            state_machine_.transition(operation_id, OperationState::Failed,
                                      TransitionTrigger::ManualIntervention, {{"reason", reason}});
        }
    } catch (const Error& e) {
        Logger::critical("Cancellation not recorded on operation {}: {}", operation_id, e.what());
    }
}

void RecoveryCoordinator::set_status(const std::string& recovery_id,
                                     RecoveryStatus status,
                                     std::optional<std::string> error) {
    RecoveryContext snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(recovery_id);
        if (it == entries_.end()) return;
        auto& ctx = it->second.context;
        ctx.status = status;
        if (error) ctx.error = std::move(error);
        ctx.updated_at = now_ms();
        snapshot = ctx;
    }
    alerts_.on_recovery(snapshot);
}

void RecoveryCoordinator::set_strategy(const std::string& recovery_id, RecoveryStrategy strategy) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(recovery_id);
    if (it == entries_.end()) return;
    it->second.context.strategy = strategy;
    it->second.context.updated_at = now_ms();
}

void RecoveryCoordinator::record_action(const std::string& recovery_id, RecoveryAction action) {
    Logger::info("Recovery {} {} {} {} {} on {}: {}", recovery_id, to_string(action.strategy),
                 to_string(action.side), action.quantity.to_string(), action.symbol,
                 action.exchange, action.result);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(recovery_id);
    if (it == entries_.end()) return;
    it->second.context.actions.push_back(std::move(action));
    it->second.context.updated_at = now_ms();
}

int RecoveryCoordinator::next_attempt(const std::string& recovery_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(recovery_id);
    if (it == entries_.end()) return 0;
    return ++it->second.context.attempts;
}

}  // namespace xarb
