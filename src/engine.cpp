// xarb - Arbitrage Engine Implementation

#include <xarb/engine.hpp>
#include <xarb/errors.hpp>
#include <xarb/logging.hpp>

namespace xarb {

namespace {

const Settings& validated(const Settings& settings) {
    settings.validate();
    return settings;
}

}  // namespace

ArbitrageEngine::ArbitrageEngine(Settings settings,
                                 const ExchangeRegistry& exchanges,
                                 PriceSource& prices,
                                 AlertSink& alerts)
    : settings_(validated(settings)),
      exchanges_(exchanges),
      prices_(prices),
      dispatcher_(fanout_, settings_.alerts.queue_capacity),
      state_machine_(settings_, dispatcher_),
      positions_(settings_, dispatcher_, &prices_),
      balances_(settings_, exchanges_),
      orchestrator_(settings_, exchanges_, balances_, positions_),
      recovery_(settings_, exchanges_, prices_, state_machine_, orchestrator_,
                positions_, balances_, dispatcher_) {
    Logger::set_level(parse_log_level(settings_.general.log_level));
    if (settings_.alerts.log_alerts) {
        fanout_.add(log_sink_);
    }
    fanout_.add(alerts);
}

ArbitrageEngine::~ArbitrageEngine() {
    stop();
}

void ArbitrageEngine::start() {
    if (running_.exchange(true)) {
        return;
    }

    dispatcher_.start();

    const auto& timing = settings_.timing;
    tasks_.push_back(std::make_unique<PeriodicTask>(
        "reservation-sweep", timing.reservation_sweep_interval_ms,
        [this] { balances_.sweep_expired(); }));
    tasks_.push_back(std::make_unique<PeriodicTask>(
        "stale-positions", timing.position_sweep_interval_ms,
        [this] { positions_.sweep_stale(); }));
    tasks_.push_back(std::make_unique<PeriodicTask>(
        "operation-cleanup", timing.operation_cleanup_interval_ms,
        [this] { sweep(); }));

    for (auto& task : tasks_) {
        task->start();
    }

    Logger::info("{} started on {} exchanges", settings_.general.engine_name, exchanges_.size());
}

void ArbitrageEngine::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    for (auto& task : tasks_) {
        task->stop();
    }
    tasks_.clear();

    recovery_.shutdown();
    size_t cancelled = orchestrator_.cancel_all();
    if (cancelled > 0) {
        Logger::warn("Cancelled {} open orders on shutdown", cancelled);
    }
    dispatcher_.stop();

    Logger::info("{} stopped", settings_.general.engine_name);
}

void ArbitrageEngine::screen(const ArbitrageOpportunity& opportunity) const {
    if (!opportunity.is_validated()) {
        throw OpportunityRejected("Opportunity " + opportunity.id +
                                  " has not passed depth, balance and risk validation");
    }
    if (settings_.general.enforce_execution_window && !opportunity.is_window_open(now_ms())) {
        throw OpportunityRejected("Opportunity " + opportunity.id + " execution window closed");
    }
    if (!opportunity.meets_min_profit(settings_.general.min_profit_margin_bps)) {
        throw OpportunityRejected("Opportunity " + opportunity.id + " margin " +
                                  opportunity.profit_margin_bps.to_string() + "bps below minimum " +
                                  std::to_string(settings_.general.min_profit_margin_bps) + "bps");
    }

    size_t active = state_machine_.active_count();
    if (active >= static_cast<size_t>(settings_.general.max_concurrent_operations)) {
        throw ConcurrencyLimit("Already running " + std::to_string(active) + " operations");
    }
}

OperationOutcome ArbitrageEngine::run(const ArbitrageOpportunity& opportunity,
                                      ExecutionStrategy strategy) {
    ++seen_;
    OperationOutcome outcome;
    {
        // The limit check and leaving IDLE happen under one lock
        std::lock_guard<std::mutex> lock(admission_mutex_);
        try {
            screen(opportunity);
        } catch (const Error& e) {
            ++rejected_;
            Logger::info("Rejected {}: {}", opportunity.id, e.what());
            throw;
        }

        auto op = state_machine_.create_operation(opportunity);
        outcome.operation_id = op.operation_id;
        state_machine_.transition(outcome.operation_id, OperationState::Detecting,
                                  TransitionTrigger::OpportunityDetected);
    }
    const std::string id = outcome.operation_id;

    state_machine_.transition(id, OperationState::OpportunityFound, TransitionTrigger::OpportunityDetected,
                              {{"opportunity_id", opportunity.id}});
    state_machine_.transition(id, OperationState::Executing, TransitionTrigger::ExecutionStarted,
                              {{"strategy", to_string(strategy)}});

    ExecutionPlan plan;
    try {
        plan = orchestrator_.build_plan(opportunity, strategy, id);
    } catch (const UnsupportedOpportunity& e) {
        return fail(std::move(outcome), e.what());
    }

    // Reservations are checked against a fresh read of both exchanges
    try {
        balances_.refresh(opportunity.buy_exchange);
        if (opportunity.sell_exchange != opportunity.buy_exchange) {
            balances_.refresh(opportunity.sell_exchange);
        }
    } catch (const ExchangeError& e) {
        return recover(std::move(outcome), plan.opportunity, plan, ExecutionStage::Preparing, e.what());
    }

    try {
        orchestrator_.reserve(opportunity, id);
    } catch (const InsufficientBalance& e) {
        return fail(std::move(outcome), e.what());
    }

    try {
        orchestrator_.validate(plan);
    } catch (const ExchangeUnavailable& e) {
        return recover(std::move(outcome), plan.opportunity, plan, ExecutionStage::Preparing, e.what());
    } catch (const InsufficientBalance& e) {
        return fail(std::move(outcome), e.what());
    }

    auto report = orchestrator_.execute(plan);
    outcome.report = report;

    if (!report.is_complete()) {
        state_machine_.set_stage(id, report.failure_stage());
        return recover(std::move(outcome), plan.opportunity, plan, report.failure_stage(),
                       report.failure_reason());
    }

    if (opportunity.type == OpportunityType::SpotSpot) {
        Decimal pnl = positions_.settle_group(opportunity.id);
        Logger::info("Operation {} settled {} for {}", id, pnl.to_string(), opportunity.id);
    }
    balances_.release_operation(id);
    state_machine_.set_stage(id, ExecutionStage::ClosingPosition);
    state_machine_.transition(id, OperationState::Completed, TransitionTrigger::ExecutionCompleted,
                              {{"plan_id", plan.plan_id}});

    ++completed_;
    outcome.final_state = OperationState::Completed;
    return outcome;
}

EngineStats ArbitrageEngine::statistics() const {
    EngineStats stats;
    stats.opportunities_seen = seen_.load();
    stats.opportunities_rejected = rejected_.load();
    stats.operations_completed = completed_.load();
    stats.operations_failed = failed_.load();
    stats.recoveries_started = recoveries_.load();
    stats.operations = state_machine_.statistics();
    stats.balances = balances_.statistics();
    stats.positions = positions_.statistics();
    stats.execution = orchestrator_.statistics();
    stats.recovery = recovery_.statistics();
    return stats;
}

OperationOutcome ArbitrageEngine::fail(OperationOutcome outcome, const std::string& reason) {
    balances_.release_operation(outcome.operation_id);
    state_machine_.transition(outcome.operation_id, OperationState::Failed,
                              TransitionTrigger::ExecutionFailed, {{"reason", reason}});
    Logger::warn("Operation {} failed before any order was sent: {}", outcome.operation_id, reason);

    ++failed_;
    outcome.final_state = OperationState::Failed;
    return outcome;
}

OperationOutcome ArbitrageEngine::recover(OperationOutcome outcome,
                                          const std::shared_ptr<const ArbitrageOpportunity>& opportunity,
                                          const ExecutionPlan& plan,
                                          ExecutionStage stage,
                                          const std::string& reason) {
    state_machine_.transition_to_recovery(outcome.operation_id, reason);

    RecoveryRequest request;
    request.operation_id = outcome.operation_id;
    request.opportunity_id = plan.opportunity_id;
    request.failure_reason = reason;
    request.failure_stage = stage;
    request.affected_positions = positions_.positions_for(plan.opportunity_id);
    request.opportunity = opportunity;
    request.plan = plan;

    auto recovery = recovery_.initiate(std::move(request));
    ++recoveries_;

    outcome.recovery_id = recovery.recovery_id;
    outcome.final_state = state_machine_.state(outcome.operation_id);
    return outcome;
}

void ArbitrageEngine::sweep() {
    size_t operations = state_machine_.cleanup();
    size_t recoveries = recovery_.cleanup(settings_.timing.operation_retention_ms);
    if (recoveries > 0) {
        Logger::debug("Removed {} finished recoveries ({} operations)", recoveries, operations);
    }
}

}  // namespace xarb
