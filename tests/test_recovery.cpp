// xarb - Recovery Coordinator Tests

#include <catch2/catch_test_macros.hpp>
#include <xarb/errors.hpp>
#include <xarb/recovery.hpp>
#include "mock_exchange.hpp"
#include <chrono>
#include <string>
#include <thread>

using namespace xarb;
using namespace xarb::testing;
using namespace std::chrono_literals;

namespace {

struct FailedExecution {
    std::string operation_id;
    ExecutionPlan plan;
    ExecutionReport report;
};

struct RecoveryFixture {
    Settings settings;
    RecordingSink alerts;
    ExchangeRegistry registry;
    StaticPrices prices;
    std::shared_ptr<MockExchange> alpha = funded("alpha");
    std::shared_ptr<MockExchange> beta = funded("beta");
    OperationStateMachine operations{settings, alerts};
    PositionLedger positions{settings, alerts, &prices};
    BalanceLedger balances{settings, registry};
    ExecutionOrchestrator orchestrator{settings, registry, balances, positions};
    RecoveryCoordinator recovery{settings, registry, prices, operations, orchestrator,
                                 positions, balances, alerts};

    RecoveryFixture() {
        settings.set_leg_timeout(500).set_retry_backoff(1, 4);
        registry.add(alpha);
        registry.add(beta);
        prices.set("BTC-USDT", Decimal::from_int(100));
        prices.set("BTC-USDT-PERP", Decimal::from_int(101));
        balances.refresh("alpha");
        balances.refresh("beta");
    }

    // Runs the plan and moves the operation into RECOVERING
    FailedExecution fail(const ArbitrageOpportunity& opp,
                         ExecutionStrategy strategy = ExecutionStrategy::Simultaneous) {
        auto op = operations.create_operation(opp);
        operations.transition(op.operation_id, OperationState::Detecting, TransitionTrigger::OpportunityDetected);
        operations.transition(op.operation_id, OperationState::OpportunityFound, TransitionTrigger::OpportunityDetected);
        operations.transition(op.operation_id, OperationState::Executing, TransitionTrigger::ExecutionStarted);

        FailedExecution failed;
        failed.operation_id = op.operation_id;
        failed.plan = orchestrator.build_plan(opp, strategy, op.operation_id);
        orchestrator.reserve(opp, op.operation_id);
        failed.report = orchestrator.execute(failed.plan);
        REQUIRE_FALSE(failed.report.is_complete());

        operations.transition_to_recovery(op.operation_id, failed.report.failure_reason());
        return failed;
    }

    RecoveryRequest request(const FailedExecution& failed,
                            std::optional<ExecutionStage> stage = std::nullopt) {
        RecoveryRequest req;
        req.operation_id = failed.operation_id;
        req.opportunity_id = failed.plan.opportunity_id;
        req.failure_reason = failed.report.failure_reason();
        req.failure_stage = stage.value_or(failed.report.failure_stage());
        req.affected_positions = positions.positions_for(failed.plan.opportunity_id);
        req.opportunity = failed.plan.opportunity;
        req.plan = failed.plan;
        return req;
    }

    RecoveryContext finished(const std::string& recovery_id) {
        auto ctx = recovery.wait(recovery_id, 5000ms);
        REQUIRE(ctx.has_value());
        return *ctx;
    }
};

}  // namespace

TEST_CASE("Strategy selection is total", "[recovery]") {
    using R = RecoveryStrategy;
    REQUIRE(RecoveryCoordinator::select_strategy(ExecutionStage::SpotFilled) == R::HedgeImmediately);
    REQUIRE(RecoveryCoordinator::select_strategy(ExecutionStage::FuturesOrdering) == R::CompleteExecution);
    REQUIRE(RecoveryCoordinator::select_strategy(ExecutionStage::Preparing) == R::WaitAndRetry);
    REQUIRE(RecoveryCoordinator::select_strategy(ExecutionStage::SpotOrdering) == R::UnwindPositions);
    REQUIRE(RecoveryCoordinator::select_strategy(ExecutionStage::FuturesFilled) == R::UnwindPositions);
    REQUIRE(RecoveryCoordinator::select_strategy(ExecutionStage::ClosingPosition) == R::UnwindPositions);

    REQUIRE(RecoveryCoordinator::slippage_multiplier(R::WaitAndRetry) == 0);
    REQUIRE(RecoveryCoordinator::slippage_multiplier(R::HedgeImmediately) == 1);
    REQUIRE(RecoveryCoordinator::slippage_multiplier(R::EmergencyLiquidation) == 2);
}

TEST_CASE("Loss estimate", "[recovery]") {
    RecoveryFixture f;
    auto opp = spot_spot();
    auto pos = f.positions.open(opp, "alpha", "BTC-USDT", Side::Buy, Decimal::one(),
                                Decimal::from_int(100), "a-1", ExecutionStage::SpotFilled, false,
                                Decimal::from_string("0.5"));

    SECTION("Adverse move plus closing slippage") {
        f.prices.set("BTC-USDT", Decimal::from_int(90));
        auto loss = f.recovery.estimate_loss({pos}, RecoveryStrategy::UnwindPositions);
        REQUIRE(loss == Decimal::from_string("10.6"));
    }

    SECTION("Favourable move costs only slippage") {
        f.prices.set("BTC-USDT", Decimal::from_int(110));
        auto loss = f.recovery.estimate_loss({pos}, RecoveryStrategy::EmergencyLiquidation);
        REQUIRE(loss == Decimal::from_string("0.2"));
    }

    SECTION("Missing price falls back to entry") {
        auto other = f.positions.open(opp, "alpha", "ETH-USDT", Side::Buy, Decimal::one(),
                                      Decimal::from_int(100), "a-2", ExecutionStage::SpotFilled, false);
        auto loss = f.recovery.estimate_loss({other}, RecoveryStrategy::HedgeImmediately);
        REQUIRE(loss == Decimal::from_string("0.1"));
    }
}

TEST_CASE("Missing hedge is placed at market", "[recovery]") {
    RecoveryFixture f;
    auto opp = spot_spot();
    f.beta->script({Response::Reject});
    auto failed = f.fail(opp);
    REQUIRE(failed.report.failure_stage() == ExecutionStage::SpotFilled);

    auto ctx = f.recovery.initiate(f.request(failed));
    REQUIRE(ctx.strategy == RecoveryStrategy::HedgeImmediately);
    REQUIRE_FALSE(ctx.requires_manual_approval);

    auto done = f.finished(ctx.recovery_id);
    REQUIRE(done.status == RecoveryStatus::CompletedSuccess);
    REQUIRE(done.actions.size() == 1);
    REQUIRE(done.actions[0].side == Side::Sell);
    REQUIRE(done.actions[0].exchange == "beta");
    REQUIRE(done.actions[0].success);

    REQUIRE(f.operations.state(failed.operation_id) == OperationState::Completed);
    REQUIRE(f.beta->requests().size() == 2);
    // Spot round trips are settled once both sides exist
    REQUIRE(f.positions.positions_for(opp.id).empty());
    REQUIRE(f.balances.reservations(failed.operation_id).empty());
}

TEST_CASE("Futures hedge keeps both positions", "[recovery]") {
    RecoveryFixture f;
    auto opp = spot_futures();
    f.beta->script({Response::Reject});
    auto failed = f.fail(opp);

    auto ctx = f.recovery.initiate(f.request(failed));
    auto done = f.finished(ctx.recovery_id);

    REQUIRE(done.status == RecoveryStatus::CompletedSuccess);
    auto held = f.positions.positions_for(opp.id);
    REQUIRE(held.size() == 2);
    REQUIRE(f.positions.group(opp.id)->is_complete);
    REQUIRE(f.beta->requests().back().symbol == "BTC-USDT-PERP");
}

TEST_CASE("Unwinding closes the filled side", "[recovery]") {
    RecoveryFixture f;
    auto opp = spot_spot();
    f.alpha->script({Response::Reject});
    auto failed = f.fail(opp);
    REQUIRE(failed.report.failure_stage() == ExecutionStage::FuturesFilled);

    auto ctx = f.recovery.initiate(f.request(failed));
    REQUIRE(ctx.strategy == RecoveryStrategy::UnwindPositions);

    auto done = f.finished(ctx.recovery_id);
    REQUIRE(done.status == RecoveryStatus::CompletedSuccess);
    REQUIRE(done.actions.size() == 1);
    REQUIRE(done.actions[0].side == Side::Buy);
    REQUIRE(done.actions[0].exchange == "beta");

    auto op = f.operations.get(failed.operation_id);
    REQUIRE(op->state == OperationState::Failed);
    REQUIRE_FALSE(op->requires_manual_intervention);
    REQUIRE(f.positions.open_count() == 0);
    REQUIRE(f.balances.reservations(failed.operation_id).empty());
}

TEST_CASE("Completing the missing legs", "[recovery]") {
    RecoveryFixture f;
    auto opp = spot_futures();
    f.beta->script({Response::Reject});
    auto failed = f.fail(opp, ExecutionStrategy::HedgeFirst);
    REQUIRE(failed.report.failure_stage() == ExecutionStage::FuturesOrdering);

    auto ctx = f.recovery.initiate(f.request(failed));
    REQUIRE(ctx.strategy == RecoveryStrategy::CompleteExecution);

    auto done = f.finished(ctx.recovery_id);
    REQUIRE(done.status == RecoveryStatus::CompletedSuccess);
    REQUIRE(done.actions.size() == 2);
    REQUIRE(f.operations.state(failed.operation_id) == OperationState::Completed);
    REQUIRE(f.positions.positions_for(opp.id).size() == 2);
}

TEST_CASE("Retries stop at the attempt cap", "[recovery]") {
    RecoveryFixture f;
    f.settings.set_max_recovery_attempts(3);
    f.alpha->set_default_response(Response::Reject);
    f.beta->set_default_response(Response::Reject);

    auto failed = f.fail(spot_spot());
    auto ctx = f.recovery.initiate(f.request(failed, ExecutionStage::Preparing));
    REQUIRE(ctx.strategy == RecoveryStrategy::WaitAndRetry);

    auto done = f.finished(ctx.recovery_id);
    REQUIRE(done.status == RecoveryStatus::Escalated);
    REQUIRE(done.strategy == RecoveryStrategy::ManualIntervention);
    REQUIRE(done.attempts == 3);
    REQUIRE(done.actions.size() == 3);

    auto op = f.operations.get(failed.operation_id);
    REQUIRE(op->requires_manual_intervention);
    REQUIRE(op->state == OperationState::Failed);
    REQUIRE(op->recovery_attempts == 4);
    // One initial send plus three retries per exchange
    REQUIRE(f.alpha->requests().size() == 4);
    REQUIRE(f.balances.reservations(failed.operation_id).empty());
}

TEST_CASE("Retry succeeds once the exchange recovers", "[recovery]") {
    RecoveryFixture f;
    f.alpha->script({Response::Reject});
    f.beta->script({Response::Reject});

    auto failed = f.fail(spot_spot());
    auto ctx = f.recovery.initiate(f.request(failed, ExecutionStage::Preparing));
    auto done = f.finished(ctx.recovery_id);

    REQUIRE(done.status == RecoveryStatus::CompletedSuccess);
    REQUIRE(done.attempts == 1);
    REQUIRE(f.operations.state(failed.operation_id) == OperationState::Completed);
}

TEST_CASE("Failed hedge escalates", "[recovery]") {
    RecoveryFixture f;
    f.beta->set_default_response(Response::Reject);
    auto failed = f.fail(spot_spot());

    auto ctx = f.recovery.initiate(f.request(failed));
    auto done = f.finished(ctx.recovery_id);

    REQUIRE(done.status == RecoveryStatus::Escalated);
    REQUIRE(done.error.has_value());
    REQUIRE_FALSE(done.actions[0].success);

    auto op = f.operations.get(failed.operation_id);
    REQUIRE(op->requires_manual_intervention);
    REQUIRE(op->state == OperationState::Failed);

    auto seen = f.alerts.recoveries();
    REQUIRE(seen.back().status == RecoveryStatus::Escalated);
}

TEST_CASE("Large losses wait for approval", "[recovery]") {
    RecoveryFixture f;
    f.settings.set_max_single_loss(Decimal::from_string("0.01"));
    f.beta->script({Response::Reject});
    auto failed = f.fail(spot_spot());

    auto ctx = f.recovery.initiate(f.request(failed));
    REQUIRE(ctx.requires_manual_approval);
    REQUIRE(ctx.status == RecoveryStatus::Initiated);
    REQUIRE_FALSE(f.recovery.wait(ctx.recovery_id, 50ms).has_value());
    REQUIRE(f.beta->requests().size() == 1);
    REQUIRE(f.recovery.statistics().awaiting_approval == 1);

    SECTION("Approval starts it") {
        REQUIRE(f.recovery.approve(ctx.recovery_id));
        REQUIRE_FALSE(f.recovery.approve(ctx.recovery_id));
        auto done = f.finished(ctx.recovery_id);
        REQUIRE(done.status == RecoveryStatus::CompletedSuccess);
        REQUIRE(f.beta->requests().size() == 2);
    }

    SECTION("Cancellation ends it") {
        REQUIRE(f.recovery.cancel(ctx.recovery_id, "operator declined"));
        REQUIRE_FALSE(f.recovery.cancel(ctx.recovery_id, "again"));
        auto done = f.finished(ctx.recovery_id);
        REQUIRE(done.status == RecoveryStatus::Cancelled);
        REQUIRE(done.metadata.at("cancel_reason") == "operator declined");
        REQUIRE_FALSE(f.recovery.approve(ctx.recovery_id));
        REQUIRE(f.balances.reservations(failed.operation_id).empty());
        REQUIRE(f.beta->requests().size() == 1);

        auto op = f.operations.get(failed.operation_id);
        REQUIRE(op->state == OperationState::Failed);
        REQUIRE(op->requires_manual_intervention);
        REQUIRE(op->last_error->find("operator declined") != std::string::npos);
        REQUIRE(f.operations.active_count() == 0);
    }
}

TEST_CASE("Completing legs stops at the recovery deadline", "[recovery]") {
    RecoveryFixture f;
    f.settings.set_leg_timeout(5000).set_recovery_timeout(200);
    f.beta->script({Response::Reject, Response::Hang});
    auto failed = f.fail(spot_futures(), ExecutionStrategy::HedgeFirst);

    auto started = std::chrono::steady_clock::now();
    auto ctx = f.recovery.initiate(f.request(failed));
    REQUIRE(ctx.strategy == RecoveryStrategy::CompleteExecution);

    auto done = f.finished(ctx.recovery_id);
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(done.status == RecoveryStatus::Escalated);
    REQUIRE(elapsed < std::chrono::milliseconds(3000));
    REQUIRE(f.operations.state(failed.operation_id) == OperationState::Failed);
}

TEST_CASE("Retries wait for funds", "[recovery]") {
    RecoveryFixture f;
    f.settings.set_max_recovery_attempts(2);
    f.alpha->script({Response::Reject});
    f.beta->script({Response::Reject});
    auto failed = f.fail(spot_spot());

    // The failed attempt gave its funds back
    REQUIRE(f.balances.release_operation(failed.operation_id) == 2);
    f.alpha->set_balance("USDT", Decimal::zero());

    auto ctx = f.recovery.initiate(f.request(failed, ExecutionStage::Preparing));
    auto done = f.finished(ctx.recovery_id);

    REQUIRE(done.status == RecoveryStatus::Escalated);
    REQUIRE(done.actions.size() == 2);
    for (const auto& action : done.actions) {
        REQUIRE_FALSE(action.success);
        REQUIRE(action.result.find("not ready") != std::string::npos);
    }
    // Only the first execution reached the exchanges
    REQUIRE(f.alpha->requests().size() == 1);
    REQUIRE(f.beta->requests().size() == 1);
    REQUIRE(f.balances.reservations(failed.operation_id).empty());
    REQUIRE(f.operations.get(failed.operation_id)->requires_manual_intervention);
}

TEST_CASE("Emergency liquidation closes every position", "[recovery]") {
    RecoveryFixture f;
    f.beta->script({Response::PartialFill});
    auto opp = spot_spot();
    auto failed = f.fail(opp);
    REQUIRE(f.positions.positions_for(opp.id).size() == 2);

    auto req = f.request(failed);
    req.strategy = RecoveryStrategy::EmergencyLiquidation;
    auto ctx = f.recovery.initiate(std::move(req));
    REQUIRE(ctx.requires_manual_approval);
    REQUIRE(f.recovery.approve(ctx.recovery_id));

    auto done = f.finished(ctx.recovery_id);
    REQUIRE(done.status == RecoveryStatus::CompletedSuccess);
    REQUIRE(done.actions.size() == 2);
    REQUIRE(f.positions.open_count() == 0);
    REQUIRE(f.operations.state(failed.operation_id) == OperationState::Failed);
}

TEST_CASE("Recovery bookkeeping", "[recovery]") {
    RecoveryFixture f;
    REQUIRE_THROWS_AS(f.recovery.approve("rec_missing"), RecoveryNotFound);
    REQUIRE_THROWS_AS(f.recovery.cancel("rec_missing", "x"), RecoveryNotFound);
    REQUIRE_THROWS_AS(f.recovery.wait("rec_missing", 1ms), RecoveryNotFound);
    REQUIRE_FALSE(f.recovery.get("rec_missing").has_value());

    f.beta->script({Response::Reject});
    auto failed = f.fail(spot_spot());
    auto ctx = f.recovery.initiate(f.request(failed));
    f.finished(ctx.recovery_id);

    REQUIRE(f.recovery.for_operation(failed.operation_id).size() == 1);
    REQUIRE(f.recovery.active().empty());
    auto stats = f.recovery.statistics();
    REQUIRE(stats.total == 1);
    REQUIRE(stats.succeeded == 1);
    REQUIRE(stats.by_strategy[RecoveryStrategy::HedgeImmediately] == 1);

    REQUIRE(f.recovery.cleanup(60000) == 0);
    std::this_thread::sleep_for(5ms);
    REQUIRE(f.recovery.cleanup(0) == 1);
    REQUIRE_FALSE(f.recovery.get(ctx.recovery_id).has_value());
}
