// xarb - Execution Orchestrator Tests

#include <catch2/catch_test_macros.hpp>
#include <xarb/errors.hpp>
#include <xarb/orchestrator.hpp>
#include "mock_exchange.hpp"
#include <algorithm>
#include <thread>

using namespace xarb;
using namespace xarb::testing;

namespace {

struct OrchestratorFixture {
    Settings settings;
    NullAlertSink alerts;
    ExchangeRegistry registry;
    std::shared_ptr<MockExchange> alpha = funded("alpha");
    std::shared_ptr<MockExchange> beta = funded("beta");
    BalanceLedger balances{settings, registry};
    PositionLedger positions{settings, alerts};
    ExecutionOrchestrator orchestrator{settings, registry, balances, positions};

    OrchestratorFixture() {
        settings.set_leg_timeout(1000);
        registry.add(alpha);
        registry.add(beta);
        balances.refresh("alpha");
        balances.refresh("beta");
    }

    ExecutionPlan plan_for(const ArbitrageOpportunity& opp, ExecutionStrategy strategy) {
        auto plan = orchestrator.build_plan(opp, strategy, "op_test");
        orchestrator.reserve(opp, "op_test");
        orchestrator.validate(plan);
        return plan;
    }
};

}  // namespace

TEST_CASE("Plans follow the strategy", "[orchestrator]") {
    OrchestratorFixture f;
    auto opp = spot_spot();

    SECTION("Simultaneous legs share a priority") {
        auto plan = f.orchestrator.build_plan(opp, ExecutionStrategy::Simultaneous, "op1");
        REQUIRE(plan.instructions.size() == 2);
        REQUIRE(plan.instructions[0].priority == plan.instructions[1].priority);
        REQUIRE_FALSE(plan.instructions[1].depends_on.has_value());
        REQUIRE(plan.estimated_total_ms == 40);

        const auto* buy = plan.find(LegRole::Directional);
        const auto* sell = plan.find(LegRole::Hedge);
        REQUIRE(buy->exchange == "alpha");
        REQUIRE(buy->side == Side::Buy);
        REQUIRE(buy->required_asset == "USDT");
        REQUIRE(buy->required_amount == Decimal::from_int(100));
        REQUIRE(sell->exchange == "beta");
        REQUIRE(sell->side == Side::Sell);
        REQUIRE(sell->required_asset == "BTC");
        REQUIRE(sell->max_execution_ms == 1000);
    }

    SECTION("Hedge first") {
        auto plan = f.orchestrator.build_plan(opp, ExecutionStrategy::HedgeFirst, "op1");
        auto ordered = plan.ordered();
        REQUIRE(ordered[0]->role == LegRole::Hedge);
        REQUIRE(ordered[1]->depends_on == ordered[0]->instruction_id);
    }

    SECTION("Directional first") {
        auto plan = f.orchestrator.build_plan(opp, ExecutionStrategy::DirectionalFirst, "op1");
        auto ordered = plan.ordered();
        REQUIRE(ordered[0]->role == LegRole::Directional);
        REQUIRE(ordered[1]->depends_on == ordered[0]->instruction_id);
    }

    SECTION("Futures hedge leg") {
        auto hedged = spot_futures();
        hedged.futures->hedge_ratio = Decimal::from_string("0.5");
        auto plan = f.orchestrator.build_plan(hedged, ExecutionStrategy::Simultaneous, "op1");
        const auto* hedge = plan.find(LegRole::Hedge);
        REQUIRE(hedge->symbol == "BTC-USDT-PERP");
        REQUIRE(hedge->quantity == Decimal::from_string("0.5"));
        REQUIRE(hedge->fill_stage == ExecutionStage::FuturesFilled);
        REQUIRE(hedge->required_asset == "USDT");
    }

    SECTION("Quantity truncated to precision") {
        f.settings.general.quantity_precision = 2;
        opp.max_quantity = Decimal::from_string("1.23456");
        auto plan = f.orchestrator.build_plan(opp, ExecutionStrategy::Simultaneous, "op1");
        REQUIRE(plan.instructions[0].quantity == Decimal::from_string("1.23"));
    }

    SECTION("Triangular is not executable") {
        opp.type = OpportunityType::Triangular;
        REQUIRE_THROWS_AS(f.orchestrator.build_plan(opp, ExecutionStrategy::Simultaneous, "op1"),
                          UnsupportedOpportunity);
    }

    SECTION("Reissued plans keep dependencies") {
        auto plan = f.orchestrator.build_plan(opp, ExecutionStrategy::DirectionalFirst, "op1");
        auto again = plan.reissued();
        REQUIRE(again.plan_id != plan.plan_id);
        REQUIRE(again.instructions[0].instruction_id != plan.instructions[0].instruction_id);
        REQUIRE(again.instructions[1].depends_on == again.instructions[0].instruction_id);
    }
}

TEST_CASE("Validation checks exchanges and reservations", "[orchestrator]") {
    OrchestratorFixture f;
    auto opp = spot_spot();
    auto plan = f.orchestrator.build_plan(opp, ExecutionStrategy::Simultaneous, "op_v");

    REQUIRE_THROWS_AS(f.orchestrator.validate(plan), InsufficientBalance);

    auto ids = f.orchestrator.reserve(opp, "op_v");
    REQUIRE(ids.size() == 2);
    REQUIRE_NOTHROW(f.orchestrator.validate(plan));

    f.beta->set_connected(false);
    REQUIRE_THROWS_AS(f.orchestrator.validate(plan), ExchangeUnavailable);
}

TEST_CASE("Failed reservation releases the others", "[orchestrator]") {
    OrchestratorFixture f;
    f.beta->set_balance("BTC", Decimal::from_string("0.1"));
    f.balances.refresh("beta");

    REQUIRE_THROWS_AS(f.orchestrator.reserve(spot_spot(), "op_r"), InsufficientBalance);
    REQUIRE(f.balances.reservations("op_r").empty());
}

TEST_CASE("Reserving again only covers missing legs", "[orchestrator]") {
    OrchestratorFixture f;
    auto opp = spot_spot();

    REQUIRE(f.orchestrator.reserve(opp, "op_r").size() == 2);
    REQUIRE(f.orchestrator.reserve(opp, "op_r").empty());
    REQUIRE(f.balances.reservations("op_r").size() == 2);

    auto held = f.balances.reservations("op_r");
    auto buy_side = std::find_if(held.begin(), held.end(),
                                 [](const auto& r) { return r.exchange == "alpha"; });
    REQUIRE(buy_side != held.end());
    REQUIRE(f.balances.release(buy_side->reservation_id));

    auto again = f.orchestrator.reserve(opp, "op_r");
    REQUIRE(again.size() == 1);
    REQUIRE(f.balances.holds("op_r", "alpha", "USDT"));
    REQUIRE(f.balances.reservations("op_r").size() == 2);
}

TEST_CASE("Simultaneous execution", "[orchestrator]") {
    OrchestratorFixture f;
    auto opp = spot_spot();
    auto plan = f.plan_for(opp, ExecutionStrategy::Simultaneous);

    SECTION("Both legs fill") {
        auto report = f.orchestrator.execute(plan);
        REQUIRE(report.is_complete());
        REQUIRE(report.positions.size() == 2);
        REQUIRE_NOTHROW(report.require_complete());
        REQUIRE(f.positions.positions_for(opp.id).size() == 2);
        REQUIRE(f.orchestrator.statistics().plans_complete == 1);
    }

    SECTION("Sell leg rejected") {
        f.beta->script({Response::Reject});
        auto report = f.orchestrator.execute(plan);
        REQUIRE(report.outcome == ExecutionOutcome::AtomicityViolation);
        REQUIRE(report.positions.size() == 1);
        REQUIRE(report.failure_stage() == ExecutionStage::SpotFilled);
        REQUIRE_THROWS_AS(report.require_complete(), AtomicityViolation);
        REQUIRE(report.failure_reason().find("hedge leg on beta rejected") != std::string::npos);
    }

    SECTION("Buy leg rejected") {
        f.alpha->script({Response::Reject});
        auto report = f.orchestrator.execute(plan);
        REQUIRE(report.outcome == ExecutionOutcome::AtomicityViolation);
        REQUIRE(report.failure_stage() == ExecutionStage::FuturesFilled);
    }

    SECTION("Nothing fills") {
        f.alpha->script({Response::Reject});
        f.beta->script({Response::Reject});
        auto report = f.orchestrator.execute(plan);
        REQUIRE(report.outcome == ExecutionOutcome::NoFill);
        REQUIRE(report.positions.empty());
        REQUIRE(report.failure_stage() == ExecutionStage::SpotOrdering);
    }

    SECTION("Partial fill breaks atomicity") {
        f.beta->script({Response::PartialFill});
        auto report = f.orchestrator.execute(plan);
        REQUIRE(report.positions.size() == 2);
        REQUIRE(report.outcome == ExecutionOutcome::AtomicityViolation);
        REQUIRE(report.legs[1].status == LegStatus::PartiallyFilled);
        REQUIRE(report.failure_stage() == ExecutionStage::ClosingPosition);
        REQUIRE(report.positions[1].is_partial);
    }

    SECTION("Disconnected exchange fails its leg only") {
        f.beta->set_connected(false);
        auto report = f.orchestrator.execute(plan);
        REQUIRE(report.legs[1].status == LegStatus::Rejected);
        REQUIRE(report.positions.size() == 1);
        REQUIRE(f.beta->requests().empty());
    }
}

TEST_CASE("Leg timeout cancels the order", "[orchestrator]") {
    OrchestratorFixture f;
    f.settings.set_leg_timeout(50);
    auto opp = spot_spot();
    auto plan = f.plan_for(opp, ExecutionStrategy::Simultaneous);

    f.beta->script({Response::Hang});
    auto report = f.orchestrator.execute(plan);

    REQUIRE(report.legs[1].status == LegStatus::TimedOut);
    REQUIRE(report.outcome == ExecutionOutcome::AtomicityViolation);
    REQUIRE(f.beta->cancels().size() == 1);
    REQUIRE(f.beta->cancels()[0] == plan.find(LegRole::Hedge)->instruction_id);
}

TEST_CASE("Sequential strategies stop after a failed leg", "[orchestrator]") {
    OrchestratorFixture f;
    auto opp = spot_spot();

    SECTION("Directional first") {
        auto plan = f.plan_for(opp, ExecutionStrategy::DirectionalFirst);
        f.alpha->script({Response::Reject});
        auto report = f.orchestrator.execute(plan);
        REQUIRE(report.legs[1].status == LegStatus::NotSent);
        REQUIRE(f.beta->requests().empty());
        REQUIRE(report.failure_stage() == ExecutionStage::SpotOrdering);
    }

    SECTION("Hedge first") {
        auto plan = f.plan_for(opp, ExecutionStrategy::HedgeFirst);
        f.beta->script({Response::Reject});
        auto report = f.orchestrator.execute(plan);
        REQUIRE(report.legs[0].instruction.role == LegRole::Hedge);
        REQUIRE(report.legs[1].status == LegStatus::NotSent);
        REQUIRE(f.alpha->requests().empty());
        REQUIRE(report.failure_stage() == ExecutionStage::FuturesOrdering);
    }
}

TEST_CASE("Safe sequencing waits for confirmed fills", "[orchestrator]") {
    OrchestratorFixture f;
    auto opp = spot_spot();
    auto plan = f.plan_for(opp, ExecutionStrategy::SequentialSafe);

    f.alpha->script({Response::Rest});
    std::thread filler([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(80));
        f.alpha->fill_resting();
    });
    auto report = f.orchestrator.execute(plan);
    filler.join();

    REQUIRE(report.is_complete());
    REQUIRE(f.alpha->status_queries() > 0);
    REQUIRE(f.beta->status_queries() > 0);
    REQUIRE(f.orchestrator.statistics().open_orders == 0);
}

TEST_CASE("Re-executing only the missing legs", "[orchestrator]") {
    OrchestratorFixture f;
    auto opp = spot_spot();
    auto plan = f.plan_for(opp, ExecutionStrategy::DirectionalFirst);

    f.beta->script({Response::Reject});
    auto first = f.orchestrator.execute(plan);
    REQUIRE_FALSE(first.is_complete());
    REQUIRE(f.alpha->requests().size() == 1);

    auto second = f.orchestrator.execute_remaining(plan, f.positions.positions_for(opp.id));
    REQUIRE(second.is_complete());
    REQUIRE(second.legs.size() == 1);
    REQUIRE(second.legs[0].instruction.role == LegRole::Hedge);
    REQUIRE_FALSE(second.legs[0].instruction.depends_on.has_value());
    REQUIRE(f.alpha->requests().size() == 1);
    REQUIRE(f.beta->requests().size() == 2);
    REQUIRE(f.positions.group(opp.id)->is_complete);

    SECTION("Nothing left to do") {
        auto third = f.orchestrator.execute_remaining(plan, f.positions.positions_for(opp.id));
        REQUIRE(third.is_complete());
        REQUIRE(third.legs.empty());
    }
}

TEST_CASE("Cancelling tracked open orders", "[orchestrator]") {
    OrchestratorFixture f;
    auto opp = spot_spot();
    auto plan = f.plan_for(opp, ExecutionStrategy::SequentialSafe);

    f.alpha->script({Response::Rest});
    size_t cancelled = 0;
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(60));
        cancelled = f.orchestrator.cancel_all(std::string("alpha"));
    });
    auto report = f.orchestrator.execute(plan);
    canceller.join();

    REQUIRE(cancelled == 1);
    REQUIRE(f.alpha->cancels().size() == 1);
    REQUIRE_FALSE(report.is_complete());
    REQUIRE(f.positions.positions_for(opp.id).empty());
    REQUIRE(f.orchestrator.statistics().open_orders == 0);
    REQUIRE(f.orchestrator.cancel_all() == 0);
}
