// xarb - Position Ledger Tests

#include <catch2/catch_test_macros.hpp>
#include <xarb/errors.hpp>
#include <xarb/position_ledger.hpp>
#include "mock_exchange.hpp"
#include <thread>

using namespace xarb;
using namespace xarb::testing;

TEST_CASE("Opening positions indexes them", "[positions]") {
    Settings settings;
    RecordingSink alerts;
    PositionLedger ledger(settings, alerts);
    auto opp = spot_spot();

    auto buy = ledger.open(opp, "alpha", "BTC-USDT", Side::Buy, Decimal::one(),
                           Decimal::from_int(100), "a-1", ExecutionStage::SpotFilled, false);

    REQUIRE(ledger.get(buy.position_id).has_value());
    REQUIRE(ledger.positions("alpha").size() == 1);
    REQUIRE(ledger.positions("beta").empty());
    REQUIRE(ledger.positions(std::nullopt, std::string("BTC-USDT")).size() == 1);
    REQUIRE(ledger.open_count() == 1);

    SECTION("Group waits for every leg") {
        auto group = ledger.group(opp.id);
        REQUIRE(group.has_value());
        REQUIRE(group->group_id == group_id_for(opp.id));
        REQUIRE_FALSE(group->is_complete);
        REQUIRE(group->net_exposure == Decimal::one());

        ledger.open(opp, "beta", "BTC-USDT", Side::Sell, Decimal::one(),
                    Decimal::from_int(101), "b-1", ExecutionStage::SpotFilled, false);
        group = ledger.group(opp.id);
        REQUIRE(group->is_complete);
        REQUIRE(group->net_exposure.is_zero());
        REQUIRE(ledger.groups().size() == 1);
        REQUIRE(ledger.positions_for(opp.id).size() == 2);
    }

    SECTION("Partial entries keep the group incomplete") {
        auto sell = ledger.open(opp, "beta", "BTC-USDT", Side::Sell, Decimal::from_string("0.5"),
                                Decimal::from_int(101), "b-1", ExecutionStage::SpotFilled, false,
                                Decimal::zero(), Decimal::from_string("0.5"));
        REQUIRE(sell.is_partial);
        REQUIRE_FALSE(ledger.group(opp.id)->is_complete);

        auto filled = ledger.record_fill(sell.position_id, Decimal::from_string("0.5"), Decimal::from_int(103));
        REQUIRE(filled.quantity == Decimal::one());
        REQUIRE(filled.entry_price == Decimal::from_int(102));
        REQUIRE_FALSE(filled.is_partial);
        REQUIRE(ledger.group(opp.id)->is_complete);
    }

    SECTION("Exposure is signed notional") {
        ledger.open(opp, "beta", "BTC-USDT", Side::Sell, Decimal::from_string("0.4"),
                    Decimal::from_int(100), "b-1", ExecutionStage::SpotFilled, false);
        auto exposure = ledger.exposure();
        REQUIRE(exposure["BTC-USDT"] == Decimal::from_int(60));
        REQUIRE(ledger.exposure(std::string("beta"))["BTC-USDT"] == Decimal::from_int(-40));
    }
}

TEST_CASE("Closing realizes P&L", "[positions]") {
    Settings settings;
    NullAlertSink alerts;
    StaticPrices prices;
    PositionLedger ledger(settings, alerts, &prices);
    auto opp = spot_spot();

    SECTION("Long position") {
        auto pos = ledger.open(opp, "alpha", "BTC-USDT", Side::Buy, Decimal::from_int(2),
                               Decimal::from_int(100), "a-1", ExecutionStage::SpotFilled, false,
                               Decimal::one());
        auto closed = ledger.close(pos.position_id, Decimal::from_int(105), std::string("a-2"));
        REQUIRE(closed.realized_pnl == Decimal::from_int(9));
        REQUIRE(closed.close_order_id == std::string("a-2"));
        REQUIRE_FALSE(ledger.get(pos.position_id).has_value());
        REQUIRE(ledger.total_pnl() == Decimal::from_int(9));
        REQUIRE(ledger.total_pnl(std::string("alpha")) == Decimal::from_int(9));
        REQUIRE(ledger.total_pnl(std::string("beta")).is_zero());
    }

    SECTION("Short position mirrors") {
        auto pos = ledger.open(opp, "beta", "BTC-USDT", Side::Sell, Decimal::from_int(2),
                               Decimal::from_int(100), "b-1", ExecutionStage::SpotFilled, false);
        auto closed = ledger.close(pos.position_id, Decimal::from_int(105));
        REQUIRE(closed.realized_pnl == Decimal::from_int(-10));
    }

    SECTION("Balanced round trip nets to the spread") {
        auto buy = ledger.open(opp, "alpha", "BTC-USDT", Side::Buy, Decimal::one(),
                               Decimal::from_int(100), "a-1", ExecutionStage::SpotFilled, false);
        auto sell = ledger.open(opp, "beta", "BTC-USDT", Side::Sell, Decimal::one(),
                                Decimal::from_int(101), "b-1", ExecutionStage::SpotFilled, false);
        Decimal exit = Decimal::from_string("100.37");
        auto a = ledger.close(buy.position_id, exit);
        auto b = ledger.close(sell.position_id, exit);
        REQUIRE(a.realized_pnl + b.realized_pnl == Decimal::one());
        REQUIRE_FALSE(ledger.group(opp.id).has_value());
    }

    SECTION("Missing price uses the price source") {
        prices.set("BTC-USDT", Decimal::from_int(110));
        auto pos = ledger.open(opp, "alpha", "BTC-USDT", Side::Buy, Decimal::one(),
                               Decimal::from_int(100), "a-1", ExecutionStage::SpotFilled, false);
        REQUIRE(ledger.total_pnl(std::nullopt, true) == Decimal::from_int(10));
        auto closed = ledger.close(pos.position_id);
        REQUIRE(closed.close_price == Decimal::from_int(110));
    }

    SECTION("Unknown position") {
        REQUIRE_THROWS_AS(ledger.close("pos_missing", Decimal::one()), PositionNotFound);
        REQUIRE_THROWS_AS(ledger.settle_group("opp_missing"), PositionNotFound);
    }
}

TEST_CASE("Settling a round trip", "[positions]") {
    Settings settings;
    NullAlertSink alerts;
    PositionLedger ledger(settings, alerts);
    auto opp = spot_spot();

    ledger.open(opp, "alpha", "BTC-USDT", Side::Buy, Decimal::from_int(2),
                Decimal::from_int(100), "a-1", ExecutionStage::SpotFilled, false,
                Decimal::from_string("0.2"));
    ledger.open(opp, "beta", "BTC-USDT", Side::Sell, Decimal::from_int(2),
                Decimal::from_int(101), "b-1", ExecutionStage::SpotFilled, false,
                Decimal::from_string("0.2"));

    Decimal pnl = ledger.settle_group(opp.id);
    REQUIRE(pnl == Decimal::from_string("1.6"));
    REQUIRE(ledger.open_count() == 0);
    REQUIRE_FALSE(ledger.group(opp.id).has_value());
    REQUIRE(ledger.statistics().realized_pnl == Decimal::from_string("1.6"));
    REQUIRE(ledger.statistics().positions_closed == 2);
}

TEST_CASE("Stale positions are flagged, not closed", "[positions]") {
    Settings settings;
    RecordingSink alerts;
    PositionLedger ledger(settings, alerts);
    auto opp = spot_futures();

    auto pos = ledger.open(opp, "beta", "BTC-USDT-PERP", Side::Sell, Decimal::one(),
                           Decimal::from_int(101), "b-1", ExecutionStage::FuturesFilled, true);
    REQUIRE(ledger.sweep_stale().empty());

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    auto flagged = ledger.sweep_stale(10);
    REQUIRE(flagged.size() == 1);
    REQUIRE(flagged[0].position_id == pos.position_id);
    REQUIRE(ledger.get(pos.position_id)->stale);
    REQUIRE(ledger.stale().size() == 1);
    REQUIRE(alerts.stale().size() == 1);

    // Flagged once
    REQUIRE(ledger.sweep_stale(10).empty());
    REQUIRE(ledger.statistics().stale_positions == 1);
}
