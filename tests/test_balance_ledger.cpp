// xarb - Balance Ledger Tests

#include <catch2/catch_test_macros.hpp>
#include <xarb/balance_ledger.hpp>
#include <xarb/errors.hpp>
#include "mock_exchange.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace xarb;
using namespace xarb::testing;

namespace {

struct LedgerFixture {
    Settings settings;
    ExchangeRegistry registry;
    std::shared_ptr<MockExchange> alpha = std::make_shared<MockExchange>("alpha");

    LedgerFixture() {
        alpha->set_balance("USDT", Decimal::from_int(1000));
        alpha->set_balance("BTC", Decimal::from_int(2));
        registry.add(alpha);
    }
};

}  // namespace

TEST_CASE("Reservations respect available balance", "[balance]") {
    LedgerFixture f;
    BalanceLedger ledger(f.settings, f.registry);
    ledger.refresh("alpha");

    SECTION("Reserve within balance") {
        auto id = ledger.reserve("alpha", "USDT", Decimal::from_int(600), "op1");
        REQUIRE_FALSE(id.empty());
        REQUIRE(ledger.reserved("alpha", "USDT") == Decimal::from_int(600));
        REQUIRE(ledger.holds("op1", "alpha", "USDT"));
        REQUIRE_FALSE(ledger.holds("op1", "alpha", "BTC"));
    }

    SECTION("Second reservation sees the first") {
        ledger.reserve("alpha", "USDT", Decimal::from_int(600), "op1");
        REQUIRE_THROWS_AS(ledger.reserve("alpha", "USDT", Decimal::from_int(500), "op2"),
                          InsufficientBalance);
        REQUIRE_FALSE(ledger.try_reserve("alpha", "USDT", Decimal::from_int(500), "op2").has_value());
        REQUIRE(ledger.try_reserve("alpha", "USDT", Decimal::from_int(400), "op2").has_value());
        REQUIRE(ledger.reserved("alpha", "USDT") == Decimal::from_int(1000));
    }

    SECTION("Unknown asset or exchange") {
        REQUIRE_THROWS_AS(ledger.reserve("alpha", "ETH", Decimal::one(), "op1"), InsufficientBalance);
        REQUIRE_THROWS_AS(ledger.reserve("gamma", "USDT", Decimal::one(), "op1"), InsufficientBalance);
    }

    SECTION("Non-positive amounts") {
        REQUIRE_THROWS_AS(ledger.reserve("alpha", "USDT", Decimal::zero(), "op1"), InsufficientBalance);
    }

    SECTION("Rejections are counted") {
        REQUIRE_FALSE(ledger.try_reserve("alpha", "USDT", Decimal::from_int(5000), "op1").has_value());
        REQUIRE(ledger.statistics().reservations_rejected == 1);
    }
}

TEST_CASE("Stale snapshots refuse reservations", "[balance]") {
    LedgerFixture f;
    f.settings.timing.balance_staleness_ms = 20;
    BalanceLedger ledger(f.settings, f.registry);

    ledger.update_balances("alpha", {Balance{"USDT", Decimal::from_int(1000), Decimal::zero()}});
    REQUIRE_NOTHROW(ledger.reserve("alpha", "USDT", Decimal::one(), "op1"));

    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    REQUIRE_THROWS_AS(ledger.reserve("alpha", "USDT", Decimal::one(), "op1"), InsufficientBalance);

    ledger.refresh("alpha");
    REQUIRE_NOTHROW(ledger.reserve("alpha", "USDT", Decimal::one(), "op1"));
}

TEST_CASE("A fresh read replaces the previous one", "[balance]") {
    LedgerFixture f;
    BalanceLedger ledger(f.settings, f.registry);

    ledger.update_balances("alpha", {Balance{"USDT", Decimal::from_int(1000), Decimal::zero()}});
    ledger.update_balances("alpha", {Balance{"BTC", Decimal::one(), Decimal::zero()}});

    // USDT was omitted from the latest read
    REQUIRE_FALSE(ledger.try_reserve("alpha", "USDT", Decimal::from_int(500), "op1").has_value());
    REQUIRE(ledger.try_reserve("alpha", "BTC", Decimal::one(), "op1").has_value());

    SECTION("Omitted assets come back with the next read") {
        f.alpha->set_balance("USDT", Decimal::from_int(800));
        ledger.refresh("alpha");
        REQUIRE(ledger.try_reserve("alpha", "USDT", Decimal::from_int(500), "op2").has_value());
    }
}

TEST_CASE("Release is idempotent", "[balance]") {
    LedgerFixture f;
    BalanceLedger ledger(f.settings, f.registry);
    ledger.refresh("alpha");

    auto id = ledger.reserve("alpha", "USDT", Decimal::from_int(100), "op1");
    REQUIRE(ledger.release(id));
    REQUIRE_FALSE(ledger.release(id));
    REQUIRE(ledger.reserved("alpha", "USDT").is_zero());

    SECTION("Release by operation") {
        ledger.reserve("alpha", "USDT", Decimal::from_int(100), "op2");
        ledger.reserve("alpha", "BTC", Decimal::one(), "op2");
        ledger.reserve("alpha", "USDT", Decimal::from_int(100), "op3");

        REQUIRE(ledger.release_operation("op2") == 2);
        REQUIRE(ledger.release_operation("op2") == 0);
        REQUIRE(ledger.reservations("op3").size() == 1);
    }
}

TEST_CASE("Expired reservations stop counting", "[balance]") {
    LedgerFixture f;
    BalanceLedger ledger(f.settings, f.registry);
    ledger.refresh("alpha");

    auto id = ledger.reserve("alpha", "USDT", Decimal::from_int(900), "op1", 10);
    REQUIRE(ledger.reservation(id).has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    REQUIRE(ledger.reserved("alpha", "USDT").is_zero());
    REQUIRE_NOTHROW(ledger.reserve("alpha", "USDT", Decimal::from_int(900), "op2"));

    REQUIRE(ledger.sweep_expired() == 1);
    REQUIRE_FALSE(ledger.reservation(id).has_value());
    REQUIRE(ledger.statistics().reservations_expired == 1);
}

TEST_CASE("Fresh availability checks", "[balance]") {
    LedgerFixture f;
    BalanceLedger ledger(f.settings, f.registry);
    ledger.refresh("alpha");
    ledger.reserve("alpha", "USDT", Decimal::from_int(400), "op1");

    REQUIRE(ledger.available_balance("alpha", "USDT") == Decimal::from_int(600));
    REQUIRE(ledger.available_balance("alpha", "USDT", true) == Decimal::from_int(1000));

    SECTION("Safety margin scales the requirement") {
        REQUIRE(ledger.check_sufficient("alpha", "USDT", Decimal::from_int(500), Decimal::from_string("0.1")));
        REQUIRE_FALSE(ledger.check_sufficient("alpha", "USDT", Decimal::from_int(550), Decimal::from_string("0.1")));
    }

    SECTION("Unavailable exchange reads as insufficient") {
        f.alpha->set_connected(false);
        REQUIRE_FALSE(ledger.check_sufficient("alpha", "USDT", Decimal::one()));
        REQUIRE_THROWS_AS(ledger.available_balance("alpha", "USDT"), ExchangeUnavailable);
    }

    SECTION("Balance changes on the exchange are picked up") {
        f.alpha->set_balance("USDT", Decimal::from_int(2000));
        REQUIRE(ledger.available_balance("alpha", "USDT") == Decimal::from_int(1600));
        REQUIRE(ledger.last_known("alpha", "USDT")->free == Decimal::from_int(2000));
    }
}

TEST_CASE("Concurrent reservations never oversubscribe", "[balance]") {
    LedgerFixture f;
    BalanceLedger ledger(f.settings, f.registry);
    ledger.refresh("alpha");

    constexpr int kThreads = 8;
    constexpr int kAttempts = 50;
    std::atomic<int> granted{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kAttempts; ++i) {
                auto op = "op" + std::to_string(t) + "_" + std::to_string(i);
                if (ledger.try_reserve("alpha", "USDT", Decimal::from_int(7), op)) {
                    ++granted;
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    // 1000 / 7 = 142 reservations fit
    REQUIRE(granted.load() == 142);
    REQUIRE(ledger.reserved("alpha", "USDT") == Decimal::from_int(994));
    REQUIRE(ledger.reservations().size() == 142);
}
