// xarb - Balance Ledger
// Reservation table preventing double allocation of exchange funds

#pragma once

#include <xarb/config.hpp>
#include <xarb/exchange.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace xarb {

// Funds earmarked for one operation on one exchange
struct BalanceReservation {
    std::string reservation_id;
    std::string exchange;
    std::string asset;
    Decimal amount;
    std::string operation_id;
    int64_t created_at{0};
    int64_t expires_at{0};

    [[nodiscard]] bool is_expired(int64_t now) const noexcept { return now >= expires_at; }
};

// Last balance read from an exchange
struct BalanceSnapshot {
    Decimal free;
    Decimal locked;
    int64_t updated_at{0};
};

struct BalanceStats {
    size_t active_reservations{0};
    size_t tracked_exchanges{0};
    uint64_t reservations_made{0};
    uint64_t reservations_rejected{0};
    uint64_t reservations_released{0};
    uint64_t reservations_expired{0};
};

// Thread-safe balance ledger
//
// Available balance is the last known free balance minus every live
// reservation against the same (exchange, asset). The availability check and
// the insert happen under one lock, so concurrent reservations can never
// jointly exceed the free balance.
class BalanceLedger {
public:
    BalanceLedger(const Settings& settings, const ExchangeRegistry& exchanges);

    BalanceLedger(const BalanceLedger&) = delete;
    BalanceLedger& operator=(const BalanceLedger&) = delete;

    // Record a fresh read supplied by the caller
    void update_balances(const std::string& exchange, const std::vector<Balance>& balances);

    // Fetch balances through the exchange port
    void refresh(const std::string& exchange);

    // Throws InsufficientBalance; returns the reservation id
    std::string reserve(const std::string& exchange,
                        const std::string& asset,
                        Decimal amount,
                        const std::string& operation_id,
                        std::optional<int64_t> ttl_ms = std::nullopt);

    std::optional<std::string> try_reserve(const std::string& exchange,
                                           const std::string& asset,
                                           Decimal amount,
                                           const std::string& operation_id,
                                           std::optional<int64_t> ttl_ms = std::nullopt);

    // Returns false if the reservation was already gone
    bool release(const std::string& reservation_id);
    size_t release_operation(const std::string& operation_id);

    // Purge expired reservations; returns how many were removed
    size_t sweep_expired();

    // Fresh fetch through the port, minus live reservations unless include_reserved
    Decimal available_balance(const std::string& exchange,
                              const std::string& asset,
                              bool include_reserved = false);

    // Fresh availability check against amount * (1 + safety_margin)
    [[nodiscard]] bool check_sufficient(const std::string& exchange,
                                        const std::string& asset,
                                        Decimal amount,
                                        std::optional<Decimal> safety_margin = std::nullopt) noexcept;

    [[nodiscard]] bool holds(const std::string& operation_id,
                             const std::string& exchange,
                             const std::string& asset) const;
    [[nodiscard]] Decimal reserved(const std::string& exchange, const std::string& asset) const;
    [[nodiscard]] std::optional<BalanceSnapshot> last_known(const std::string& exchange,
                                                            const std::string& asset) const;
    [[nodiscard]] std::optional<BalanceReservation> reservation(const std::string& reservation_id) const;
    [[nodiscard]] std::vector<BalanceReservation> reservations(
        const std::optional<std::string>& operation_id = std::nullopt) const;

    [[nodiscard]] BalanceStats statistics() const;

private:
    std::vector<Balance> fetch(const std::string& exchange);
    void store_locked(const std::string& exchange, const std::vector<Balance>& balances, int64_t now);
    Decimal reserved_locked(const std::string& exchange, const std::string& asset, int64_t now) const;

    const Settings& settings_;
    const ExchangeRegistry& exchanges_;

    mutable std::shared_mutex mutex_;
    // exchange -> asset -> snapshot
    std::unordered_map<std::string, std::unordered_map<std::string, BalanceSnapshot>> balances_;
    std::unordered_map<std::string, BalanceReservation> reservations_;
    BalanceStats stats_;
};

}  // namespace xarb
