// xarb - Balance Ledger Implementation

#include <xarb/balance_ledger.hpp>
#include <xarb/errors.hpp>
#include <xarb/logging.hpp>
#include <chrono>

namespace xarb {

BalanceLedger::BalanceLedger(const Settings& settings, const ExchangeRegistry& exchanges)
    : settings_(settings), exchanges_(exchanges) {}

void BalanceLedger::update_balances(const std::string& exchange,
                                    const std::vector<Balance>& balances) {
    std::unique_lock lock(mutex_);
    store_locked(exchange, balances, now_ms());
}

void BalanceLedger::refresh(const std::string& exchange) {
    auto balances = fetch(exchange);
    update_balances(exchange, balances);
    Logger::debug("Refreshed {} balances on {}", balances.size(), exchange);
}

std::string BalanceLedger::reserve(const std::string& exchange,
                                   const std::string& asset,
                                   Decimal amount,
                                   const std::string& operation_id,
                                   std::optional<int64_t> ttl_ms) {
    if (!amount.is_positive()) {
        throw InsufficientBalance("Reservation amount must be positive: " + amount.to_string());
    }

    std::unique_lock lock(mutex_);
    int64_t now = now_ms();

    const BalanceSnapshot* snapshot = nullptr;
    auto ex = balances_.find(exchange);
    if (ex != balances_.end()) {
        auto it = ex->second.find(asset);
        if (it != ex->second.end()) snapshot = &it->second;
    }

    if (!snapshot) {
        ++stats_.reservations_rejected;
        throw InsufficientBalance("No balance known for " + asset + " on " + exchange);
    }
    if (now - snapshot->updated_at > settings_.timing.balance_staleness_ms) {
        ++stats_.reservations_rejected;
        throw InsufficientBalance("Balance for " + asset + " on " + exchange + " is stale");
    }

    Decimal available = snapshot->free - reserved_locked(exchange, asset, now);
    if (available < amount) {
        ++stats_.reservations_rejected;
        throw InsufficientBalance(
            "Insufficient " + asset + " on " + exchange + ": available " +
            available.to_string() + " < " + amount.to_string());
    }

    BalanceReservation res;
    res.reservation_id = make_id("res");
    res.exchange = exchange;
    res.asset = asset;
    res.amount = amount;
    res.operation_id = operation_id;
    res.created_at = now;
    res.expires_at = now + ttl_ms.value_or(settings_.timing.reservation_ttl_ms);

    auto id = res.reservation_id;
    reservations_.emplace(id, std::move(res));
    ++stats_.reservations_made;

    Logger::debug("Reserved {} {} on {} for {} ({})",
                  amount.to_string(), asset, exchange, operation_id, id);
    return id;
}

std::optional<std::string> BalanceLedger::try_reserve(const std::string& exchange,
                                                      const std::string& asset,
                                                      Decimal amount,
                                                      const std::string& operation_id,
                                                      std::optional<int64_t> ttl_ms) {
    try {
        return reserve(exchange, asset, amount, operation_id, ttl_ms);
    } catch (const InsufficientBalance& e) {
        Logger::debug("Reservation refused: {}", e.what());
        return std::nullopt;
    }
}

bool BalanceLedger::release(const std::string& reservation_id) {
    std::unique_lock lock(mutex_);
    if (reservations_.erase(reservation_id) == 0) {
        return false;
    }
    ++stats_.reservations_released;
    return true;
}

size_t BalanceLedger::release_operation(const std::string& operation_id) {
    std::unique_lock lock(mutex_);
    size_t removed = 0;
    for (auto it = reservations_.begin(); it != reservations_.end();) {
        if (it->second.operation_id == operation_id) {
            it = reservations_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    stats_.reservations_released += removed;
    return removed;
}

size_t BalanceLedger::sweep_expired() {
    size_t removed = 0;
    {
        std::unique_lock lock(mutex_);
        int64_t now = now_ms();
        for (auto it = reservations_.begin(); it != reservations_.end();) {
            if (it->second.is_expired(now)) {
                it = reservations_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        stats_.reservations_expired += removed;
    }

    if (removed > 0) {
        Logger::info("Purged {} expired balance reservations", removed);
    }
    return removed;
}

Decimal BalanceLedger::available_balance(const std::string& exchange,
                                         const std::string& asset,
                                         bool include_reserved) {
    auto balances = fetch(exchange);

    std::unique_lock lock(mutex_);
    int64_t now = now_ms();
    store_locked(exchange, balances, now);

    Decimal free;
    for (const auto& b : balances) {
        if (b.asset == asset) {
            free = b.free;
            break;
        }
    }
    if (include_reserved) return free;
    return free - reserved_locked(exchange, asset, now);
}

bool BalanceLedger::check_sufficient(const std::string& exchange,
                                     const std::string& asset,
                                     Decimal amount,
                                     std::optional<Decimal> safety_margin) noexcept {
    try {
        Decimal margin = safety_margin.value_or(settings_.risk.balance_safety_margin);
        Decimal required = amount * (Decimal::one() + margin);
        return available_balance(exchange, asset) >= required;
    } catch (const std::exception& e) {
        Logger::warn("Balance check failed for {} on {}: {}", asset, exchange, e.what());
        return false;
    }
}

bool BalanceLedger::holds(const std::string& operation_id,
                          const std::string& exchange,
                          const std::string& asset) const {
    std::shared_lock lock(mutex_);
    int64_t now = now_ms();
    for (const auto& [id, res] : reservations_) {
        if (res.operation_id == operation_id && res.exchange == exchange &&
            res.asset == asset && !res.is_expired(now)) {
            return true;
        }
    }
    return false;
}

Decimal BalanceLedger::reserved(const std::string& exchange, const std::string& asset) const {
    std::shared_lock lock(mutex_);
    return reserved_locked(exchange, asset, now_ms());
}

std::optional<BalanceSnapshot> BalanceLedger::last_known(const std::string& exchange,
                                                         const std::string& asset) const {
    std::shared_lock lock(mutex_);
    auto ex = balances_.find(exchange);
    if (ex == balances_.end()) return std::nullopt;
    auto it = ex->second.find(asset);
    if (it == ex->second.end()) return std::nullopt;
    return it->second;
}

std::optional<BalanceReservation> BalanceLedger::reservation(const std::string& reservation_id) const {
    std::shared_lock lock(mutex_);
    auto it = reservations_.find(reservation_id);
    if (it == reservations_.end()) return std::nullopt;
    return it->second;
}

std::vector<BalanceReservation> BalanceLedger::reservations(
    const std::optional<std::string>& operation_id) const {
    std::shared_lock lock(mutex_);
    std::vector<BalanceReservation> result;
    for (const auto& [id, res] : reservations_) {
        if (!operation_id || res.operation_id == *operation_id) {
            result.push_back(res);
        }
    }
    return result;
}

BalanceStats BalanceLedger::statistics() const {
    std::shared_lock lock(mutex_);
    BalanceStats stats = stats_;
    stats.active_reservations = reservations_.size();
    stats.tracked_exchanges = balances_.size();
    return stats;
}

std::vector<Balance> BalanceLedger::fetch(const std::string& exchange) {
    auto& port = exchanges_.get(exchange);
    auto future = port.get_account_balance();
    return await_for(future,
                     std::chrono::milliseconds(settings_.general.leg_timeout_ms),
                     "balances on " + exchange);
}

void BalanceLedger::store_locked(const std::string& exchange,
                                 const std::vector<Balance>& balances,
                                 int64_t now) {
    // A read replaces the exchange's assets; omitted assets are no longer known
    std::unordered_map<std::string, BalanceSnapshot> assets;
    for (const auto& b : balances) {
        assets[b.asset] = BalanceSnapshot{b.free, b.locked, now};
    }
    balances_[exchange] = std::move(assets);
}

Decimal BalanceLedger::reserved_locked(const std::string& exchange,
                                       const std::string& asset,
                                       int64_t now) const {
    Decimal total;
    for (const auto& [id, res] : reservations_) {
        if (res.exchange == exchange && res.asset == asset && !res.is_expired(now)) {
            total += res.amount;
        }
    }
    return total;
}

}  // namespace xarb
