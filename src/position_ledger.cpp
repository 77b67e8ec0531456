// xarb - Position Ledger Implementation

#include <xarb/position_ledger.hpp>
#include <xarb/errors.hpp>
#include <xarb/logging.hpp>
#include <algorithm>
#include <chrono>

namespace xarb {

PositionLedger::PositionLedger(const Settings& settings, AlertSink& alerts, PriceSource* prices)
    : settings_(settings), alerts_(alerts), prices_(prices) {}

PositionEntry PositionLedger::open(const ArbitrageOpportunity& opportunity,
                                   const std::string& exchange,
                                   const std::string& symbol,
                                   Side side,
                                   Decimal quantity,
                                   Decimal entry_price,
                                   const std::string& order_id,
                                   ExecutionStage stage,
                                   bool is_hedge,
                                   Decimal fees,
                                   Decimal remaining) {
    PositionEntry entry;
    entry.position_id = make_id("pos");
    entry.opportunity_id = opportunity.id;
    entry.exchange = exchange;
    entry.symbol = symbol;
    entry.side = side;
    entry.quantity = quantity;
    entry.entry_price = entry_price;
    entry.order_id = order_id;
    entry.filled_at = now_ms();
    entry.stage = stage;
    entry.fees = fees;
    entry.is_hedge = is_hedge;
    if (is_hedge && opportunity.futures) {
        entry.hedge_ratio = opportunity.futures->hedge_ratio;
    }
    entry.remaining_quantity = remaining;
    entry.is_partial = remaining.is_positive();

    {
        std::unique_lock lock(mutex_);
        positions_[entry.position_id] = entry;
        by_exchange_[exchange].insert(entry.position_id);
        by_symbol_[symbol].insert(entry.position_id);

        auto [it, inserted] = groups_.try_emplace(opportunity.id);
        auto& group = it->second;
        if (inserted) {
            group.group_id = group_id_for(opportunity.id);
            group.opportunity_id = opportunity.id;
            group.type = opportunity.type;
            group.expected_legs = opportunity.expected_legs();
            group.hedge_ratio = opportunity.futures ? opportunity.futures->hedge_ratio
                                                    : Decimal::one();
            group.created_at = entry.filled_at;
        }
        group.position_ids.push_back(entry.position_id);
        refresh_group_locked(group);
        ++opened_;
    }

    Logger::info("Opened position {} {} {} {} @ {} on {} (opportunity {})",
                 entry.position_id, to_string(side), quantity.to_string(), symbol,
                 entry_price.to_string(), exchange, opportunity.id);
    return entry;
}

PositionEntry PositionLedger::record_fill(const std::string& position_id,
                                          Decimal quantity,
                                          Decimal price,
                                          Decimal fees) {
    std::unique_lock lock(mutex_);
    auto it = positions_.find(position_id);
    if (it == positions_.end()) {
        throw PositionNotFound(position_id);
    }

    auto& entry = it->second;
    Decimal total = entry.quantity + quantity;
    if (total.is_positive()) {
        entry.entry_price = (entry.notional() + quantity * price) / total;
    }
    entry.quantity = total;
    entry.fees += fees;
    entry.remaining_quantity = max(entry.remaining_quantity - quantity, Decimal::zero());
    entry.is_partial = entry.remaining_quantity.is_positive();

    auto group_it = groups_.find(entry.opportunity_id);
    if (group_it != groups_.end()) {
        refresh_group_locked(group_it->second);
    }
    return entry;
}

ClosedPosition PositionLedger::close(const std::string& position_id,
                                     std::optional<Decimal> close_price,
                                     std::optional<std::string> close_order_id,
                                     PriceSource* prices) {
    PositionEntry snapshot;
    {
        std::shared_lock lock(mutex_);
        auto it = positions_.find(position_id);
        if (it == positions_.end()) {
            throw PositionNotFound(position_id);
        }
        snapshot = it->second;
    }

    // Price I/O happens outside the lock
    Decimal price = close_price ? *close_price
                                : fetch_price(prices ? prices : prices_, snapshot);

    ClosedPosition result;
    {
        std::unique_lock lock(mutex_);
        auto it = positions_.find(position_id);
        if (it == positions_.end()) {
            throw PositionNotFound(position_id);
        }

        result.position = it->second;
        const auto& pos = result.position;
        Decimal diff = pos.side == Side::Buy ? price - pos.entry_price
                                             : pos.entry_price - price;
        result.realized_pnl = diff * pos.quantity - pos.fees;
        result.close_price = price;
        result.close_order_id = std::move(close_order_id);
        result.closed_at = now_ms();

        realized_by_exchange_[pos.exchange] += result.realized_pnl;
        auto group_it = groups_.find(pos.opportunity_id);
        if (group_it != groups_.end()) {
            group_it->second.realized_pnl += result.realized_pnl;
        }
        remove_locked(pos);
        ++closed_;
    }

    Logger::info("Closed position {} @ {} realized {}",
                 position_id, price.to_string(), result.realized_pnl.to_string());
    return result;
}

Decimal PositionLedger::settle_group(const std::string& opportunity_id) {
    Decimal pnl;
    size_t count = 0;
    {
        std::unique_lock lock(mutex_);
        auto group_it = groups_.find(opportunity_id);
        if (group_it == groups_.end()) {
            throw PositionNotFound(group_id_for(opportunity_id));
        }

        std::vector<PositionEntry> members;
        for (const auto& id : group_it->second.position_ids) {
            auto it = positions_.find(id);
            if (it != positions_.end()) {
                members.push_back(it->second);
            }
        }

        for (const auto& pos : members) {
            Decimal leg = pos.side == Side::Sell ? pos.notional() : -pos.notional();
            leg -= pos.fees;
            pnl += leg;
            realized_by_exchange_[pos.exchange] += leg;
            remove_locked(pos);
            ++closed_;
        }
        count = members.size();
        groups_.erase(opportunity_id);
    }

    Logger::info("Settled group {} ({} positions) realized {}",
                 group_id_for(opportunity_id), count, pnl.to_string());
    return pnl;
}

std::map<std::string, Decimal> PositionLedger::exposure(
    const std::optional<std::string>& exchange) const {
    std::map<std::string, Decimal> result;
    for (const auto& pos : positions(exchange)) {
        Decimal notional = pos.notional();
        result[pos.symbol] += pos.side == Side::Buy ? notional : -notional;
    }
    return result;
}

Decimal PositionLedger::total_pnl(const std::optional<std::string>& exchange,
                                  bool mark_to_market,
                                  PriceSource* prices) const {
    Decimal total;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [name, pnl] : realized_by_exchange_) {
            if (!exchange || *exchange == name) {
                total += pnl;
            }
        }
    }

    if (!mark_to_market) return total;

    PriceSource* source = prices ? prices : prices_;
    for (const auto& pos : positions(exchange)) {
        total += pos.unrealized_pnl(fetch_price(source, pos)) - pos.fees;
    }
    return total;
}

std::optional<PositionEntry> PositionLedger::get(const std::string& position_id) const {
    std::shared_lock lock(mutex_);
    auto it = positions_.find(position_id);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

std::vector<PositionEntry> PositionLedger::positions(
    const std::optional<std::string>& exchange,
    const std::optional<std::string>& symbol) const {
    std::shared_lock lock(mutex_);
    std::vector<PositionEntry> result;

    if (exchange) {
        auto it = by_exchange_.find(*exchange);
        if (it == by_exchange_.end()) return result;
        for (const auto& id : it->second) {
            const auto& pos = positions_.at(id);
            if (!symbol || pos.symbol == *symbol) {
                result.push_back(pos);
            }
        }
        return result;
    }

    if (symbol) {
        auto it = by_symbol_.find(*symbol);
        if (it == by_symbol_.end()) return result;
        for (const auto& id : it->second) {
            result.push_back(positions_.at(id));
        }
        return result;
    }

    result.reserve(positions_.size());
    for (const auto& [id, pos] : positions_) {
        result.push_back(pos);
    }
    return result;
}

std::vector<PositionEntry> PositionLedger::positions_for(const std::string& opportunity_id) const {
    std::shared_lock lock(mutex_);
    std::vector<PositionEntry> result;
    auto it = groups_.find(opportunity_id);
    if (it == groups_.end()) return result;
    for (const auto& id : it->second.position_ids) {
        auto pos = positions_.find(id);
        if (pos != positions_.end()) {
            result.push_back(pos->second);
        }
    }
    return result;
}

std::optional<PositionGroup> PositionLedger::group(const std::string& opportunity_id) const {
    std::shared_lock lock(mutex_);
    auto it = groups_.find(opportunity_id);
    if (it == groups_.end()) return std::nullopt;
    return it->second;
}

std::vector<PositionGroup> PositionLedger::groups() const {
    std::shared_lock lock(mutex_);
    std::vector<PositionGroup> result;
    result.reserve(groups_.size());
    for (const auto& [id, group] : groups_) {
        result.push_back(group);
    }
    return result;
}

size_t PositionLedger::open_count() const {
    std::shared_lock lock(mutex_);
    return positions_.size();
}

std::vector<PositionEntry> PositionLedger::sweep_stale(std::optional<int64_t> max_age_ms) {
    int64_t max_age = max_age_ms.value_or(settings_.timing.stale_position_age_ms);
    int64_t now = now_ms();
    std::vector<PositionEntry> flagged;
    {
        std::unique_lock lock(mutex_);
        for (auto& [id, pos] : positions_) {
            if (!pos.stale && pos.is_stale(now, max_age)) {
                pos.stale = true;
                flagged.push_back(pos);
            }
        }
    }

    for (const auto& pos : flagged) {
        Logger::warn("Stale position {} on {} {} age {}ms",
                     pos.position_id, pos.exchange, pos.symbol, now - pos.filled_at);
        alerts_.on_stale_position(pos);
    }
    return flagged;
}

std::vector<PositionEntry> PositionLedger::stale() const {
    std::shared_lock lock(mutex_);
    std::vector<PositionEntry> result;
    for (const auto& [id, pos] : positions_) {
        if (pos.stale) result.push_back(pos);
    }
    return result;
}

PositionStats PositionLedger::statistics() const {
    std::shared_lock lock(mutex_);
    PositionStats stats;
    stats.open_positions = positions_.size();
    stats.open_groups = groups_.size();
    for (const auto& [id, pos] : positions_) {
        if (pos.stale) ++stats.stale_positions;
    }
    stats.positions_opened = opened_;
    stats.positions_closed = closed_;
    for (const auto& [name, pnl] : realized_by_exchange_) {
        stats.realized_pnl += pnl;
    }
    return stats;
}

Decimal PositionLedger::fetch_price(PriceSource* prices, const PositionEntry& position) const {
    if (!prices) {
        throw Error("No price source for " + position.symbol + " on " + position.exchange);
    }
    auto future = prices->current_price(position.symbol, position.exchange);
    return await_for(future,
                     std::chrono::milliseconds(settings_.general.leg_timeout_ms),
                     "price of " + position.symbol + " on " + position.exchange);
}

void PositionLedger::remove_locked(const PositionEntry& position) {
    positions_.erase(position.position_id);

    auto ex = by_exchange_.find(position.exchange);
    if (ex != by_exchange_.end()) {
        ex->second.erase(position.position_id);
        if (ex->second.empty()) by_exchange_.erase(ex);
    }

    auto sym = by_symbol_.find(position.symbol);
    if (sym != by_symbol_.end()) {
        sym->second.erase(position.position_id);
        if (sym->second.empty()) by_symbol_.erase(sym);
    }

    auto group_it = groups_.find(position.opportunity_id);
    if (group_it != groups_.end()) {
        auto& ids = group_it->second.position_ids;
        ids.erase(std::remove(ids.begin(), ids.end(), position.position_id), ids.end());
        if (ids.empty()) {
            groups_.erase(group_it);
        } else {
            refresh_group_locked(group_it->second);
        }
    }
}

void PositionLedger::refresh_group_locked(PositionGroup& group) {
    Decimal net;
    bool any_partial = false;
    for (const auto& id : group.position_ids) {
        auto it = positions_.find(id);
        if (it == positions_.end()) continue;
        net += it->second.signed_quantity();
        any_partial = any_partial || it->second.is_partial;
    }
    group.net_exposure = net;
    group.is_complete = static_cast<int>(group.position_ids.size()) >= group.expected_legs &&
                        !any_partial;
    group.updated_at = now_ms();
}

}  // namespace xarb
