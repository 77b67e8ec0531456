// xarb - Position Ledger
// Thread-safe record of filled legs grouped per opportunity

#pragma once

#include <xarb/alerts.hpp>
#include <xarb/config.hpp>
#include <xarb/exchange.hpp>
#include <xarb/opportunity.hpp>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace xarb {

// One filled (or partially filled) leg
struct PositionEntry {
    std::string position_id;
    std::string opportunity_id;
    std::string exchange;
    std::string symbol;
    Side side{Side::Buy};
    Decimal quantity;
    Decimal entry_price;
    std::string order_id;
    int64_t filled_at{0};
    ExecutionStage stage{ExecutionStage::Preparing};
    Decimal fees;
    bool is_hedge{false};
    Decimal hedge_ratio = Decimal::one();
    bool requires_closing{true};
    bool is_partial{false};
    Decimal remaining_quantity;
    int recovery_attempts{0};
    bool stale{false};

    [[nodiscard]] Decimal notional() const noexcept { return quantity * entry_price; }

    [[nodiscard]] Decimal signed_quantity() const noexcept {
        return side == Side::Buy ? quantity : -quantity;
    }

    // Before fees
    [[nodiscard]] Decimal unrealized_pnl(Decimal current_price) const noexcept {
        Decimal diff = side == Side::Buy ? current_price - entry_price
                                         : entry_price - current_price;
        return diff * quantity;
    }

    [[nodiscard]] bool is_stale(int64_t now, int64_t max_age_ms) const noexcept {
        return now - filled_at > max_age_ms;
    }
};

// Positions opened for one opportunity
struct PositionGroup {
    std::string group_id;       // "group_<opportunity id>"
    std::string opportunity_id;
    OpportunityType type{OpportunityType::SpotSpot};
    std::vector<std::string> position_ids;
    int expected_legs{2};
    bool is_complete{false};
    Decimal net_exposure;       // signed base quantity
    Decimal hedge_ratio = Decimal::one();
    Decimal realized_pnl;
    int64_t created_at{0};
    int64_t updated_at{0};
};

struct ClosedPosition {
    PositionEntry position;
    Decimal close_price;
    std::optional<std::string> close_order_id;
    Decimal realized_pnl;
    int64_t closed_at{0};
};

struct PositionStats {
    size_t open_positions{0};
    size_t open_groups{0};
    size_t stale_positions{0};
    uint64_t positions_opened{0};
    uint64_t positions_closed{0};
    Decimal realized_pnl;
};

inline std::string group_id_for(const std::string& opportunity_id) {
    return "group_" + opportunity_id;
}

class PositionLedger {
public:
    // prices may be null; mark-to-market queries then require an explicit source
    PositionLedger(const Settings& settings, AlertSink& alerts, PriceSource* prices = nullptr);

    PositionLedger(const PositionLedger&) = delete;
    PositionLedger& operator=(const PositionLedger&) = delete;

    PositionEntry open(const ArbitrageOpportunity& opportunity,
                       const std::string& exchange,
                       const std::string& symbol,
                       Side side,
                       Decimal quantity,
                       Decimal entry_price,
                       const std::string& order_id,
                       ExecutionStage stage,
                       bool is_hedge,
                       Decimal fees = Decimal::zero(),
                       Decimal remaining = Decimal::zero());

    // Adds a later fill to a partial position; entry price becomes the weighted average
    PositionEntry record_fill(const std::string& position_id,
                              Decimal quantity,
                              Decimal price,
                              Decimal fees = Decimal::zero());

    // Throws PositionNotFound. Without a close price the current price is fetched.
    ClosedPosition close(const std::string& position_id,
                         std::optional<Decimal> close_price = std::nullopt,
                         std::optional<std::string> close_order_id = std::nullopt,
                         PriceSource* prices = nullptr);

    // Settles a round trip: sell notional - buy notional - fees. Removes every member.
    Decimal settle_group(const std::string& opportunity_id);

    // Signed notional per symbol
    [[nodiscard]] std::map<std::string, Decimal> exposure(
        const std::optional<std::string>& exchange = std::nullopt) const;

    // Realized P&L, plus unrealized P&L of live positions when mark_to_market
    [[nodiscard]] Decimal total_pnl(const std::optional<std::string>& exchange = std::nullopt,
                                    bool mark_to_market = false,
                                    PriceSource* prices = nullptr) const;

    [[nodiscard]] std::optional<PositionEntry> get(const std::string& position_id) const;
    [[nodiscard]] std::vector<PositionEntry> positions(
        const std::optional<std::string>& exchange = std::nullopt,
        const std::optional<std::string>& symbol = std::nullopt) const;
    [[nodiscard]] std::vector<PositionEntry> positions_for(const std::string& opportunity_id) const;
    [[nodiscard]] std::optional<PositionGroup> group(const std::string& opportunity_id) const;
    [[nodiscard]] std::vector<PositionGroup> groups() const;
    [[nodiscard]] size_t open_count() const;

    // Flags positions older than max_age_ms; returns the newly flagged ones
    std::vector<PositionEntry> sweep_stale(std::optional<int64_t> max_age_ms = std::nullopt);
    [[nodiscard]] std::vector<PositionEntry> stale() const;

    [[nodiscard]] PositionStats statistics() const;

private:
    Decimal fetch_price(PriceSource* prices, const PositionEntry& position) const;
    void remove_locked(const PositionEntry& position);
    void refresh_group_locked(PositionGroup& group);

    const Settings& settings_;
    AlertSink& alerts_;
    PriceSource* prices_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, PositionEntry> positions_;
    std::unordered_map<std::string, std::unordered_set<std::string>> by_exchange_;
    std::unordered_map<std::string, std::unordered_set<std::string>> by_symbol_;
    std::unordered_map<std::string, PositionGroup> groups_;  // keyed by opportunity id
    std::unordered_map<std::string, Decimal> realized_by_exchange_;
    uint64_t opened_{0};
    uint64_t closed_{0};
};

}  // namespace xarb
