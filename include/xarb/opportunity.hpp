// xarb - Opportunity Types
// Detector-supplied arbitrage opportunities and execution stages

#pragma once

#include <xarb/types.hpp>
#include <optional>
#include <string>

namespace xarb {

/// Kind of arbitrage an opportunity describes
enum class OpportunityType : uint8_t {
    /// Buy on one spot venue, sell on another
    SpotSpot = 0,
    /// Spot leg hedged with an opposite futures position
    SpotFuturesHedge = 1,
    /// Three-leg cycle on a single venue
    Triangular = 2,
    /// Spot position held against a perpetual to collect funding
    FundingRate = 3
};

inline constexpr const char* to_string(OpportunityType t) noexcept {
    switch (t) {
        case OpportunityType::SpotSpot: return "spot_spot";
        case OpportunityType::SpotFuturesHedge: return "spot_futures_hedge";
        case OpportunityType::Triangular: return "triangular";
        case OpportunityType::FundingRate: return "funding_rate";
    }
    return "unknown";
}

/// Progress marker of a multi-leg execution
enum class ExecutionStage : uint8_t {
    Preparing = 0,
    SpotOrdering = 1,
    SpotFilled = 2,
    FuturesOrdering = 3,
    FuturesFilled = 4,
    ClosingPosition = 5
};

inline constexpr const char* to_string(ExecutionStage s) noexcept {
    switch (s) {
        case ExecutionStage::Preparing: return "preparing";
        case ExecutionStage::SpotOrdering: return "spot_ordering";
        case ExecutionStage::SpotFilled: return "spot_filled";
        case ExecutionStage::FuturesOrdering: return "futures_ordering";
        case ExecutionStage::FuturesFilled: return "futures_filled";
        case ExecutionStage::ClosingPosition: return "closing_position";
    }
    return "unknown";
}

/// Hedge leg on a futures market
struct FuturesLeg {
    std::string symbol;
    Decimal hedge_ratio = Decimal::one();
    Decimal price;
};

/// Detected opportunity; never mutated once handed to the engine
struct ArbitrageOpportunity {
    std::string id;
    OpportunityType type{OpportunityType::SpotSpot};
    std::string symbol;           // BASE-QUOTE
    std::string buy_exchange;
    std::string sell_exchange;
    Decimal buy_price;
    Decimal sell_price;
    Decimal max_quantity;
    Decimal profit_per_unit;
    Decimal total_profit;
    Decimal profit_margin_bps;
    Decimal price_impact;
    int64_t execution_window_ms{0};
    Decimal required_balance_buy;   // quote asset on buy_exchange
    Decimal required_balance_sell;  // base asset (or margin) on sell_exchange
    int64_t detected_at{0};         // Unix timestamp in milliseconds

    bool depth_validated{false};
    bool balance_validated{false};
    bool risk_approved{false};

    std::optional<FuturesLeg> futures;

    [[nodiscard]] bool is_validated() const noexcept {
        return depth_validated && balance_validated && risk_approved;
    }

    [[nodiscard]] bool meets_min_profit(int min_bps) const noexcept {
        return profit_margin_bps >= Decimal::from_int(min_bps);
    }

    [[nodiscard]] bool is_window_open(int64_t now) const noexcept {
        return now <= detected_at + execution_window_ms;
    }

    [[nodiscard]] bool is_hedged() const noexcept {
        return type == OpportunityType::SpotFuturesHedge ||
               type == OpportunityType::FundingRate;
    }

    // Number of legs a complete execution fills
    [[nodiscard]] int expected_legs() const noexcept {
        switch (type) {
            case OpportunityType::SpotSpot: return 2;
            case OpportunityType::SpotFuturesHedge: return 2;
            case OpportunityType::Triangular: return 3;
            case OpportunityType::FundingRate: return 2;
        }
        return 2;
    }

    [[nodiscard]] Decimal notional() const noexcept {
        return max_quantity * buy_price;
    }
};

}  // namespace xarb
