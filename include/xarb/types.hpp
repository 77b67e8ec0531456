// xarb - Core Types
// Fixed-point money, order and balance structures shared by every component

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xarb {

// Fixed-point decimal for exact financial arithmetic
// Stores value as integer * 10^(-precision)
class Decimal {
public:
    static constexpr int PRECISION = 8;
    static constexpr int64_t SCALE = 100000000LL;

    constexpr Decimal() noexcept : value_(0) {}
    constexpr explicit Decimal(int64_t scaled) noexcept : value_(scaled) {}

    static Decimal from_double(double d) noexcept;
    static Decimal from_int(int64_t i) noexcept { return Decimal(i * SCALE); }
    static Decimal from_string(std::string_view s);

    [[nodiscard]] double to_double() const noexcept {
        return static_cast<double>(value_) / SCALE;
    }

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] int64_t scaled_value() const noexcept { return value_; }

    constexpr Decimal operator+(Decimal rhs) const noexcept {
        return Decimal(value_ + rhs.value_);
    }
    constexpr Decimal operator-(Decimal rhs) const noexcept {
        return Decimal(value_ - rhs.value_);
    }
    constexpr Decimal operator-() const noexcept { return Decimal(-value_); }

    // 128-bit intermediates: price * quantity overflows int64 above ~92k notional
    constexpr Decimal operator*(Decimal rhs) const noexcept {
        return Decimal(static_cast<int64_t>(
            (static_cast<__int128>(value_) * rhs.value_) / SCALE));
    }
    constexpr Decimal operator/(Decimal rhs) const noexcept {
        return Decimal(static_cast<int64_t>(
            (static_cast<__int128>(value_) * SCALE) / rhs.value_));
    }

    Decimal& operator+=(Decimal rhs) noexcept {
        value_ += rhs.value_;
        return *this;
    }
    Decimal& operator-=(Decimal rhs) noexcept {
        value_ -= rhs.value_;
        return *this;
    }

    constexpr bool operator==(Decimal rhs) const noexcept { return value_ == rhs.value_; }
    constexpr bool operator!=(Decimal rhs) const noexcept { return value_ != rhs.value_; }
    constexpr bool operator<(Decimal rhs) const noexcept { return value_ < rhs.value_; }
    constexpr bool operator<=(Decimal rhs) const noexcept { return value_ <= rhs.value_; }
    constexpr bool operator>(Decimal rhs) const noexcept { return value_ > rhs.value_; }
    constexpr bool operator>=(Decimal rhs) const noexcept { return value_ >= rhs.value_; }

    constexpr Decimal abs() const noexcept { return Decimal(value_ < 0 ? -value_ : value_); }
    constexpr bool is_zero() const noexcept { return value_ == 0; }
    constexpr bool is_positive() const noexcept { return value_ > 0; }
    constexpr bool is_negative() const noexcept { return value_ < 0; }

    static constexpr Decimal zero() noexcept { return Decimal(0); }
    static constexpr Decimal one() noexcept { return Decimal(SCALE); }

    // One basis point (0.0001)
    static constexpr Decimal bps(int64_t n) noexcept { return Decimal(n * (SCALE / 10000)); }

private:
    int64_t value_;
};

inline constexpr Decimal min(Decimal a, Decimal b) noexcept { return a < b ? a : b; }
inline constexpr Decimal max(Decimal a, Decimal b) noexcept { return a < b ? b : a; }

// Trading side
enum class Side : uint8_t {
    Buy = 0,
    Sell = 1
};

inline constexpr const char* to_string(Side s) noexcept {
    return s == Side::Buy ? "buy" : "sell";
}

inline constexpr Side opposite(Side s) noexcept {
    return s == Side::Buy ? Side::Sell : Side::Buy;
}

// Order types
enum class OrderType : uint8_t {
    Market = 0,
    Limit = 1
};

inline constexpr const char* to_string(OrderType t) noexcept {
    switch (t) {
        case OrderType::Market: return "market";
        case OrderType::Limit: return "limit";
    }
    return "unknown";
}

// Time in force
enum class TimeInForce : uint8_t {
    GTC = 0,  // Good till cancelled
    IOC = 1,  // Immediate or cancel
    FOK = 2   // Fill or kill
};

inline constexpr const char* to_string(TimeInForce tif) noexcept {
    switch (tif) {
        case TimeInForce::GTC: return "GTC";
        case TimeInForce::IOC: return "IOC";
        case TimeInForce::FOK: return "FOK";
    }
    return "unknown";
}

// Order status
enum class OrderStatus : uint8_t {
    Pending = 0,
    Open = 1,
    PartiallyFilled = 2,
    Filled = 3,
    Cancelled = 4,
    Rejected = 5,
    Expired = 6
};

inline constexpr const char* to_string(OrderStatus s) noexcept {
    switch (s) {
        case OrderStatus::Pending: return "pending";
        case OrderStatus::Open: return "open";
        case OrderStatus::PartiallyFilled: return "partially_filled";
        case OrderStatus::Filled: return "filled";
        case OrderStatus::Cancelled: return "cancelled";
        case OrderStatus::Rejected: return "rejected";
        case OrderStatus::Expired: return "expired";
    }
    return "unknown";
}

// Trading pair - inline storage
struct TradingPair {
    std::array<char, 16> base{};
    std::array<char, 16> quote{};

    static std::optional<TradingPair> from_symbol(std::string_view symbol);
    [[nodiscard]] std::string base_asset() const;
    [[nodiscard]] std::string quote_asset() const;
    [[nodiscard]] std::string to_string() const { return base_asset() + "-" + quote_asset(); }
};

// Exchange-reported balance of one asset
struct Balance {
    std::string asset;
    Decimal free;
    Decimal locked;

    [[nodiscard]] Decimal total() const noexcept { return free + locked; }
};

// Order request - builder pattern
class OrderRequest {
public:
    std::string symbol;
    Side side = Side::Buy;
    OrderType order_type = OrderType::Market;
    Decimal quantity;
    std::optional<Decimal> price;
    TimeInForce time_in_force = TimeInForce::IOC;
    bool reduce_only = false;
    std::string client_order_id;

    OrderRequest() = default;

    static OrderRequest market(std::string_view symbol, Side side, Decimal quantity);
    static OrderRequest limit(std::string_view symbol, Side side, Decimal quantity, Decimal price);

    OrderRequest& with_client_id(std::string_view id) {
        client_order_id = std::string(id);
        return *this;
    }

    OrderRequest& with_time_in_force(TimeInForce tif) {
        time_in_force = tif;
        return *this;
    }

    OrderRequest& with_reduce_only() {
        reduce_only = true;
        return *this;
    }
};

// Order as reported by an exchange
struct Order {
    std::string order_id;
    std::string client_order_id;
    std::string symbol;
    std::string exchange;
    Side side = Side::Buy;
    OrderType order_type = OrderType::Market;
    OrderStatus status = OrderStatus::Pending;
    Decimal quantity;
    Decimal filled_quantity;
    Decimal remaining_quantity;
    std::optional<Decimal> price;
    std::optional<Decimal> average_price;
    Decimal fee;
    int64_t created_at = 0;
    int64_t updated_at = 0;

    [[nodiscard]] bool is_open() const noexcept {
        return status == OrderStatus::Open ||
               status == OrderStatus::PartiallyFilled ||
               status == OrderStatus::Pending;
    }

    [[nodiscard]] bool is_done() const noexcept {
        return status == OrderStatus::Filled ||
               status == OrderStatus::Cancelled ||
               status == OrderStatus::Rejected ||
               status == OrderStatus::Expired;
    }

    [[nodiscard]] bool has_fill() const noexcept { return filled_quantity.is_positive(); }

    [[nodiscard]] Decimal fill_percent() const noexcept {
        if (quantity.is_zero()) return Decimal::zero();
        return (filled_quantity / quantity) * Decimal::from_int(100);
    }

    // Best known execution price
    [[nodiscard]] std::optional<Decimal> fill_price() const noexcept {
        if (average_price) return average_price;
        return price;
    }
};

// Timestamp utilities
inline int64_t now_ms() noexcept {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

inline int64_t now_us() noexcept {
    using namespace std::chrono;
    return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
}

// Process-unique identifier: "<prefix>_<ms>_<seq>"
std::string make_id(std::string_view prefix);

}  // namespace xarb
