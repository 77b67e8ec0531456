// xarb - Types Implementation

#include <xarb/types.hpp>
#include <algorithm>
#include <atomic>
#include <charconv>
#include <cmath>
#include <sstream>

namespace xarb {

Decimal Decimal::from_double(double d) noexcept {
    return Decimal(static_cast<int64_t>(std::llround(d * SCALE)));
}

Decimal Decimal::from_string(std::string_view s) {
    bool negative = !s.empty() && s[0] == '-';
    if (negative || (!s.empty() && s[0] == '+')) {
        s.remove_prefix(1);
    }

    auto dot = s.find('.');
    if (dot == std::string_view::npos) {
        int64_t val = 0;
        std::from_chars(s.data(), s.data() + s.size(), val);
        return Decimal(negative ? -val * SCALE : val * SCALE);
    }

    std::string_view int_part = s.substr(0, dot);
    std::string_view frac_part = s.substr(dot + 1);

    int64_t int_val = 0;
    if (!int_part.empty()) {
        std::from_chars(int_part.data(), int_part.data() + int_part.size(), int_val);
    }

    int64_t frac_val = 0;
    if (!frac_part.empty()) {
        // Pad or truncate to PRECISION digits
        std::string frac_str(frac_part);
        if (frac_str.size() < PRECISION) {
            frac_str.append(PRECISION - frac_str.size(), '0');
        } else if (frac_str.size() > PRECISION) {
            frac_str = frac_str.substr(0, PRECISION);
        }
        std::from_chars(frac_str.data(), frac_str.data() + frac_str.size(), frac_val);
    }

    int64_t result = int_val * SCALE + frac_val;
    return Decimal(negative ? -result : result);
}

std::string Decimal::to_string() const {
    int64_t abs_val = value_ < 0 ? -value_ : value_;
    int64_t int_part = abs_val / SCALE;
    int64_t frac_part = abs_val % SCALE;

    std::ostringstream oss;
    if (value_ < 0) oss << '-';
    oss << int_part << '.';

    // Format fractional part with leading zeros
    std::string frac_str = std::to_string(frac_part);
    oss << std::string(PRECISION - frac_str.size(), '0') << frac_str;

    std::string result = oss.str();

    // Trim trailing zeros after decimal point
    size_t last_non_zero = result.find_last_not_of('0');
    if (last_non_zero != std::string::npos && result[last_non_zero] == '.') {
        last_non_zero--;
    }
    result = result.substr(0, last_non_zero + 1);

    return result;
}

std::optional<TradingPair> TradingPair::from_symbol(std::string_view symbol) {
    const char separators[] = {'-', '/', '_'};

    for (char sep : separators) {
        auto pos = symbol.find(sep);
        if (pos != std::string_view::npos) {
            TradingPair pair;
            auto base = symbol.substr(0, pos);
            auto quote = symbol.substr(pos + 1);

            if (base.empty() || quote.empty() || base.size() > 15 || quote.size() > 15) {
                return std::nullopt;
            }

            std::copy(base.begin(), base.end(), pair.base.begin());
            std::copy(quote.begin(), quote.end(), pair.quote.begin());

            return pair;
        }
    }

    return std::nullopt;
}

std::string TradingPair::base_asset() const {
    return std::string(base.data());
}

std::string TradingPair::quote_asset() const {
    return std::string(quote.data());
}

OrderRequest OrderRequest::market(std::string_view symbol, Side side, Decimal quantity) {
    OrderRequest req;
    req.symbol = std::string(symbol);
    req.side = side;
    req.order_type = OrderType::Market;
    req.quantity = quantity;
    req.time_in_force = TimeInForce::IOC;
    return req;
}

OrderRequest OrderRequest::limit(std::string_view symbol, Side side, Decimal quantity, Decimal price) {
    OrderRequest req;
    req.symbol = std::string(symbol);
    req.side = side;
    req.order_type = OrderType::Limit;
    req.quantity = quantity;
    req.price = price;
    req.time_in_force = TimeInForce::GTC;
    return req;
}

std::string make_id(std::string_view prefix) {
    static std::atomic<uint64_t> sequence{0};
    auto seq = sequence.fetch_add(1, std::memory_order_relaxed) + 1;
    return std::string(prefix) + "_" + std::to_string(now_ms()) + "_" + std::to_string(seq);
}

}  // namespace xarb
