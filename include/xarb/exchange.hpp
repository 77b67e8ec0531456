// xarb - Exchange Ports
// Abstract trading and price interfaces implemented per exchange

#pragma once

#include <xarb/errors.hpp>
#include <xarb/types.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace xarb {

// Trading connection to one exchange
//
// Futures returned by the port may fail with OrderRejected, OrderTimeout or
// ExchangeError. Implementations must be safe to call from several threads.
class ExchangePort {
public:
    virtual ~ExchangePort() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual bool is_connected() const = 0;

    virtual std::future<Order> place_order(const OrderRequest& request) = 0;
    virtual std::future<Order> get_order_status(const std::string& order_id,
                                                const std::string& symbol) = 0;
    virtual std::future<bool> cancel_order(const std::string& order_id,
                                           const std::string& symbol) = 0;
    virtual std::future<std::vector<Balance>> get_account_balance() = 0;
};

// Current market prices; never cached by callers
class PriceSource {
public:
    virtual ~PriceSource() = default;

    virtual std::future<Decimal> current_price(const std::string& symbol,
                                               const std::string& exchange) = 0;
};

// Named set of exchange ports. Populated before the engine starts, read-only after.
class ExchangeRegistry {
public:
    void add(std::shared_ptr<ExchangePort> port) {
        auto name = std::string(port->name());
        ports_[name] = std::move(port);
    }

    [[nodiscard]] ExchangePort* find(std::string_view name) const {
        auto it = ports_.find(std::string(name));
        return it != ports_.end() ? it->second.get() : nullptr;
    }

    // Throws ExchangeUnavailable if unknown or disconnected
    [[nodiscard]] ExchangePort& get(std::string_view name) const {
        auto* port = find(name);
        if (!port || !port->is_connected()) {
            throw ExchangeUnavailable(std::string(name));
        }
        return *port;
    }

    [[nodiscard]] bool is_available(std::string_view name) const noexcept {
        auto* port = find(name);
        return port != nullptr && port->is_connected();
    }

    [[nodiscard]] std::vector<std::string> names() const {
        std::vector<std::string> result;
        result.reserve(ports_.size());
        for (const auto& [name, port] : ports_) {
            result.push_back(name);
        }
        return result;
    }

    [[nodiscard]] size_t size() const noexcept { return ports_.size(); }

private:
    std::unordered_map<std::string, std::shared_ptr<ExchangePort>> ports_;
};

// Wait for a port future until the deadline; throws OrderTimeout when it passes
template <typename T>
T await_until(std::future<T>& future,
              std::chrono::steady_clock::time_point deadline,
              const std::string& what) {
    // Deferred futures run on get()
    if (future.wait_until(deadline) == std::future_status::timeout) {
        throw OrderTimeout("Timed out waiting for " + what);
    }
    return future.get();
}

template <typename T>
T await_for(std::future<T>& future, std::chrono::milliseconds timeout, const std::string& what) {
    return await_until(future, std::chrono::steady_clock::now() + timeout, what);
}

}  // namespace xarb
