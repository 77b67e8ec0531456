// xarb - Configuration
// Immutable settings handed to every component at construction

#pragma once

#include <xarb/types.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace xarb {

// Engine-wide settings
struct GeneralConfig {
    std::string engine_name = "xarb";
    std::string log_level = "info";
    int64_t leg_timeout_ms = 30000;          // default max execution time per leg
    int max_concurrent_operations = 10;
    int min_profit_margin_bps = 10;
    bool enforce_execution_window = true;
    int quantity_precision = 8;
};

// Risk limits for execution and recovery
struct RiskConfig {
    Decimal max_single_loss = Decimal::from_int(100);  // per-incident loss cap, quote units
    int max_recovery_attempts = 3;
    int64_t recovery_timeout_ms = 60000;
    int max_slippage_bps = 20;
    int recovery_slippage_bps = 10;                    // assumed cost of a compensating trade
    Decimal balance_safety_margin = Decimal::from_double(0.01);
};

// Lifetimes, sweep intervals and backoff
struct TimingConfig {
    int64_t reservation_ttl_ms = 300000;
    int64_t balance_staleness_ms = 5000;
    int64_t reservation_sweep_interval_ms = 30000;
    int64_t position_sweep_interval_ms = 1000;
    int64_t stale_position_age_ms = 300000;
    int64_t operation_cleanup_interval_ms = 3600000;
    int64_t operation_retention_ms = 86400000;
    int64_t retry_backoff_unit_ms = 1000;   // WAIT_AND_RETRY sleeps min(2^attempt, cap) units
    int retry_backoff_cap = 60;
    int64_t status_poll_interval_ms = 50;
};

// Alert delivery
struct AlertConfig {
    std::size_t queue_capacity = 1024;
    bool log_alerts = true;
};

class Settings {
public:
    GeneralConfig general;
    RiskConfig risk;
    TimingConfig timing;
    AlertConfig alerts;

    Settings() = default;

    // Load from file; ".json" files are parsed as JSON, anything else as TOML
    static Settings from_file(std::string_view path);

    // Load from TOML string
    static Settings from_toml(std::string_view content);

    // Load from JSON string
    static Settings from_json(std::string_view content);

    // Throws ConfigError on inconsistent values
    void validate() const;

    // Builder methods
    Settings& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Settings& set_leg_timeout(int64_t ms) {
        general.leg_timeout_ms = ms;
        return *this;
    }

    Settings& set_max_concurrent_operations(int n) {
        general.max_concurrent_operations = n;
        return *this;
    }

    Settings& set_min_profit_margin(int bps) {
        general.min_profit_margin_bps = bps;
        return *this;
    }

    Settings& set_max_single_loss(Decimal loss) {
        risk.max_single_loss = loss;
        return *this;
    }

    Settings& set_max_recovery_attempts(int n) {
        risk.max_recovery_attempts = n;
        return *this;
    }

    Settings& set_recovery_timeout(int64_t ms) {
        risk.recovery_timeout_ms = ms;
        return *this;
    }

    Settings& set_retry_backoff(int64_t unit_ms, int cap) {
        timing.retry_backoff_unit_ms = unit_ms;
        timing.retry_backoff_cap = cap;
        return *this;
    }

    Settings& set_reservation_ttl(int64_t ms) {
        timing.reservation_ttl_ms = ms;
        return *this;
    }

    Settings& set_stale_position_age(int64_t ms) {
        timing.stale_position_age_ms = ms;
        return *this;
    }
};

}  // namespace xarb
