// xarb - Configuration Implementation

#include <xarb/config.hpp>
#include <xarb/errors.hpp>
#include <xarb/logging.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace xarb {

using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int64_t to_int(const std::string& key, const std::string& value) {
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for " + key + ": " + value);
    }
}

Decimal read_decimal(const json& j) {
    if (j.is_string()) return Decimal::from_string(j.get<std::string>());
    if (j.is_number_integer()) return Decimal::from_int(j.get<int64_t>());
    return Decimal::from_double(j.get<double>());
}

template <typename T>
void read(const json& section, const char* key, T& out) {
    auto it = section.find(key);
    if (it != section.end()) out = it->template get<T>();
}

void read(const json& section, const char* key, Decimal& out) {
    auto it = section.find(key);
    if (it != section.end()) out = read_decimal(*it);
}

}  // namespace

Settings Settings::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (ends_with(path, ".json")) {
        return from_json(buffer.str());
    }
    return from_toml(buffer.str());
}

Settings Settings::from_toml(std::string_view content) {
    Settings settings;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                current_section = trim(line.substr(1, end - 1));
            }
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));

        if (current_section == "general") {
            auto& g = settings.general;
            if (key == "engine_name") g.engine_name = value;
            else if (key == "log_level") g.log_level = value;
            else if (key == "leg_timeout_ms") g.leg_timeout_ms = to_int(key, value);
            else if (key == "max_concurrent_operations") g.max_concurrent_operations = static_cast<int>(to_int(key, value));
            else if (key == "min_profit_margin_bps") g.min_profit_margin_bps = static_cast<int>(to_int(key, value));
            else if (key == "enforce_execution_window") g.enforce_execution_window = (value == "true");
            else if (key == "quantity_precision") g.quantity_precision = static_cast<int>(to_int(key, value));
        }
        else if (current_section == "risk") {
            auto& r = settings.risk;
            if (key == "max_single_loss") r.max_single_loss = Decimal::from_string(value);
            else if (key == "max_recovery_attempts") r.max_recovery_attempts = static_cast<int>(to_int(key, value));
            else if (key == "recovery_timeout_ms") r.recovery_timeout_ms = to_int(key, value);
            else if (key == "max_slippage_bps") r.max_slippage_bps = static_cast<int>(to_int(key, value));
            else if (key == "recovery_slippage_bps") r.recovery_slippage_bps = static_cast<int>(to_int(key, value));
            else if (key == "balance_safety_margin") r.balance_safety_margin = Decimal::from_string(value);
        }
        else if (current_section == "timing") {
            auto& t = settings.timing;
            if (key == "reservation_ttl_ms") t.reservation_ttl_ms = to_int(key, value);
            else if (key == "balance_staleness_ms") t.balance_staleness_ms = to_int(key, value);
            else if (key == "reservation_sweep_interval_ms") t.reservation_sweep_interval_ms = to_int(key, value);
            else if (key == "position_sweep_interval_ms") t.position_sweep_interval_ms = to_int(key, value);
            else if (key == "stale_position_age_ms") t.stale_position_age_ms = to_int(key, value);
            else if (key == "operation_cleanup_interval_ms") t.operation_cleanup_interval_ms = to_int(key, value);
            else if (key == "operation_retention_ms") t.operation_retention_ms = to_int(key, value);
            else if (key == "retry_backoff_unit_ms") t.retry_backoff_unit_ms = to_int(key, value);
            else if (key == "retry_backoff_cap") t.retry_backoff_cap = static_cast<int>(to_int(key, value));
            else if (key == "status_poll_interval_ms") t.status_poll_interval_ms = to_int(key, value);
        }
        else if (current_section == "alerts") {
            auto& a = settings.alerts;
            if (key == "queue_capacity") a.queue_capacity = static_cast<std::size_t>(to_int(key, value));
            else if (key == "log_alerts") a.log_alerts = (value == "true");
        }
        else {
            Logger::warn("Ignoring config key {} in unknown section [{}]", key, current_section);
        }
    }

    settings.validate();
    return settings;
}

Settings Settings::from_json(std::string_view content) {
    json root;
    try {
        root = json::parse(content);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Invalid JSON config: ") + e.what());
    }

    Settings settings;
    try {
        if (auto it = root.find("general"); it != root.end()) {
            auto& g = settings.general;
            read(*it, "engine_name", g.engine_name);
            read(*it, "log_level", g.log_level);
            read(*it, "leg_timeout_ms", g.leg_timeout_ms);
            read(*it, "max_concurrent_operations", g.max_concurrent_operations);
            read(*it, "min_profit_margin_bps", g.min_profit_margin_bps);
            read(*it, "enforce_execution_window", g.enforce_execution_window);
            read(*it, "quantity_precision", g.quantity_precision);
        }
        if (auto it = root.find("risk"); it != root.end()) {
            auto& r = settings.risk;
            read(*it, "max_single_loss", r.max_single_loss);
            read(*it, "max_recovery_attempts", r.max_recovery_attempts);
            read(*it, "recovery_timeout_ms", r.recovery_timeout_ms);
            read(*it, "max_slippage_bps", r.max_slippage_bps);
            read(*it, "recovery_slippage_bps", r.recovery_slippage_bps);
            read(*it, "balance_safety_margin", r.balance_safety_margin);
        }
        if (auto it = root.find("timing"); it != root.end()) {
            auto& t = settings.timing;
            read(*it, "reservation_ttl_ms", t.reservation_ttl_ms);
            read(*it, "balance_staleness_ms", t.balance_staleness_ms);
            read(*it, "reservation_sweep_interval_ms", t.reservation_sweep_interval_ms);
            read(*it, "position_sweep_interval_ms", t.position_sweep_interval_ms);
            read(*it, "stale_position_age_ms", t.stale_position_age_ms);
            read(*it, "operation_cleanup_interval_ms", t.operation_cleanup_interval_ms);
            read(*it, "operation_retention_ms", t.operation_retention_ms);
            read(*it, "retry_backoff_unit_ms", t.retry_backoff_unit_ms);
            read(*it, "retry_backoff_cap", t.retry_backoff_cap);
            read(*it, "status_poll_interval_ms", t.status_poll_interval_ms);
        }
        if (auto it = root.find("alerts"); it != root.end()) {
            read(*it, "queue_capacity", settings.alerts.queue_capacity);
            read(*it, "log_alerts", settings.alerts.log_alerts);
        }
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("Invalid config value: ") + e.what());
    }

    settings.validate();
    return settings;
}

void Settings::validate() const {
    parse_log_level(general.log_level);

    if (general.leg_timeout_ms <= 0) {
        throw ConfigError("leg_timeout_ms must be positive");
    }
    if (general.max_concurrent_operations <= 0) {
        throw ConfigError("max_concurrent_operations must be positive");
    }
    if (general.quantity_precision < 0 || general.quantity_precision > Decimal::PRECISION) {
        throw ConfigError("quantity_precision must be within [0, " +
                          std::to_string(Decimal::PRECISION) + "]");
    }
    if (risk.max_single_loss.is_negative()) {
        throw ConfigError("max_single_loss must not be negative");
    }
    if (risk.max_recovery_attempts < 0) {
        throw ConfigError("max_recovery_attempts must not be negative");
    }
    if (risk.recovery_timeout_ms <= 0) {
        throw ConfigError("recovery_timeout_ms must be positive");
    }
    if (risk.balance_safety_margin.is_negative()) {
        throw ConfigError("balance_safety_margin must not be negative");
    }
    if (timing.reservation_ttl_ms <= 0 || timing.stale_position_age_ms <= 0) {
        throw ConfigError("reservation_ttl_ms and stale_position_age_ms must be positive");
    }
    if (timing.retry_backoff_unit_ms < 0 || timing.retry_backoff_cap < 0) {
        throw ConfigError("retry backoff must not be negative");
    }
    if (timing.status_poll_interval_ms <= 0) {
        throw ConfigError("status_poll_interval_ms must be positive");
    }
    if (alerts.queue_capacity == 0) {
        throw ConfigError("alert queue_capacity must be positive");
    }
}

}  // namespace xarb
