#include "config/market_config.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#ifndef MARKET_SCHEMA_PATH
#define MARKET_SCHEMA_PATH "backend/src/store/schema/build_tables.sql"
#endif

namespace {
std::optional<std::string> env(const char* key) {
    const char* v = std::getenv(key);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

int parse_int(const std::string& key, const std::string& value) {
    int out = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        throw std::runtime_error("config: " + key + " must be an integer, got '" + value + "'");
    }
    return out;
}

void env_int(const char* key, int& field) {
    if (auto v = env(key)) field = parse_int(key, *v);
}

void env_sats(const char* key, Sats& field) {
    auto v = env(key);
    if (!v) return;
    Sats out = 0;
    const auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), out);
    if (ec != std::errc{} || ptr != v->data() + v->size()) {
        throw std::runtime_error(std::string("config: ") + key + " must be an integer, got '" + *v + "'");
    }
    field = out;
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return {};
    return s.substr(b, s.find_last_not_of(" \t\r") - b + 1);
}

void env_str(const char* key, std::string& field) {
    if (auto v = env(key)) field = *v;
}

// MARKETPLACE_DB_HOST + MARKETPLACE_DB_PASSWORD [+ MARKETPLACE_DB_PORT] when no URL is given.
std::string database_url_from_parts() {
    auto host = env("MARKETPLACE_DB_HOST");
    auto password = env("MARKETPLACE_DB_PASSWORD");
    if (!host || !password) return {};
    const std::string port = env("MARKETPLACE_DB_PORT").value_or("5432");
    const std::string user = env("MARKETPLACE_DB_USER").value_or("postgres");
    const std::string name = env("MARKETPLACE_DB_NAME").value_or("postgres");
    return "postgresql://" + user + ":" + *password + "@" + *host + ":" + port + "/" + name;
}
}

void MarketConfig::validate() const {
    if (fee_percent < 0 || fee_percent > 100)
        throw std::runtime_error("config: fee_percent must be within 0..100");
    if (escrow_hold_days <= 0)
        throw std::runtime_error("config: escrow_hold_days must be positive");
    if (dispute_window_days <= 0)
        throw std::runtime_error("config: dispute_window_days must be positive");
    if (price_lock_hours <= 0)
        throw std::runtime_error("config: price_lock_hours must be positive");
    if (warning_window_days < 0 || warning_window_days > dispute_window_days)
        throw std::runtime_error("config: warning_window_days must be within 0..dispute_window_days");
    if (auto_release_interval.count() <= 0)
        throw std::runtime_error("config: auto_release_interval_secs must be positive");
    if (pool_size <= 0)
        throw std::runtime_error("config: pool_size must be positive");
    if (seller_bonds.digital <= 0 || seller_bonds.physical <= 0 || seller_bonds.services <= 0 ||
        seller_bonds.all <= 0)
        throw std::runtime_error("config: seller_bonds amounts must be positive");
    if (payment_mode != "mock")
        throw std::runtime_error("config: unsupported payment_mode '" + payment_mode + "'");
}

void load_env_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        file.open("backend/" + filepath);
        if (!file.is_open()) return;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        const std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        // Real environment wins over the file.
        if (!key.empty()) setenv(key.c_str(), value.c_str(), 0);
    }
}

void apply_json(MarketConfig& cfg, const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("config: top-level JSON value must be an object");
    }
    try {
        cfg.fee_percent = j.value("fee_percent", cfg.fee_percent);
        cfg.escrow_hold_days = j.value("escrow_hold_days", cfg.escrow_hold_days);
        cfg.dispute_window_days = j.value("dispute_window_days", cfg.dispute_window_days);
        cfg.price_lock_hours = j.value("price_lock_hours", cfg.price_lock_hours);
        cfg.warning_window_days = j.value("warning_window_days", cfg.warning_window_days);
        cfg.auto_release_interval = std::chrono::seconds(
            j.value("auto_release_interval_secs", static_cast<long long>(cfg.auto_release_interval.count())));
        cfg.fee_collector_id = j.value("fee_collector_id", cfg.fee_collector_id);
        cfg.database_url = j.value("database_url", cfg.database_url);
        cfg.pool_size = j.value("pool_size", cfg.pool_size);
        cfg.payment_mode = j.value("payment_mode", cfg.payment_mode);
        cfg.schema_path = j.value("schema_path", cfg.schema_path);
        if (j.contains("seller_bonds")) {
            const auto& b = j.at("seller_bonds");
            if (!b.is_object()) {
                throw std::runtime_error("config: seller_bonds must be an object");
            }
            cfg.seller_bonds.digital = b.value("digital", cfg.seller_bonds.digital);
            cfg.seller_bonds.physical = b.value("physical", cfg.seller_bonds.physical);
            cfg.seller_bonds.services = b.value("services", cfg.seller_bonds.services);
            cfg.seller_bonds.all = b.value("all", cfg.seller_bonds.all);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("config: ") + e.what());
    }
}

void apply_env_overrides(MarketConfig& cfg) {
    env_int("MARKETPLACE_FEE_PERCENT", cfg.fee_percent);
    env_int("MARKETPLACE_ESCROW_HOLD_DAYS", cfg.escrow_hold_days);
    env_int("MARKETPLACE_DISPUTE_WINDOW_DAYS", cfg.dispute_window_days);
    env_int("MARKETPLACE_PRICE_LOCK_HOURS", cfg.price_lock_hours);
    env_int("MARKETPLACE_WARNING_WINDOW_DAYS", cfg.warning_window_days);
    if (auto v = env("MARKETPLACE_AUTO_RELEASE_INTERVAL_SECS")) {
        cfg.auto_release_interval = std::chrono::seconds(parse_int("MARKETPLACE_AUTO_RELEASE_INTERVAL_SECS", *v));
    }
    env_str("MARKETPLACE_FEE_COLLECTOR", cfg.fee_collector_id);
    env_int("MARKETPLACE_POOL_SIZE", cfg.pool_size);
    env_str("MARKETPLACE_PAYMENT_MODE", cfg.payment_mode);
    env_str("MARKETPLACE_SCHEMA_PATH", cfg.schema_path);
    env_sats("MARKETPLACE_BOND_DIGITAL", cfg.seller_bonds.digital);
    env_sats("MARKETPLACE_BOND_PHYSICAL", cfg.seller_bonds.physical);
    env_sats("MARKETPLACE_BOND_SERVICES", cfg.seller_bonds.services);
    env_sats("MARKETPLACE_BOND_ALL", cfg.seller_bonds.all);
    if (auto url = env("MARKETPLACE_DATABASE_URL")) {
        cfg.database_url = *url;
    } else if (cfg.database_url.empty()) {
        cfg.database_url = database_url_from_parts();
    }
}

MarketConfig load_market_config(const std::optional<std::string>& json_path) {
    MarketConfig cfg;
    cfg.schema_path = MARKET_SCHEMA_PATH;

    const auto path = json_path ? json_path : env("MARKETPLACE_CONFIG");
    if (path) {
        std::ifstream in(*path);
        if (!in.is_open()) {
            throw std::runtime_error("config: cannot open " + *path);
        }
        nlohmann::json j;
        try {
            in >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("config: " + *path + ": " + e.what());
        }
        apply_json(cfg, j);
        std::cout << "[config] loaded " << *path << std::endl;
    }

    apply_env_overrides(cfg);
    cfg.validate();
    return cfg;
}
