#pragma once
#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "market/types.hpp"

struct MarketConfig {
    int fee_percent{1};
    int escrow_hold_days{10};
    int dispute_window_days{10};
    int price_lock_hours{3};
    int warning_window_days{7};
    std::chrono::seconds auto_release_interval{60};
    std::string fee_collector_id;  // empty: fees are not credited to anyone
    std::string database_url;      // empty: in-memory store
    int pool_size{4};
    std::string payment_mode{"mock"};
    std::string schema_path;
    SellerBondSchedule seller_bonds;

    // Throws std::runtime_error naming the first bad field.
    void validate() const;
};

// Sets KEY=VALUE pairs from the file as environment variables, without
// overwriting ones already set. A missing file is not an error.
void load_env_file(const std::string& filepath = ".env");

// Overlays keys present in `j` onto `cfg`. Throws std::runtime_error on a type mismatch.
void apply_json(MarketConfig& cfg, const nlohmann::json& j);

// Overlays MARKETPLACE_* environment variables onto `cfg`.
void apply_env_overrides(MarketConfig& cfg);

// Defaults, then the JSON file (json_path, else $MARKETPLACE_CONFIG, if any), then
// the environment. The result is validated.
MarketConfig load_market_config(const std::optional<std::string>& json_path = std::nullopt);
