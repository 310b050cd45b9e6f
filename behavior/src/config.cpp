#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

bool Config::get_env_bool(const char* name, bool default_val) {
    std::string val = get_env(name);
    if (val.empty()) return default_val;
    if (val == "true" || val == "1" || val == "yes") return true;
    if (val == "false" || val == "0" || val == "no") return false;
    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}

Config Config::from_env() {
    Config cfg;

    cfg.swaps_path = get_env("SWAPS_PATH");
    cfg.wallet_address = get_env("WALLET_ADDRESS", "unknown");
    cfg.behavior_config_path = get_env("BEHAVIOR_CONFIG_PATH");
    cfg.output_path = get_env("OUTPUT_PATH");

    cfg.predict_mints = util::split_csv(get_env("PREDICT_MINTS"));
    cfg.detect_bots = get_env_bool("DETECT_BOTS", true);

    cfg.service_name = get_env("SERVICE_NAME", "wallet_behavior");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (swaps_path.empty()) {
        throw std::runtime_error("SWAPS_PATH is required");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Wallet: {}", wallet_address);
    spdlog::info("  Swaps: {}", swaps_path);
    spdlog::info("  Predictions: {} mints, bot detection {}",
                 predict_mints.size(), detect_bots ? "on" : "off");
}
