#pragma once

#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // Input / output
    std::string swaps_path;
    std::string wallet_address;
    std::string behavior_config_path;   // optional JSON with analysis options
    std::string output_path;            // stdout when empty

    // Optional stages
    std::vector<std::string> predict_mints;
    bool detect_bots;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static bool get_env_bool(const char* name, bool default_val);
};
