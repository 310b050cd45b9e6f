#include "config.hpp"
#include "analysis_config.hpp"
#include "analyzer.hpp"
#include "serialization.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fstream>
#include <iostream>

void setup_logging(const std::string& log_level) {
    // Console sink on stderr so the report can own stdout
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("wallet_behavior", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialized at level: {}", log_level);
}

void write_report(const nlohmann::json& report, const std::string& output_path) {
    if (output_path.empty()) {
        std::cout << report.dump(2) << std::endl;
        return;
    }

    std::ofstream out(output_path);
    if (!out) {
        throw std::runtime_error("Cannot open output file: " + output_path);
    }
    out << report.dump(2) << '\n';
    spdlog::info("Report written to {}", output_path);
}

int main() {
    try {
        Config config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();

        spdlog::info("Starting {} for wallet {}", config.service_name, config.wallet_address);

        BehaviorAnalysisConfig analysis_config;
        if (!config.behavior_config_path.empty()) {
            analysis_config = BehaviorAnalysisConfig::load_file(config.behavior_config_path);
        }
        BehaviorAnalyzer analyzer(analysis_config);

        auto swaps = load_swaps_file(config.swaps_path);
        auto analysis = analyzer.analyze(swaps, config.wallet_address);

        if (analysis.analysis_timestamp > 0) {
            spdlog::info("Analysis timestamp {}", util::utc_iso8601(analysis.analysis_timestamp));
        }

        std::vector<WalletTokenPrediction> predictions;
        for (const auto& mint : config.predict_mints) {
            auto prediction = analyzer.predict_exit(analysis, mint);
            if (!prediction) {
                spdlog::info("No exit prediction for {}", util::short_mint(mint));
                continue;
            }
            spdlog::info("Predicted exit for {} in {:.2f}h ({})",
                         util::short_mint(mint), prediction->estimated_exit_hours,
                         to_string(prediction->risk_level));
            predictions.push_back(*prediction);
        }

        std::optional<BotDetectionResult> bot;
        if (config.detect_bots) {
            bot = analyzer.detect_bot(swaps, &analysis.metrics);
        }

        auto report = build_report(analysis, predictions, bot);
        report["generatedAt"] = util::current_iso8601();
        write_report(report, config.output_path);

        spdlog::info("Done: {}", analysis.metrics.trading_style);
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
