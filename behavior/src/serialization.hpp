#pragma once

#include "analyzer.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Input rows. Throws std::invalid_argument on a malformed row.
void from_json(const nlohmann::json& j, SwapRecord& r);
TradeDirection parse_direction(const std::string& s);
std::vector<SwapRecord> parse_swaps(const nlohmann::json& j);
std::vector<SwapRecord> load_swaps_file(const std::string& path);

void to_json(nlohmann::json& j, const SwapRecord& r);
void to_json(nlohmann::json& j, const TokenPositionLifecycle& lc);
void to_json(nlohmann::json& j, const TradingTimeDistribution& d);
void to_json(nlohmann::json& j, const TradingFrequency& f);
void to_json(nlohmann::json& j, const TokenActivity& a);
void to_json(nlohmann::json& j, const TokenPreferences& p);
void to_json(nlohmann::json& j, const RiskMetrics& r);
void to_json(nlohmann::json& j, const IdentifiedTradingWindow& w);
void to_json(nlohmann::json& j, const ActiveTradingPeriods& p);
void to_json(nlohmann::json& j, const WalletHistoricalPattern& p);
void to_json(nlohmann::json& j, const TradingInterpretation& t);
void to_json(nlohmann::json& j, const BehavioralMetrics& m);
void to_json(nlohmann::json& j, const WalletTokenPrediction& p);
void to_json(nlohmann::json& j, const BotDetectionMetrics& m);
void to_json(nlohmann::json& j, const BotDetectionResult& r);
void to_json(nlohmann::json& j, const AnalysisEvent& e);

// JSON has no infinity; the one-sided ratio sentinel is written as "Infinity".
nlohmann::json ratio_to_json(double ratio);

nlohmann::json build_report(const AnalysisResult& analysis,
                            const std::vector<WalletTokenPrediction>& predictions,
                            const std::optional<BotDetectionResult>& bot);
