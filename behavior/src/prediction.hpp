#pragma once

#include "types.hpp"
#include <optional>
#include <string>

// Exit-time estimate for one held position, from the wallet's completed-cycle median.
class PredictionEngine {
public:
    // std::nullopt without a pattern or when the lifecycle is not ACTIVE.
    static std::optional<WalletTokenPrediction> predict(const std::optional<WalletHistoricalPattern>& pattern,
                                                        const TokenPositionLifecycle& lifecycle,
                                                        int64_t now,
                                                        const std::string& wallet_address);
};
