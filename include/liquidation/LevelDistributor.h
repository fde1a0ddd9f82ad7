#pragma once

#include <vector>

#include "common/Types.h"
#include "liquidation/LiquidationConfig.h"

namespace liqhunter {
namespace liquidation {

struct OpenInterestSplit {
    Notional long_oi = 0.0;
    Notional short_oi = 0.0;
};

class LevelDistributor {
public:
    // Normalized tier weights, 1 / L^exponent. Same order as tiers.
    static std::vector<double> tierWeights(const std::vector<double>& tiers, double exponent);

    // Bids are treated as resting long interest, asks as short interest.
    // Empty book => 50/50.
    static OpenInterestSplit splitByOrderBook(Notional total_oi, Notional bid_notional, Notional ask_notional);

    // One level per (tier x side). total_weight of the set is the symbol's total OI.
    static LevelSet distributePredictive(
        const PriceSnapshot& price,
        const OpenInterestSnapshot& open_interest,
        const LeverageConfig& config
    );

    // One level per event inside the lookback; weight = notional * exp(-age / period).
    // total_weight of the set is the undecayed notional inside the lookback.
    static LevelSet distributeReactive(
        const std::string& symbol,
        Price reference_price,
        const std::vector<RawLiquidationEvent>& events,
        TimestampMs now_ms,
        const ReactiveConfig& config
    );

    static double decayFactor(double age_sec, double period_sec);
};

} // namespace liquidation
} // namespace liqhunter
