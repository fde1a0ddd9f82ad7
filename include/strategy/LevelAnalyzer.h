#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace liqhunter {
namespace strategy {

struct PriceLevel {
    Price price = 0.0;
    double strength = 0.0;
    double weight = 0.0;
    double distance_pct = 0.0;
};

// Support = long-side clusters below price, resistance = short-side clusters above.
// Both nearest first.
struct SupportResistance {
    std::vector<PriceLevel> support;
    std::vector<PriceLevel> resistance;
};

enum class SentimentBias { UNKNOWN, BULLISH_BIAS, BEARISH_BIAS, NEUTRAL };
enum class BiasStrength { UNKNOWN, LOW, MODERATE, HIGH };

const char* toString(SentimentBias bias);
const char* toString(BiasStrength strength);

struct SentimentAnalysis {
    SentimentBias bias = SentimentBias::UNKNOWN;
    BiasStrength bias_strength = BiasStrength::UNKNOWN;
    double long_short_ratio = 1.0;
    Notional total_oi = 0.0;
    Notional long_oi = 0.0;
    Notional short_oi = 0.0;
    std::string description;
};

class LevelAnalyzer {
public:
    LevelAnalyzer(LevelsConfig levels_config, SentimentConfig sentiment_config);

    SupportResistance supportResistance(Price current_price, const std::vector<Cluster>& clusters) const;

    // 롱/숏 OI 비율 기반 시장 심리
    SentimentAnalysis analyzeSentiment(const std::optional<OpenInterestSnapshot>& open_interest) const;

private:
    LevelsConfig levels_config_;
    SentimentConfig sentiment_config_;
};

} // namespace strategy
} // namespace liqhunter
