#include "strategy/LevelAnalyzer.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace liqhunter {
namespace strategy {

const char* toString(SentimentBias bias) {
    switch (bias) {
        case SentimentBias::BULLISH_BIAS: return "BULLISH_BIAS";
        case SentimentBias::BEARISH_BIAS: return "BEARISH_BIAS";
        case SentimentBias::NEUTRAL: return "NEUTRAL";
        case SentimentBias::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* toString(BiasStrength strength) {
    switch (strength) {
        case BiasStrength::LOW: return "LOW";
        case BiasStrength::MODERATE: return "MODERATE";
        case BiasStrength::HIGH: return "HIGH";
        case BiasStrength::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

LevelAnalyzer::LevelAnalyzer(LevelsConfig levels_config, SentimentConfig sentiment_config)
    : levels_config_(levels_config)
    , sentiment_config_(sentiment_config)
{}

SupportResistance LevelAnalyzer::supportResistance(
    Price current_price,
    const std::vector<Cluster>& clusters
) const {
    SupportResistance result;
    if (current_price <= 0.0) {
        return result;
    }

    for (const auto& cluster : clusters) {
        if (!cluster.active ||
            cluster.strength < levels_config_.min_strength ||
            cluster.distance_pct > levels_config_.max_distance_pct) {
            continue;
        }

        PriceLevel level;
        level.price = cluster.price;
        level.strength = cluster.strength;
        level.weight = cluster.total_weight;
        level.distance_pct = cluster.distance_pct;

        if (cluster.side == PositionSide::LONG && cluster.price < current_price) {
            result.support.push_back(level);
        } else if (cluster.side == PositionSide::SHORT && cluster.price > current_price) {
            result.resistance.push_back(level);
        }
    }

    std::sort(result.support.begin(), result.support.end(),
        [](const PriceLevel& a, const PriceLevel& b) { return a.price > b.price; });
    std::sort(result.resistance.begin(), result.resistance.end(),
        [](const PriceLevel& a, const PriceLevel& b) { return a.price < b.price; });

    const size_t limit = static_cast<size_t>(std::max(0, levels_config_.max_levels));
    if (result.support.size() > limit) result.support.resize(limit);
    if (result.resistance.size() > limit) result.resistance.resize(limit);

    return result;
}

SentimentAnalysis LevelAnalyzer::analyzeSentiment(const std::optional<OpenInterestSnapshot>& open_interest) const {
    SentimentAnalysis result;

    if (!open_interest || open_interest->total_oi <= 0.0) {
        result.description = "No OI data available";
        return result;
    }

    result.total_oi = open_interest->total_oi;
    result.long_oi = open_interest->long_oi;
    result.short_oi = open_interest->short_oi;
    result.long_short_ratio = (result.short_oi > 0.0 && result.long_oi > 0.0)
        ? result.long_oi / result.short_oi
        : 1.0;

    const double deviation = sentiment_config_.base_deviation;
    const double bull = 1.0 + deviation;
    const double bear = 1.0 - deviation;
    const double bull_high = 1.0 + deviation * sentiment_config_.high_multiplier;
    const double bear_high = 1.0 - deviation * sentiment_config_.high_multiplier;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (result.long_short_ratio > bull) {
        result.bias = SentimentBias::BULLISH_BIAS;
        result.bias_strength = result.long_short_ratio > bull_high ? BiasStrength::HIGH : BiasStrength::MODERATE;
        oss << "More long positions (" << result.long_short_ratio
            << ":1), long liquidations exposed on a fall";
    } else if (result.long_short_ratio < bear) {
        result.bias = SentimentBias::BEARISH_BIAS;
        result.bias_strength = result.long_short_ratio < bear_high ? BiasStrength::HIGH : BiasStrength::MODERATE;
        oss << "More short positions (" << (1.0 / result.long_short_ratio)
            << ":1), short liquidations exposed on a rise";
    } else {
        result.bias = SentimentBias::NEUTRAL;
        result.bias_strength = BiasStrength::LOW;
        oss << "Balanced long/short ratio (" << result.long_short_ratio << ":1)";
    }
    result.description = oss.str();

    return result;
}

} // namespace strategy
} // namespace liqhunter
