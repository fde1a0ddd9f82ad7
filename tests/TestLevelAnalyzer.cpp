#include "strategy/LevelAnalyzer.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace liqhunter;
using namespace liqhunter::strategy;

namespace {

Cluster makeCluster(Price price, PositionSide side, double strength, Price current) {
    Cluster c;
    c.symbol = "BTCUSDT";
    c.price = price;
    c.side = side;
    c.strength = strength;
    c.total_weight = strength * 1e6;
    c.member_count = 1;
    c.distance_pct = std::abs(price - current) / current * 100.0;
    return c;
}

OpenInterestSnapshot makeOi(double long_oi, double short_oi) {
    OpenInterestSnapshot oi;
    oi.symbol = "BTCUSDT";
    oi.long_oi = long_oi;
    oi.short_oi = short_oi;
    oi.total_oi = long_oi + short_oi;
    return oi;
}

} // namespace

int main() {
    LevelAnalyzer analyzer(LevelsConfig{}, SentimentConfig{});

    // 1. 지지/저항
    {
        const Price current = 100.0;
        std::vector<Cluster> clusters = {
            makeCluster(95.0, PositionSide::LONG, 0.8, current),
            makeCluster(98.0, PositionSide::LONG, 0.5, current),
            makeCluster(99.0, PositionSide::LONG, 0.2, current),     // min_strength 미달
            makeCluster(80.0, PositionSide::LONG, 0.9, current),     // 10% 초과
            makeCluster(104.0, PositionSide::SHORT, 0.7, current),
            makeCluster(102.0, PositionSide::SHORT, 0.4, current),
            makeCluster(97.0, PositionSide::SHORT, 0.9, current),    // 가격 아래 숏 => 제외
        };
        Cluster consumed = makeCluster(101.0, PositionSide::SHORT, 0.9, current);
        consumed.active = false;
        clusters.push_back(consumed);

        auto levels = analyzer.supportResistance(current, clusters);
        assert(levels.support.size() == 2);
        assert(levels.support[0].price == 98.0);
        assert(levels.support[1].price == 95.0);
        assert(levels.resistance.size() == 2);
        assert(levels.resistance[0].price == 102.0);
        assert(levels.resistance[1].price == 104.0);
        assert(levels.resistance[1].weight == 0.7 * 1e6);

        LevelsConfig narrow;
        narrow.max_levels = 1;
        LevelAnalyzer top_only(narrow, SentimentConfig{});
        auto top = top_only.supportResistance(current, clusters);
        assert(top.support.size() == 1 && top.support[0].price == 98.0);
        assert(top.resistance.size() == 1 && top.resistance[0].price == 102.0);

        assert(analyzer.supportResistance(0.0, clusters).support.empty());
        assert(analyzer.supportResistance(current, {}).resistance.empty());
    }

    // 2. 심리
    {
        auto none = analyzer.analyzeSentiment(std::nullopt);
        assert(none.bias == SentimentBias::UNKNOWN);
        assert(none.bias_strength == BiasStrength::UNKNOWN);
        assert(none.description == "No OI data available");

        auto high_bull = analyzer.analyzeSentiment(makeOi(6e6, 4e6));
        assert(high_bull.bias == SentimentBias::BULLISH_BIAS);
        assert(high_bull.bias_strength == BiasStrength::HIGH);
        assert(std::abs(high_bull.long_short_ratio - 1.5) < 1e-9);
        assert(high_bull.total_oi == 10e6);

        auto moderate = analyzer.analyzeSentiment(makeOi(5.5e6, 4.5e6));
        assert(moderate.bias == SentimentBias::BULLISH_BIAS);
        assert(moderate.bias_strength == BiasStrength::MODERATE);

        auto bear = analyzer.analyzeSentiment(makeOi(4e6, 6e6));
        assert(bear.bias == SentimentBias::BEARISH_BIAS);
        assert(bear.bias_strength == BiasStrength::HIGH);
        assert(bear.description.find("1.50:1") != std::string::npos);

        auto flat = analyzer.analyzeSentiment(makeOi(5e6, 5e6));
        assert(flat.bias == SentimentBias::NEUTRAL);
        assert(flat.bias_strength == BiasStrength::LOW);

        // 분할 없음 => 1:1
        OpenInterestSnapshot total_only;
        total_only.total_oi = 1e6;
        auto unsplit = analyzer.analyzeSentiment(total_only);
        assert(unsplit.bias == SentimentBias::NEUTRAL);
        assert(unsplit.long_short_ratio == 1.0);

        assert(std::string(toString(SentimentBias::BULLISH_BIAS)) == "BULLISH_BIAS");
        assert(std::string(toString(BiasStrength::MODERATE)) == "MODERATE");
    }

    std::cout << "[TEST] LevelAnalyzer PASSED\n";
    return 0;
}
