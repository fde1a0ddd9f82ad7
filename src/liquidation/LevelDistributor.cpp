#include "liquidation/LevelDistributor.h"
#include "liquidation/LeverageCalculator.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace liqhunter {
namespace liquidation {

std::vector<double> LevelDistributor::tierWeights(const std::vector<double>& tiers, double exponent) {
    std::vector<double> weights;
    weights.reserve(tiers.size());

    double total = 0.0;
    for (double leverage : tiers) {
        // 저레버리지일수록 포지션이 많다고 가정
        double w = 1.0 / std::pow(leverage, exponent);
        weights.push_back(w);
        total += w;
    }

    if (total > 0.0) {
        for (auto& w : weights) {
            w /= total;
        }
    }
    return weights;
}

OpenInterestSplit LevelDistributor::splitByOrderBook(
    Notional total_oi,
    Notional bid_notional,
    Notional ask_notional
) {
    OpenInterestSplit split;
    double depth_total = bid_notional + ask_notional;
    double long_ratio = 0.5;
    if (depth_total > 0.0 && bid_notional >= 0.0 && ask_notional >= 0.0) {
        long_ratio = bid_notional / depth_total;
    }
    split.long_oi = total_oi * long_ratio;
    split.short_oi = total_oi * (1.0 - long_ratio);
    return split;
}

LevelSet LevelDistributor::distributePredictive(
    const PriceSnapshot& price,
    const OpenInterestSnapshot& open_interest,
    const LeverageConfig& config
) {
    LevelSet set;
    set.symbol = price.symbol;
    set.mode = ClusterMode::PREDICTIVE;
    set.reference_price = price.price;

    double long_oi = open_interest.long_oi;
    double short_oi = open_interest.short_oi;
    double total_oi = open_interest.total_oi;

    if (long_oi <= 0.0 && short_oi <= 0.0) {
        long_oi = total_oi * 0.5;
        short_oi = total_oi * 0.5;
    }
    if (total_oi <= 0.0) {
        total_oi = long_oi + short_oi;
    }

    set.total_weight = std::max(0.0, total_oi);
    if (set.total_weight <= 0.0 || price.price <= 0.0) {
        return set;
    }

    const double floor = std::max(config.min_level_oi_usd, total_oi * config.min_level_oi_pct);
    const auto weights = tierWeights(config.tiers, config.distribution_exponent);

    for (size_t i = 0; i < config.tiers.size(); ++i) {
        const double leverage = config.tiers[i];

        for (PositionSide side : {PositionSide::LONG, PositionSide::SHORT}) {
            const double oi_at_tier = (side == PositionSide::LONG ? long_oi : short_oi) * weights[i];
            if (oi_at_tier < floor) {
                continue;
            }

            LiquidationLevel level;
            level.symbol = price.symbol;
            level.price = LeverageCalculator::liquidationPrice(price.price, leverage, side);
            level.side = side;
            level.source = LeverageTierSource{leverage};
            level.weight = oi_at_tier;
            set.levels.push_back(std::move(level));
        }
    }

    return set;
}

double LevelDistributor::decayFactor(double age_sec, double period_sec) {
    if (period_sec <= 0.0) {
        return 1.0;
    }
    return std::exp(-std::max(0.0, age_sec) / period_sec);
}

LevelSet LevelDistributor::distributeReactive(
    const std::string& symbol,
    Price reference_price,
    const std::vector<RawLiquidationEvent>& events,
    TimestampMs now_ms,
    const ReactiveConfig& config
) {
    LevelSet set;
    set.symbol = symbol;
    set.mode = ClusterMode::REACTIVE;
    set.reference_price = reference_price;

    for (size_t i = 0; i < events.size(); ++i) {
        const auto& event = events[i];
        if (event.price <= 0.0 || event.notional <= 0.0) {
            continue;
        }

        // 미래 타임스탬프(시계 오차)는 age 0으로 취급
        const double age_sec = std::max<TimestampMs>(0, now_ms - event.timestamp_ms) / 1000.0;
        if (config.lookback_sec > 0.0 && age_sec > config.lookback_sec) {
            continue;
        }

        LiquidationLevel level;
        level.symbol = symbol;
        level.price = event.price;
        level.side = event.side;
        level.source = LiquidationEventSource{
            event.event_id.empty() ? symbol + "-" + std::to_string(event.timestamp_ms) + "-" + std::to_string(i)
                                   : event.event_id,
            event.timestamp_ms
        };
        level.weight = event.notional * decayFactor(age_sec, config.decay_half_life_sec);

        set.total_weight += event.notional;
        set.levels.push_back(std::move(level));
    }

    return set;
}

} // namespace liquidation
} // namespace liqhunter
