#pragma once

#include <vector>

namespace liqhunter {
namespace liquidation {

struct LeverageConfig {
    // 레버리지 티어 테이블 (모두 > 1 이어야 함)
    std::vector<double> tiers = {100.0, 50.0, 25.0, 10.0, 5.0};

    // tier weight = 1 / leverage^exponent, normalized. Larger exponent pushes
    // more OI toward low leverage.
    double distribution_exponent = 0.5;

    // Dynamic per-level floor: max(min_level_oi_usd, min_level_oi_pct * total OI)
    double min_level_oi_usd = 25000.0;
    double min_level_oi_pct = 0.02;
};

struct ClusterBuilderConfig {
    double bucket_width_pct = 0.5;      // relative merge window around the running centroid (%)
    double strength_k = 3.0;            // strength = min(1, sqrt(fraction * k))
    int min_members = 1;
    double min_weight_fraction = 0.0;   // of the level set's total weight
};

struct ReactiveConfig {
    int buffer_capacity = 10000;        // per symbol
    double decay_half_life_sec = 3600.0;
    double lookback_sec = 24.0 * 3600.0;
};

} // namespace liquidation
} // namespace liqhunter
