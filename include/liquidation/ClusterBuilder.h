#pragma once

#include <cstdint>
#include <vector>

#include "common/Types.h"
#include "liquidation/LiquidationConfig.h"

namespace liqhunter {
namespace liquidation {

// Groups weighted liquidation levels into price clusters.
//
// Single pass over price-sorted levels: a level joins the open bucket when it
// lies within bucket_width_pct of the bucket's running weighted centroid,
// otherwise it opens a new bucket. Output is strength-descending (ties: smaller
// distance, then lower price), so the result depends on nothing but the input
// values. The same contract serves predictive and reactive level sets.
class ClusterBuilder {
public:
    explicit ClusterBuilder(ClusterBuilderConfig config);

    std::vector<Cluster> build(
        const LevelSet& level_set,
        TimestampMs now_ms,
        std::uint64_t generation = 0
    ) const;

    // min(1, sqrt(fraction * k)); 0 for a non-positive fraction
    static double strengthFromFraction(double fraction, double k);

    // Throws common::ConfigError
    static void validate(const ClusterBuilderConfig& config);

    const ClusterBuilderConfig& config() const { return config_; }

private:
    ClusterBuilderConfig config_;
};

} // namespace liquidation
} // namespace liqhunter
