#include "liquidation/ClusterBuilder.h"
#include "common/Config.h"

#include <algorithm>
#include <cmath>

namespace liqhunter {
namespace liquidation {

namespace {

struct Bucket {
    double weighted_price_sum = 0.0;
    double weight_sum = 0.0;
    double plain_price_sum = 0.0;
    int count = 0;
    double long_weight = 0.0;
    double short_weight = 0.0;
    int long_count = 0;
    int short_count = 0;
    double leverage_sum = 0.0;
    int leverage_count = 0;
    TimestampMs newest_ms = 0;

    double centroid() const {
        if (weight_sum > 0.0) {
            return weighted_price_sum / weight_sum;
        }
        return count > 0 ? plain_price_sum / count : 0.0;
    }

    void add(const LiquidationLevel& level) {
        const double w = std::max(0.0, level.weight);
        weighted_price_sum += level.price * w;
        weight_sum += w;
        plain_price_sum += level.price;
        ++count;

        if (level.side == PositionSide::LONG) {
            long_weight += w;
            ++long_count;
        } else {
            short_weight += w;
            ++short_count;
        }

        if (const auto* tier = std::get_if<LeverageTierSource>(&level.source)) {
            leverage_sum += tier->leverage;
            ++leverage_count;
        } else if (const auto* event = std::get_if<LiquidationEventSource>(&level.source)) {
            newest_ms = std::max(newest_ms, event->timestamp_ms);
        }
    }

    PositionSide dominantSide() const {
        if (long_weight != short_weight) {
            return long_weight > short_weight ? PositionSide::LONG : PositionSide::SHORT;
        }
        return long_count > short_count ? PositionSide::LONG : PositionSide::SHORT;
    }
};

bool levelOrder(const LiquidationLevel& a, const LiquidationLevel& b) {
    if (a.price != b.price) return a.price < b.price;
    if (a.side != b.side) return a.side == PositionSide::LONG;
    return a.weight > b.weight;
}

} // namespace

ClusterBuilder::ClusterBuilder(ClusterBuilderConfig config)
    : config_(config)
{
    validate(config_);
}

void ClusterBuilder::validate(const ClusterBuilderConfig& config) {
    if (!(config.bucket_width_pct >= 0.0)) {
        throw common::ConfigError("cluster bucket_width_pct must be >= 0");
    }
    if (!(config.strength_k > 0.0)) {
        throw common::ConfigError("cluster strength_k must be > 0");
    }
    if (config.min_members < 1) {
        throw common::ConfigError("cluster min_members must be >= 1");
    }
    if (!(config.min_weight_fraction >= 0.0) || config.min_weight_fraction > 1.0) {
        throw common::ConfigError("cluster min_weight_fraction must be in [0, 1]");
    }
}

double ClusterBuilder::strengthFromFraction(double fraction, double k) {
    if (!(fraction > 0.0)) {
        return 0.0;
    }
    return std::min(1.0, std::sqrt(std::min(1.0, fraction) * k));
}

std::vector<Cluster> ClusterBuilder::build(
    const LevelSet& level_set,
    TimestampMs now_ms,
    std::uint64_t generation
) const {
    std::vector<Cluster> clusters;
    if (level_set.levels.empty()) {
        return clusters;
    }

    std::vector<LiquidationLevel> sorted;
    sorted.reserve(level_set.levels.size());
    for (const auto& level : level_set.levels) {
        if (std::isfinite(level.price) && level.price > 0.0 && std::isfinite(level.weight)) {
            sorted.push_back(level);
        }
    }
    std::sort(sorted.begin(), sorted.end(), levelOrder);

    // 1. greedy single-pass bucketing
    std::vector<Bucket> buckets;
    const double window = config_.bucket_width_pct / 100.0;
    for (const auto& level : sorted) {
        if (!buckets.empty()) {
            const double centroid = buckets.back().centroid();
            if (centroid > 0.0 && std::abs(level.price - centroid) / centroid <= window) {
                buckets.back().add(level);
                continue;
            }
        }
        buckets.emplace_back();
        buckets.back().add(level);
    }

    // 2. noise rejection + scoring
    const double total = level_set.total_weight;
    const double price = level_set.reference_price;
    for (const auto& bucket : buckets) {
        if (bucket.count < config_.min_members) {
            continue;
        }
        if (config_.min_weight_fraction > 0.0 && bucket.weight_sum < config_.min_weight_fraction * total) {
            continue;
        }

        Cluster cluster;
        cluster.generation = generation;
        cluster.symbol = level_set.symbol;
        cluster.price = bucket.centroid();
        cluster.side = bucket.dominantSide();
        cluster.total_weight = bucket.weight_sum;
        cluster.member_count = bucket.count;
        cluster.strength = total > 0.0 ? strengthFromFraction(bucket.weight_sum / total, config_.strength_k) : 0.0;
        cluster.distance_pct = price > 0.0 ? std::abs(cluster.price - price) / price * 100.0 : 0.0;
        cluster.avg_leverage = bucket.leverage_count > 0 ? bucket.leverage_sum / bucket.leverage_count : 0.0;
        cluster.newest_member_ms = bucket.newest_ms;
        cluster.last_updated_ms = now_ms;
        cluster.active = true;
        clusters.push_back(std::move(cluster));
    }

    // 3. strength desc, distance asc, price asc
    std::sort(clusters.begin(), clusters.end(), [](const Cluster& a, const Cluster& b) {
        if (a.strength != b.strength) return a.strength > b.strength;
        if (a.distance_pct != b.distance_pct) return a.distance_pct < b.distance_pct;
        return a.price < b.price;
    });

    for (size_t i = 0; i < clusters.size(); ++i) {
        clusters[i].cluster_id = static_cast<int>(i);
    }
    return clusters;
}

} // namespace liquidation
} // namespace liqhunter
