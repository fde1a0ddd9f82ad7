#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace liqhunter {
namespace engine {

// 심볼별 최신 클러스터 세대 하나
struct ClusterGeneration {
    std::uint64_t generation = 0;
    ClusterMode mode = ClusterMode::PREDICTIVE;
    Price reference_price = 0.0;        // price the clusters were built against
    TimestampMs built_at_ms = 0;
    TimestampMs data_as_of_ms = 0;      // timestamp of the newest input snapshot
    std::vector<Cluster> clusters;      // strength-descending
};

// Reactive 모드에서 이미 가격이 통과한 구간
struct ConsumedZone {
    PositionSide side = PositionSide::LONG;
    Price price = 0.0;
    TimestampMs consumed_at_ms = 0;
};

// Latest cluster generation per symbol. A new generation replaces the old one
// wholesale; only the active flag changes inside a generation.
//
// Reactive clusters go inactive once price crosses their centroid and never
// come back. The zone is remembered so a rebuild that finds the same zone
// without any newer event keeps it inactive.
class ClusterStore {
public:
    // zone_width_pct: how close a rebuilt centroid must be to a consumed zone.
    // zone_ttl_ms: consumed zones older than this are forgotten.
    ClusterStore(double zone_width_pct, TimestampMs zone_ttl_ms);

    // Returns the generation number assigned to the clusters.
    std::uint64_t publish(
        const std::string& symbol,
        ClusterMode mode,
        Price reference_price,
        std::vector<Cluster> clusters,
        TimestampMs data_as_of_ms,
        TimestampMs now_ms
    );

    // Feeds a new price. Reactive clusters whose centroid lies between the
    // previous and the new price (inclusive of the new one) become inactive.
    // Returns how many clusters were deactivated.
    int applyPrice(const std::string& symbol, Price price, TimestampMs now_ms);

    std::optional<ClusterGeneration> latest(const std::string& symbol) const;

    // Clusters with distance_pct recomputed against current_price, re-sorted
    // strength desc, distance asc, price asc. Ids are kept from the build.
    std::vector<Cluster> clustersAt(const std::string& symbol, Price current_price) const;

    std::vector<ConsumedZone> consumedZones(const std::string& symbol) const;

    // -1 if nothing has been published for the symbol
    TimestampMs ageMs(const std::string& symbol, TimestampMs now_ms) const;

private:
    struct SymbolState {
        ClusterGeneration current;
        bool has_generation = false;
        std::optional<Price> last_price;
        std::vector<ConsumedZone> consumed;
    };

    bool matchesConsumedZone(const SymbolState& state, const Cluster& cluster) const;
    void pruneZones(SymbolState& state, TimestampMs now_ms) const;

    const double zone_width_pct_;
    const TimestampMs zone_ttl_ms_;
    std::uint64_t next_generation_ = 1;
    std::map<std::string, SymbolState> states_;
    mutable std::mutex mutex_;
};

} // namespace engine
} // namespace liqhunter
