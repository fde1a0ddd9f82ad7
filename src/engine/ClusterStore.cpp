#include "engine/ClusterStore.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace liqhunter {
namespace engine {

ClusterStore::ClusterStore(double zone_width_pct, TimestampMs zone_ttl_ms)
    : zone_width_pct_(zone_width_pct)
    , zone_ttl_ms_(zone_ttl_ms)
{}

bool ClusterStore::matchesConsumedZone(const SymbolState& state, const Cluster& cluster) const {
    for (const auto& zone : state.consumed) {
        if (zone.side != cluster.side || zone.price <= 0.0) {
            continue;
        }
        const double gap_pct = std::abs(cluster.price - zone.price) / zone.price * 100.0;
        // 소진 이후 새 이벤트가 없으면 같은 구간으로 간주
        if (gap_pct <= zone_width_pct_ && cluster.newest_member_ms <= zone.consumed_at_ms) {
            return true;
        }
    }
    return false;
}

void ClusterStore::pruneZones(SymbolState& state, TimestampMs now_ms) const {
    if (zone_ttl_ms_ <= 0) {
        return;
    }
    state.consumed.erase(
        std::remove_if(state.consumed.begin(), state.consumed.end(),
            [&](const ConsumedZone& z) { return now_ms - z.consumed_at_ms > zone_ttl_ms_; }),
        state.consumed.end()
    );
}

std::uint64_t ClusterStore::publish(
    const std::string& symbol,
    ClusterMode mode,
    Price reference_price,
    std::vector<Cluster> clusters,
    TimestampMs data_as_of_ms,
    TimestampMs now_ms
) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = states_[symbol];
    pruneZones(state, now_ms);

    const std::uint64_t generation = next_generation_++;
    int carried_inactive = 0;
    for (auto& cluster : clusters) {
        cluster.generation = generation;
        cluster.active = true;
        if (mode == ClusterMode::REACTIVE && matchesConsumedZone(state, cluster)) {
            cluster.active = false;
            ++carried_inactive;
        }
    }

    state.current.generation = generation;
    state.current.mode = mode;
    state.current.reference_price = reference_price;
    state.current.built_at_ms = now_ms;
    state.current.data_as_of_ms = data_as_of_ms;
    state.current.clusters = std::move(clusters);
    state.has_generation = true;
    if (reference_price > 0.0) {
        state.last_price = reference_price;
    }

    LOG_DEBUG("[{}] cluster generation {} published ({} clusters, {} consumed)",
              symbol, generation, state.current.clusters.size(), carried_inactive);
    return generation;
}

int ClusterStore::applyPrice(const std::string& symbol, Price price, TimestampMs now_ms) {
    if (!std::isfinite(price) || price <= 0.0) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = states_[symbol];
    const std::optional<Price> previous = state.last_price;
    state.last_price = price;

    if (!state.has_generation || state.current.mode != ClusterMode::REACTIVE || !previous) {
        return 0;
    }

    const Price lo = std::min(*previous, price);
    const Price hi = std::max(*previous, price);
    int deactivated = 0;

    for (auto& cluster : state.current.clusters) {
        if (!cluster.active) {
            continue;
        }
        // 이전 가격 쪽에 있던 중심가를 새 가격이 통과(또는 도달)
        const bool was_on_one_side = cluster.price != *previous;
        const bool crossed = was_on_one_side && cluster.price >= lo && cluster.price <= hi;
        if (!crossed) {
            continue;
        }

        cluster.active = false;
        cluster.last_updated_ms = now_ms;
        ++deactivated;

        ConsumedZone zone;
        zone.side = cluster.side;
        zone.price = cluster.price;
        zone.consumed_at_ms = now_ms;
        state.consumed.push_back(zone);

        LOG_INFO("[{}] {} cluster at {:.4f} consumed (price {:.4f} -> {:.4f})",
                 symbol, toString(cluster.side), cluster.price, *previous, price);
    }
    return deactivated;
}

std::optional<ClusterGeneration> ClusterStore::latest(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(symbol);
    if (it == states_.end() || !it->second.has_generation) {
        return std::nullopt;
    }
    return it->second.current;
}

std::vector<Cluster> ClusterStore::clustersAt(const std::string& symbol, Price current_price) const {
    std::vector<Cluster> clusters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = states_.find(symbol);
        if (it == states_.end() || !it->second.has_generation) {
            return clusters;
        }
        clusters = it->second.current.clusters;
    }

    if (current_price > 0.0) {
        for (auto& cluster : clusters) {
            cluster.distance_pct = std::abs(cluster.price - current_price) / current_price * 100.0;
        }
    }
    std::sort(clusters.begin(), clusters.end(), [](const Cluster& a, const Cluster& b) {
        if (a.strength != b.strength) return a.strength > b.strength;
        if (a.distance_pct != b.distance_pct) return a.distance_pct < b.distance_pct;
        return a.price < b.price;
    });
    return clusters;
}

std::vector<ConsumedZone> ClusterStore::consumedZones(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(symbol);
    if (it == states_.end()) {
        return {};
    }
    return it->second.consumed;
}

TimestampMs ClusterStore::ageMs(const std::string& symbol, TimestampMs now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(symbol);
    if (it == states_.end() || !it->second.has_generation) {
        return -1;
    }
    return std::max<TimestampMs>(0, now_ms - it->second.current.built_at_ms);
}

} // namespace engine
} // namespace liqhunter
