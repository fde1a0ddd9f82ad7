#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "network/IMarketDataSource.h"

namespace liqhunter {
namespace engine {

enum class DataKind { PRICE, OPEN_INTEREST, CLUSTERS };

const char* toString(DataKind kind);

template<typename T>
struct CachedValue {
    std::optional<T> value;
    DataStatus status = DataStatus::UNAVAILABLE;
    TimestampMs fetched_at_ms = 0;
    bool refreshed = false;         // an upstream call was made for this access
    std::string error;              // last refresh failure, empty on success
};

// 심볼 x 데이터 종류별 유효기간 관리
//
// A fresh entry is served from cache with no upstream call. An expired entry is
// refreshed synchronously (at most max_retries extra attempts); when every attempt
// fails the previous value is served, flagged STALE once it is older than the
// hard ceiling. Refreshes of one symbol are serialized; different symbols only
// share the source's rate limiter, which it waits on per outbound request.
class RefreshScheduler {
public:
    using ClockFn = std::function<TimestampMs()>;

    RefreshScheduler(
        std::shared_ptr<network::IMarketDataSource> source,
        const EngineConfig& config,
        ClockFn clock = nowMs
    );

    CachedValue<PriceSnapshot> getPrice(const std::string& symbol);
    // mark_price values the contracts when a refresh is needed.
    CachedValue<OpenInterestSnapshot> getOpenInterest(const std::string& symbol, Price mark_price);

    // Cache only, never calls upstream.
    CachedValue<OpenInterestSnapshot> peekOpenInterest(const std::string& symbol) const;

    // Pushed price. Rejected (false) when older than the cached one.
    bool storePrice(const PriceSnapshot& snapshot);

    // Cluster recompute cadence
    bool clustersDue(const std::string& symbol) const;
    void markClustersBuilt(const std::string& symbol);

    // Base TTL plus the symbol's jitter; 0 jitter before the first cache.
    double effectiveTtlSec(const std::string& symbol, DataKind kind) const;
    double jitterSec(const std::string& symbol, DataKind kind) const;

    // Refresh attempts (one source call each)
    int upstreamCalls() const;

private:
    struct Expiry {
        TimestampMs valid_until_ms = 0;
        std::optional<double> jitter_sec;   // drawn once, at first cache
    };

    template<typename T>
    struct Entry {
        std::optional<T> value;
        TimestampMs fetched_at_ms = 0;
        std::string last_error;
    };

    double baseTtlSec(DataKind kind) const;
    double drawJitter(DataKind kind);
    void touchExpiry(const std::string& symbol, DataKind kind, TimestampMs now_ms);
    bool isFresh(const std::string& symbol, DataKind kind, TimestampMs now_ms) const;
    std::shared_ptr<std::mutex> symbolMutex(const std::string& symbol);

    template<typename T>
    CachedValue<T> serve(const Entry<T>& entry, TimestampMs now_ms, bool refreshed) const;

    template<typename T, typename Fetch>
    CachedValue<T> getOrRefresh(
        const std::string& symbol,
        DataKind kind,
        std::map<std::string, Entry<T>>& entries,
        Fetch fetch
    );

    std::shared_ptr<network::IMarketDataSource> source_;
    EngineConfig config_;
    ClockFn clock_;

    mutable std::mutex state_mutex_;
    std::map<std::string, Entry<PriceSnapshot>> prices_;
    std::map<std::string, Entry<OpenInterestSnapshot>> open_interest_;
    std::map<std::pair<std::string, DataKind>, Expiry> expiries_;
    std::map<std::string, std::shared_ptr<std::mutex>> symbol_mutexes_;
    std::mt19937 rng_;
    int upstream_calls_ = 0;
};

} // namespace engine
} // namespace liqhunter
