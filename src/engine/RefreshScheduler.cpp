#include "engine/RefreshScheduler.h"
#include "common/Config.h"
#include "common/Logger.h"

#include <algorithm>
#include <stdexcept>

namespace liqhunter {
namespace engine {

const char* toString(DataKind kind) {
    switch (kind) {
        case DataKind::PRICE: return "price";
        case DataKind::OPEN_INTEREST: return "open_interest";
        case DataKind::CLUSTERS: return "clusters";
    }
    return "unknown";
}

RefreshScheduler::RefreshScheduler(
    std::shared_ptr<network::IMarketDataSource> source,
    const EngineConfig& config,
    ClockFn clock
)
    : source_(std::move(source))
    , config_(config)
    , clock_(std::move(clock))
    , rng_(config.jitter_seed != 0 ? config.jitter_seed : std::random_device{}())
{
    if (!(config_.jitter_fraction >= 0.0 && config_.jitter_fraction < 1.0)) {
        throw common::ConfigError("jitter_fraction must be in [0, 1)");
    }
    if (!source_) {
        throw std::invalid_argument("RefreshScheduler requires a market data source");
    }
    if (!clock_) {
        clock_ = nowMs;
    }
}

double RefreshScheduler::baseTtlSec(DataKind kind) const {
    switch (kind) {
        case DataKind::PRICE: return config_.price_ttl_sec;
        case DataKind::OPEN_INTEREST: return config_.open_interest_ttl_sec;
        case DataKind::CLUSTERS:
            return config_.mode == ClusterMode::REACTIVE ? config_.reactive_rebuild_sec : config_.cluster_ttl_sec;
    }
    return 0.0;
}

double RefreshScheduler::drawJitter(DataKind kind) {
    const double bound = config_.jitter_fraction * baseTtlSec(kind);
    if (bound <= 0.0) {
        return 0.0;
    }
    std::uniform_real_distribution<double> dist(0.0, bound);
    return dist(rng_);
}

// state_mutex_ must be held
void RefreshScheduler::touchExpiry(const std::string& symbol, DataKind kind, TimestampMs now_ms) {
    auto& expiry = expiries_[{symbol, kind}];
    if (!expiry.jitter_sec) {
        expiry.jitter_sec = drawJitter(kind);
    }
    const double ttl_sec = baseTtlSec(kind) + *expiry.jitter_sec;
    expiry.valid_until_ms = now_ms + static_cast<TimestampMs>(ttl_sec * 1000.0);
}

// state_mutex_ must be held
bool RefreshScheduler::isFresh(const std::string& symbol, DataKind kind, TimestampMs now_ms) const {
    auto it = expiries_.find({symbol, kind});
    return it != expiries_.end() && now_ms < it->second.valid_until_ms;
}

std::shared_ptr<std::mutex> RefreshScheduler::symbolMutex(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto& m = symbol_mutexes_[symbol];
    if (!m) {
        m = std::make_shared<std::mutex>();
    }
    return m;
}

template<typename T>
CachedValue<T> RefreshScheduler::serve(const Entry<T>& entry, TimestampMs now_ms, bool refreshed) const {
    CachedValue<T> out;
    out.value = entry.value;
    out.fetched_at_ms = entry.fetched_at_ms;
    out.refreshed = refreshed;
    out.error = entry.last_error;

    if (!entry.value) {
        out.status = DataStatus::UNAVAILABLE;
    } else if (!entry.last_error.empty() &&
               now_ms - entry.fetched_at_ms > static_cast<TimestampMs>(config_.stale_ceiling_sec * 1000.0)) {
        out.status = DataStatus::STALE;
    } else {
        out.status = DataStatus::FRESH;
    }
    return out;
}

template<typename T, typename Fetch>
CachedValue<T> RefreshScheduler::getOrRefresh(
    const std::string& symbol,
    DataKind kind,
    std::map<std::string, Entry<T>>& entries,
    Fetch fetch
) {
    auto symbol_lock_ptr = symbolMutex(symbol);
    std::lock_guard<std::mutex> symbol_lock(*symbol_lock_ptr);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        const TimestampMs now_ms = clock_();
        if (isFresh(symbol, kind, now_ms)) {
            return serve(entries[symbol], now_ms, false);
        }
    }

    // 만료 => 동기 갱신 (최대 1회 재시도)
    std::optional<T> fetched;
    std::string error;
    const int attempts = 1 + std::max(0, config_.max_retries);
    for (int attempt = 0; attempt < attempts && !fetched; ++attempt) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            ++upstream_calls_;
        }
        try {
            fetched = fetch(symbol);
        } catch (const std::exception& e) {
            error = e.what();
            LOG_WARN("[{}] {} refresh attempt {}/{} failed: {}", symbol, toString(kind), attempt + 1, attempts, error);
        }
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    const TimestampMs now_ms = clock_();
    auto& entry = entries[symbol];
    if (fetched) {
        entry.value = std::move(fetched);
        entry.fetched_at_ms = now_ms;
        entry.last_error.clear();
        touchExpiry(symbol, kind, now_ms);
    } else {
        entry.last_error = error.empty() ? "refresh failed" : error;
    }
    return serve(entry, now_ms, true);
}

CachedValue<PriceSnapshot> RefreshScheduler::getPrice(const std::string& symbol) {
    return getOrRefresh<PriceSnapshot>(symbol, DataKind::PRICE, prices_,
        [this](const std::string& s) {
            PriceSnapshot snapshot = source_->fetchPrice(s);
            // 지연 도착한 가격은 최신 캐시를 덮어쓰지 않음
            std::lock_guard<std::mutex> lock(state_mutex_);
            auto it = prices_.find(s);
            if (it != prices_.end() && it->second.value &&
                snapshot.timestamp_ms < it->second.value->timestamp_ms) {
                return *it->second.value;
            }
            return snapshot;
        });
}

CachedValue<OpenInterestSnapshot> RefreshScheduler::getOpenInterest(const std::string& symbol, Price mark_price) {
    return getOrRefresh<OpenInterestSnapshot>(symbol, DataKind::OPEN_INTEREST, open_interest_,
        [this, mark_price](const std::string& s) { return source_->fetchOpenInterest(s, mark_price); });
}

CachedValue<OpenInterestSnapshot> RefreshScheduler::peekOpenInterest(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = open_interest_.find(symbol);
    if (it == open_interest_.end()) {
        return CachedValue<OpenInterestSnapshot>{};
    }
    return serve(it->second, clock_(), false);
}

bool RefreshScheduler::storePrice(const PriceSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto& entry = prices_[snapshot.symbol];
    if (entry.value && snapshot.timestamp_ms < entry.value->timestamp_ms) {
        return false;
    }
    const TimestampMs now_ms = clock_();
    entry.value = snapshot;
    entry.fetched_at_ms = now_ms;
    entry.last_error.clear();
    touchExpiry(snapshot.symbol, DataKind::PRICE, now_ms);
    return true;
}

bool RefreshScheduler::clustersDue(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return !isFresh(symbol, DataKind::CLUSTERS, clock_());
}

void RefreshScheduler::markClustersBuilt(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    touchExpiry(symbol, DataKind::CLUSTERS, clock_());
}

double RefreshScheduler::jitterSec(const std::string& symbol, DataKind kind) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = expiries_.find({symbol, kind});
    if (it == expiries_.end() || !it->second.jitter_sec) {
        return 0.0;
    }
    return *it->second.jitter_sec;
}

double RefreshScheduler::effectiveTtlSec(const std::string& symbol, DataKind kind) const {
    return baseTtlSec(kind) + jitterSec(symbol, kind);
}

int RefreshScheduler::upstreamCalls() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return upstream_calls_;
}

} // namespace engine
} // namespace liqhunter
