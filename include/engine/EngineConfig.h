#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "liquidation/LiquidationConfig.h"
#include "strategy/StrategyConfig.h"

namespace liqhunter {
namespace engine {

// 엔진 설정
struct EngineConfig {
    ClusterMode mode;
    std::vector<std::string> symbols;

    // 갱신 주기 (per data kind)
    double price_ttl_sec;
    double open_interest_ttl_sec;
    double cluster_ttl_sec;             // predictive recompute cadence
    double reactive_rebuild_sec;        // reactive rebuild cadence, independent of event rate

    double stale_ceiling_sec;           // older than this after a failed refresh => STALE
    double jitter_fraction;             // per-symbol expiry jitter, fraction of base TTL
    unsigned int jitter_seed;

    // 외부 호출 제한
    int request_timeout_ms;
    double rate_limit_per_sec;
    int rate_limit_burst;
    int max_retries;

    liquidation::LeverageConfig leverage;
    liquidation::ClusterBuilderConfig predictive_cluster;
    liquidation::ClusterBuilderConfig reactive_cluster;
    liquidation::ReactiveConfig reactive;
    strategy::SignalConfig signal;
    strategy::LevelsConfig levels;
    strategy::SentimentConfig sentiment;

    EngineConfig()
        : mode(ClusterMode::PREDICTIVE)
        , symbols{"BTCUSDT", "ETHUSDT", "SOLUSDT"}
        , price_ttl_sec(1.5)
        , open_interest_ttl_sec(15.0)
        , cluster_ttl_sec(5.0)
        , reactive_rebuild_sec(5.0)
        , stale_ceiling_sec(120.0)
        , jitter_fraction(0.1)
        , jitter_seed(0)
        , request_timeout_ms(10000)
        , rate_limit_per_sec(10.0)
        , rate_limit_burst(10)
        , max_retries(1)
    {
        reactive_cluster.bucket_width_pct = 1.0;
        reactive_cluster.min_members = 3;
    }
};

} // namespace engine
} // namespace liqhunter
