#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <variant>
#include <cstdint>

namespace liqhunter {

using Price = double;
using Notional = double;
using TimestampMs = long long;

// 청산될 포지션의 방향 (long 포지션 청산 = 가격 하락 시, short 포지션 청산 = 가격 상승 시)
enum class PositionSide { LONG, SHORT };

enum class Direction { LONG, SHORT, NEUTRAL };

// 예측(OI 기반) vs 반응(실제 청산 이벤트 기반)
enum class ClusterMode { PREDICTIVE, REACTIVE };

enum class DataStatus {
    FRESH,          // refresh succeeded or cached value inside its TTL
    STALE,          // refresh failed and the last value is past the hard ceiling
    UNAVAILABLE     // nothing cached for this symbol
};

inline TimestampMs nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

const char* toString(PositionSide side);
const char* toString(Direction direction);
const char* toString(ClusterMode mode);
const char* toString(DataStatus status);

struct PriceSnapshot {
    std::string symbol;
    Price price = 0.0;
    TimestampMs timestamp_ms = 0;
};

struct OpenInterestSnapshot {
    std::string symbol;
    Notional total_oi = 0.0;    // USD
    Notional long_oi = 0.0;     // USD, 0 when the venue gives no split
    Notional short_oi = 0.0;    // USD
    TimestampMs timestamp_ms = 0;
};

struct RawLiquidationEvent {
    std::string symbol;
    Price price = 0.0;
    PositionSide side = PositionSide::LONG;
    Notional notional = 0.0;
    TimestampMs timestamp_ms = 0;
    std::string event_id;
};

// Where a level came from. The cluster builder never looks inside.
struct LeverageTierSource {
    double leverage = 0.0;
};

struct LiquidationEventSource {
    std::string event_id;
    TimestampMs timestamp_ms = 0;
};

using LevelSource = std::variant<LeverageTierSource, LiquidationEventSource>;

struct LiquidationLevel {
    std::string symbol;
    Price price = 0.0;
    PositionSide side = PositionSide::LONG;
    LevelSource source;
    double weight = 0.0;        // notional at risk (decayed in reactive mode)
};

// One builder input: all levels for a symbol plus the normalizer used for strength.
struct LevelSet {
    std::string symbol;
    ClusterMode mode = ClusterMode::PREDICTIVE;
    Price reference_price = 0.0;
    double total_weight = 0.0;
    std::vector<LiquidationLevel> levels;
};

struct Cluster {
    std::uint64_t generation = 0;
    int cluster_id = 0;
    std::string symbol;
    Price price = 0.0;                  // weighted centroid
    PositionSide side = PositionSide::LONG;
    double strength = 0.0;              // [0, 1]
    double total_weight = 0.0;
    int member_count = 0;
    double distance_pct = 0.0;
    double avg_leverage = 0.0;          // predictive only, 0 otherwise
    TimestampMs newest_member_ms = 0;   // reactive only, 0 otherwise
    TimestampMs last_updated_ms = 0;
    bool active = true;
};

struct ClusterRef {
    std::uint64_t generation = 0;
    int cluster_id = 0;
    Price price = 0.0;
    PositionSide side = PositionSide::LONG;
    double strength = 0.0;
    double distance_pct = 0.0;
};

struct Signal {
    std::string symbol;
    Direction direction = Direction::NEUTRAL;
    Price current_price = 0.0;
    std::optional<Price> entry;
    std::optional<Price> stop_loss;
    std::optional<Price> take_profit;
    double confidence = 0.0;
    std::optional<double> risk_reward;
    std::optional<ClusterRef> source_cluster;
    std::string reason;
};

} // namespace liqhunter
