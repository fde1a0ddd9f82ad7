#include "strategy/SignalGenerator.h"
#include "common/Config.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace liqhunter {
namespace strategy {

namespace {
// Absorbs floating-point noise so a target exactly at the minimum passes.
constexpr double kTakeProfitEpsilonPct = 1e-9;

std::string describeCluster(const Cluster& cluster) {
    std::ostringstream oss;
    oss << toString(cluster.side) << " liquidation cluster at "
        << std::fixed << std::setprecision(4) << cluster.price
        << " (strength " << std::setprecision(2) << cluster.strength
        << ", distance " << cluster.distance_pct << "%)";
    return oss.str();
}
}

SignalGenerator::SignalGenerator(SignalConfig config)
    : config_(config)
{
    validate(config_);
}

void SignalGenerator::validate(const SignalConfig& config) {
    if (!(config.min_strength >= 0.0) || config.min_strength > 1.0) {
        throw common::ConfigError("signal min_strength must be in [0, 1]");
    }
    if (!(config.max_distance_pct >= 0.0)) {
        throw common::ConfigError("signal max_distance_pct must be >= 0");
    }
    if (!(config.min_take_profit_pct >= 0.0)) {
        throw common::ConfigError("signal min_take_profit_pct must be >= 0");
    }
    if (!(config.stop_loss_pct > 0.0) || config.stop_loss_pct >= 100.0) {
        throw common::ConfigError("signal stop_loss_pct must be in (0, 100)");
    }
    if (!(config.take_profit_buffer_pct >= 0.0) || config.take_profit_buffer_pct >= 100.0) {
        throw common::ConfigError("signal take_profit_buffer_pct must be in [0, 100)");
    }
}

double SignalGenerator::takeProfitDistancePct(Price entry, Price take_profit) {
    if (entry <= 0.0) {
        return 0.0;
    }
    return std::abs(take_profit - entry) / entry * 100.0;
}

Signal SignalGenerator::neutral(const std::string& symbol, Price current_price, const std::string& reason) {
    Signal signal;
    signal.symbol = symbol;
    signal.direction = Direction::NEUTRAL;
    signal.current_price = current_price;
    signal.confidence = 0.0;
    signal.reason = reason;
    return signal;
}

std::vector<Cluster> SignalGenerator::rankCandidates(
    Price current_price,
    const std::vector<Cluster>& clusters,
    Direction direction
) const {
    std::vector<Cluster> candidates;
    if (direction == Direction::NEUTRAL) {
        return candidates;
    }

    // LONG <- short clusters above, SHORT <- long clusters below
    const PositionSide wanted = (direction == Direction::LONG) ? PositionSide::SHORT : PositionSide::LONG;

    for (const auto& cluster : clusters) {
        if (!cluster.active || cluster.side != wanted) {
            continue;
        }
        const bool right_side_of_price = (direction == Direction::LONG)
            ? cluster.price > current_price
            : cluster.price < current_price;
        if (!right_side_of_price) {
            continue;
        }
        if (cluster.strength < config_.min_strength || cluster.distance_pct > config_.max_distance_pct) {
            continue;
        }
        candidates.push_back(cluster);
    }

    std::sort(candidates.begin(), candidates.end(), [](const Cluster& a, const Cluster& b) {
        if (a.strength != b.strength) return a.strength > b.strength;
        if (a.distance_pct != b.distance_pct) return a.distance_pct < b.distance_pct;
        return a.price < b.price;
    });
    return candidates;
}

std::optional<Signal> SignalGenerator::buildSignal(
    const std::string& symbol,
    Price current_price,
    const Cluster& candidate,
    Direction direction
) const {
    const Price entry = current_price;
    Price stop_loss = 0.0;
    Price take_profit = 0.0;

    if (direction == Direction::LONG) {
        stop_loss = entry * (1.0 - config_.stop_loss_pct / 100.0);
        take_profit = candidate.price * (1.0 + config_.take_profit_buffer_pct / 100.0);
    } else {
        stop_loss = entry * (1.0 + config_.stop_loss_pct / 100.0);
        take_profit = candidate.price * (1.0 - config_.take_profit_buffer_pct / 100.0);
    }

    // 목표가가 너무 가까우면 후보 폐기 (degenerate, not an error)
    if (takeProfitDistancePct(entry, take_profit) + kTakeProfitEpsilonPct < config_.min_take_profit_pct) {
        return std::nullopt;
    }

    const double risk = std::abs(entry - stop_loss);
    const double reward = std::abs(take_profit - entry);

    Signal signal;
    signal.symbol = symbol;
    signal.direction = direction;
    signal.current_price = current_price;
    signal.entry = entry;
    signal.stop_loss = stop_loss;
    signal.take_profit = take_profit;
    signal.confidence = candidate.strength;
    signal.risk_reward = risk > 0.0 ? reward / risk : 0.0;

    ClusterRef ref;
    ref.generation = candidate.generation;
    ref.cluster_id = candidate.cluster_id;
    ref.price = candidate.price;
    ref.side = candidate.side;
    ref.strength = candidate.strength;
    ref.distance_pct = candidate.distance_pct;
    signal.source_cluster = ref;
    signal.reason = "Targeting " + describeCluster(candidate);
    return signal;
}

std::optional<Signal> SignalGenerator::evaluateDirection(
    const std::string& symbol,
    Price current_price,
    const std::vector<Cluster>& clusters,
    Direction direction
) const {
    if (!std::isfinite(current_price) || current_price <= 0.0) {
        throw std::invalid_argument("no valid current price for " + symbol);
    }

    for (const auto& candidate : rankCandidates(current_price, clusters, direction)) {
        auto signal = buildSignal(symbol, current_price, candidate, direction);
        if (signal) {
            return signal;
        }
    }
    return std::nullopt;
}

Signal SignalGenerator::generate(
    const std::string& symbol,
    Price current_price,
    const std::vector<Cluster>& clusters
) const {
    for (Direction direction : kDirectionPriority) {
        auto signal = evaluateDirection(symbol, current_price, clusters, direction);
        if (signal) {
            return *signal;
        }
    }
    return neutral(symbol, current_price, "No qualifying liquidation cluster");
}

} // namespace strategy
} // namespace liqhunter
