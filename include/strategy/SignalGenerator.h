#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace liqhunter {
namespace strategy {

// 클러스터 집합 -> 단일 매매 신호
//
// LONG targets short-side clusters above price (short liquidations push price
// up); SHORT targets long-side clusters below price. LONG is always evaluated
// first and wins when both directions qualify.
class SignalGenerator {
public:
    // Direction evaluation order. Not an accident of iteration: LONG wins ties.
    static constexpr Direction kDirectionPriority[2] = {Direction::LONG, Direction::SHORT};

    explicit SignalGenerator(SignalConfig config);

    // Throws std::invalid_argument if current_price is not a positive finite number.
    Signal generate(
        const std::string& symbol,
        Price current_price,
        const std::vector<Cluster>& clusters
    ) const;

    // Best qualifying signal for one direction only, or nullopt.
    std::optional<Signal> evaluateDirection(
        const std::string& symbol,
        Price current_price,
        const std::vector<Cluster>& clusters,
        Direction direction
    ) const;

    // Candidates for a direction, best first (strength desc, distance asc, price asc).
    std::vector<Cluster> rankCandidates(
        Price current_price,
        const std::vector<Cluster>& clusters,
        Direction direction
    ) const;

    static double takeProfitDistancePct(Price entry, Price take_profit);
    static Signal neutral(const std::string& symbol, Price current_price, const std::string& reason);

    // Throws common::ConfigError
    static void validate(const SignalConfig& config);

    const SignalConfig& config() const { return config_; }

private:
    std::optional<Signal> buildSignal(
        const std::string& symbol,
        Price current_price,
        const Cluster& candidate,
        Direction direction
    ) const;

    SignalConfig config_;
};

} // namespace strategy
} // namespace liqhunter
