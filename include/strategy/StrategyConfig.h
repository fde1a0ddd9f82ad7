#pragma once

namespace liqhunter {
namespace strategy {

struct SignalConfig {
    double min_strength = 0.6;
    double max_distance_pct = 3.0;
    double min_take_profit_pct = 0.5;   // inclusive
    double stop_loss_pct = 1.5;         // stop sits this far inside entry
    double take_profit_buffer_pct = 0.5; // target sits this far beyond the cluster
};

struct LevelsConfig {
    int max_levels = 5;
    double min_strength = 0.3;
    double max_distance_pct = 10.0;
};

struct SentimentConfig {
    double base_deviation = 0.20;       // |long/short - 1| beyond this is a bias
    double high_multiplier = 1.5;
};

} // namespace strategy
} // namespace liqhunter
