#include "engine/ReportJson.h"
#include "common/PriceFormat.h"

#include <cmath>

namespace liqhunter {
namespace engine {

namespace {
double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

double round4(double v) {
    return std::round(v * 10000.0) / 10000.0;
}

nlohmann::json optionalPrice(const std::optional<Price>& value) {
    if (!value) return nullptr;
    return common::roundPrice(*value);
}

nlohmann::json toJson(const ClusterRef& ref) {
    return {
        {"generation", ref.generation},
        {"cluster_id", ref.cluster_id},
        {"price", common::roundPrice(ref.price)},
        {"side", toString(ref.side)},
        {"strength", round4(ref.strength)},
        {"distance_pct", round2(ref.distance_pct)}
    };
}

nlohmann::json toJson(const strategy::PriceLevel& level) {
    return {
        {"price", common::roundPrice(level.price)},
        {"strength", round4(level.strength)},
        {"weight", round2(level.weight)},
        {"distance_pct", round2(level.distance_pct)}
    };
}
}

nlohmann::json toJson(const Cluster& cluster) {
    nlohmann::json j = {
        {"cluster_id", cluster.cluster_id},
        {"generation", cluster.generation},
        {"price", common::roundPrice(cluster.price)},
        {"side", toString(cluster.side)},
        {"strength", round4(cluster.strength)},
        {"total_weight", round2(cluster.total_weight)},
        {"member_count", cluster.member_count},
        {"distance_pct", round2(cluster.distance_pct)},
        {"last_updated", cluster.last_updated_ms},
        {"active", cluster.active}
    };
    if (cluster.avg_leverage > 0.0) {
        j["avg_leverage"] = std::round(cluster.avg_leverage * 10.0) / 10.0;
    }
    if (cluster.newest_member_ms > 0) {
        j["newest_event"] = cluster.newest_member_ms;
    }
    return j;
}

nlohmann::json toJson(const Signal& signal) {
    nlohmann::json j = {
        {"symbol", signal.symbol},
        {"direction", toString(signal.direction)},
        {"current_price", common::roundPrice(signal.current_price)},
        {"entry", optionalPrice(signal.entry)},
        {"stop_loss", optionalPrice(signal.stop_loss)},
        {"take_profit", optionalPrice(signal.take_profit)},
        {"confidence", round4(signal.confidence)},
        {"risk_reward", signal.risk_reward ? nlohmann::json(round2(*signal.risk_reward)) : nlohmann::json(nullptr)},
        {"reason", signal.reason}
    };
    j["source_cluster"] = signal.source_cluster ? toJson(*signal.source_cluster) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json toJson(const strategy::SupportResistance& levels) {
    nlohmann::json support = nlohmann::json::array();
    for (const auto& level : levels.support) {
        support.push_back(toJson(level));
    }
    nlohmann::json resistance = nlohmann::json::array();
    for (const auto& level : levels.resistance) {
        resistance.push_back(toJson(level));
    }
    return {{"support", support}, {"resistance", resistance}};
}

nlohmann::json toJson(const strategy::SentimentAnalysis& sentiment) {
    return {
        {"bias", strategy::toString(sentiment.bias)},
        {"bias_strength", strategy::toString(sentiment.bias_strength)},
        {"long_short_ratio", round2(sentiment.long_short_ratio)},
        {"total_oi", round2(sentiment.total_oi)},
        {"long_oi", round2(sentiment.long_oi)},
        {"short_oi", round2(sentiment.short_oi)},
        {"description", sentiment.description}
    };
}

nlohmann::json toJson(const SymbolReport& report) {
    nlohmann::json clusters = nlohmann::json::array();
    for (const auto& cluster : report.clusters) {
        clusters.push_back(toJson(cluster));
    }

    nlohmann::json j = {
        {"symbol", report.symbol},
        {"mode", toString(report.mode)},
        {"status", toString(report.status)},
        {"price", optionalPrice(report.current_price)},
        {"signal", toJson(report.signal)},
        {"signal_long", report.signal_long ? toJson(*report.signal_long) : nlohmann::json(nullptr)},
        {"signal_short", report.signal_short ? toJson(*report.signal_short) : nlohmann::json(nullptr)},
        {"levels", toJson(report.levels)},
        {"sentiment", toJson(report.sentiment)},
        {"clusters", clusters},
        {"generation", report.generation},
        {"data_age_ms", report.data_age_ms},
        {"timestamp", report.generated_at_ms}
    };
    if (!report.error.empty()) {
        j["error"] = report.error;
    }
    return j;
}

nlohmann::json batchToJson(const std::vector<SymbolReport>& batch, TimestampMs generated_at_ms) {
    nlohmann::json symbols = nlohmann::json::object();
    for (const auto& report : batch) {
        symbols[report.symbol] = toJson(report);
    }
    return {{"generated_at", generated_at_ms}, {"symbols", symbols}};
}

} // namespace engine
} // namespace liqhunter
