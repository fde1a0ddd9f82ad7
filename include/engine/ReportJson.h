#pragma once

#include <vector>
#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "engine/LiquidationEngine.h"

namespace liqhunter {
namespace engine {

// JSON 출력 (가격은 크기별 자릿수로 반올림, 계산값은 그대로)
nlohmann::json toJson(const Cluster& cluster);
nlohmann::json toJson(const Signal& signal);
nlohmann::json toJson(const strategy::SupportResistance& levels);
nlohmann::json toJson(const strategy::SentimentAnalysis& sentiment);
nlohmann::json toJson(const SymbolReport& report);

// {"generated_at": ms, "symbols": {"BTCUSDT": {...}, ...}}
nlohmann::json batchToJson(const std::vector<SymbolReport>& batch, TimestampMs generated_at_ms);

} // namespace engine
} // namespace liqhunter
