#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace liqhunter {
namespace network {

// Binance forceOrder 메시지 -> RawLiquidationEvent
//
// Accepts the combined-stream envelope {"stream":..,"data":{"e":"forceOrder","o":{..}}},
// the single-stream form {"e":"forceOrder","o":{..}} and a bare order object.
// The order side is the closing order: SELL closes (liquidates) a long,
// BUY closes a short.
class LiquidationEventParser {
public:
    // nullopt for anything that is not a usable liquidation (bad price/qty/side).
    static std::optional<RawLiquidationEvent> parse(const nlohmann::json& message);

    // Malformed JSON text => nullopt.
    static std::optional<RawLiquidationEvent> parseText(const std::string& text);
};

} // namespace network
} // namespace liqhunter
