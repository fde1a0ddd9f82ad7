#include "network/LiquidationEventParser.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace liqhunter {
namespace network {

namespace {
double numberField(const nlohmann::json& obj, const char* key) {
    if (!obj.contains(key)) {
        return 0.0;
    }
    const auto& v = obj[key];
    if (v.is_number()) {
        return v.get<double>();
    }
    if (v.is_string()) {
        try {
            return std::stod(v.get<std::string>());
        } catch (const std::exception&) {
            return 0.0;
        }
    }
    return 0.0;
}

std::string upperField(const nlohmann::json& obj, const char* key) {
    if (!obj.contains(key) || !obj[key].is_string()) {
        return "";
    }
    std::string s = obj[key].get<std::string>();
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

const nlohmann::json& eventObject(const nlohmann::json& message) {
    if (message.contains("stream") && message.contains("data") && message["data"].is_object()) {
        return message["data"];
    }
    return message;
}

const nlohmann::json& orderObject(const nlohmann::json& event) {
    if (event.contains("o") && event["o"].is_object()) {
        return event["o"];
    }
    return event;
}
}

std::optional<RawLiquidationEvent> LiquidationEventParser::parse(const nlohmann::json& message) {
    if (!message.is_object()) {
        return std::nullopt;
    }

    const nlohmann::json& envelope = eventObject(message);
    const nlohmann::json& order = orderObject(envelope);

    RawLiquidationEvent event;
    event.symbol = upperField(order, "s");
    const std::string side = upperField(order, "S");

    // 평균 체결가가 있으면 우선 사용
    double price = numberField(order, "ap");
    if (price <= 0.0) {
        price = numberField(order, "p");
    }
    double quantity = numberField(order, "z");
    if (quantity <= 0.0) {
        quantity = numberField(order, "q");
    }

    if (event.symbol.empty() || !std::isfinite(price) || price <= 0.0 ||
        !std::isfinite(quantity) || quantity <= 0.0) {
        return std::nullopt;
    }

    if (side == "SELL") {
        event.side = PositionSide::LONG;
    } else if (side == "BUY") {
        event.side = PositionSide::SHORT;
    } else {
        return std::nullopt;
    }

    event.price = price;
    event.notional = price * quantity;

    TimestampMs ts = static_cast<TimestampMs>(numberField(order, "T"));
    if (ts <= 0) {
        ts = static_cast<TimestampMs>(numberField(envelope, "E"));
    }
    event.timestamp_ms = ts > 0 ? ts : nowMs();

    // 재전송 중복 판별용 (at-least-once 스트림)
    event.event_id = event.symbol + "-" + side + "-" + std::to_string(event.timestamp_ms) + "-" +
                     std::to_string(static_cast<long long>(std::llround(event.notional * 100.0)));
    return event;
}

std::optional<RawLiquidationEvent> LiquidationEventParser::parseText(const std::string& text) {
    try {
        return parse(nlohmann::json::parse(text));
    } catch (const nlohmann::json::parse_error& e) {
        LOG_DEBUG("forceOrder 메시지 파싱 실패: {}", e.what());
        return std::nullopt;
    }
}

} // namespace network
} // namespace liqhunter
