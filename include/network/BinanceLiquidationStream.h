#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "common/Types.h"

namespace liqhunter {
namespace network {

// Binance USD-M forceOrder 스트림 (공개, 인증 없음)
//
// Reconnects with a capped backoff until stop(). Each parsed event for a
// subscribed symbol is handed to the handler on the worker thread.
class BinanceLiquidationStream {
public:
    using EventHandler = std::function<void(const RawLiquidationEvent&)>;

    static constexpr const char* kHost = "fstream.binance.com";

    // Empty symbol list => all-market stream.
    explicit BinanceLiquidationStream(std::vector<std::string> symbols);
    ~BinanceLiquidationStream();

    bool start(EventHandler handler);
    void stop();

    void setHandler(EventHandler handler);

    bool isConnected() const { return connected_.load(); }
    long long getLastMessageTimeMs() const { return last_message_time_ms_.load(); }
    int eventsDispatched() const { return events_dispatched_.load(); }

    // "/stream?streams=btcusdt@forceOrder/..." or "/ws/!forceOrder@arr"
    static std::string streamTarget(const std::vector<std::string>& symbols);

    // One websocket frame. Returns the number of events handed to the handler.
    int handlePayload(const std::string& payload);

private:
    void runLoop();
    void connectAndReadLoop();

    std::vector<std::string> symbols_;
    std::set<std::string> symbol_filter_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<long long> last_message_time_ms_{0};
    std::atomic<int> events_dispatched_{0};
    std::thread worker_thread_;

    mutable std::mutex handler_mutex_;
    EventHandler event_handler_;
};

} // namespace network
} // namespace liqhunter
