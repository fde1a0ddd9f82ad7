#include "engine/EventReplay.h"
#include "engine/LiquidationEngine.h"
#include "network/IMarketDataSource.h"

#include <nlohmann/json.hpp>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace liqhunter;
using liqhunter::engine::EngineConfig;
using liqhunter::engine::LiquidationEngine;
using nlohmann::json;

namespace {

// 재생 경로는 시세를 조회하지 않음
class OfflineMarket : public network::IMarketDataSource {
public:
    PriceSnapshot fetchPrice(const std::string& symbol) override {
        throw std::runtime_error("offline: " + symbol);
    }
    OpenInterestSnapshot fetchOpenInterest(const std::string& symbol, Price) override {
        throw std::runtime_error("offline: " + symbol);
    }
};

EngineConfig reactiveConfig() {
    EngineConfig config;
    config.mode = ClusterMode::REACTIVE;
    config.symbols = {"BTCUSDT", "ETHUSDT"};
    return config;
}

std::string forceOrderLine(const std::string& symbol, long long ts) {
    json order = {
        {"s", symbol}, {"S", "SELL"}, {"o", "LIMIT"}, {"f", "IOC"},
        {"q", "0.014"}, {"p", "9910"}, {"ap", "9910"}, {"X", "FILLED"},
        {"l", "0.014"}, {"z", "0.014"}, {"T", ts}
    };
    return json{{"e", "forceOrder"}, {"E", ts}, {"o", order}}.dump();
}

void writeAll(int fd, const std::string& text) {
    size_t written = 0;
    while (written < text.size()) {
        const ssize_t n = ::write(fd, text.data() + written, text.size() - written);
        assert(n > 0);
        written += static_cast<size_t>(n);
    }
}

} // namespace

int main() {
    // 1. EOF까지 동기 재생 (--once 경로)
    {
        LiquidationEngine liq_engine(reactiveConfig(), std::make_shared<OfflineMarket>());

        int fds[2];
        assert(::pipe(fds) == 0);
        std::string input;
        input += forceOrderLine("BTCUSDT", 1568014460893LL) + "\n";
        input += "not json\n";
        input += "\n";
        input += forceOrderLine("DOGEUSDT", 1568014460894LL) + "\n";
        input += forceOrderLine("BTCUSDT", 1568014460895LL) + "\n";
        input += forceOrderLine("ETHUSDT", 1568014460896LL);     // 마지막 줄 개행 없음
        writeAll(fds[1], input);
        ::close(fds[1]);

        std::atomic<bool> stop(false);
        const int accepted = engine::replayEvents(fds[0], liq_engine, stop);
        ::close(fds[0]);

        assert(accepted == 3);
        assert(liq_engine.bufferedEvents("BTCUSDT") == 2);
        assert(liq_engine.bufferedEvents("ETHUSDT") == 1);
        assert(liq_engine.bufferedEvents("DOGEUSDT") == 0);
    }

    // 2. 입력이 열려 있어도 stop 요청 시 종료 (join 가능)
    {
        LiquidationEngine liq_engine(reactiveConfig(), std::make_shared<OfflineMarket>());

        int fds[2];
        assert(::pipe(fds) == 0);

        std::atomic<bool> stop(false);
        std::atomic<int> accepted(-1);
        std::thread reader([&]() {
            accepted = engine::replayEvents(fds[0], liq_engine, stop);
        });

        writeAll(fds[1], forceOrderLine("BTCUSDT", 1568014460893LL) + "\n");
        for (int i = 0; i < 100 && liq_engine.bufferedEvents("BTCUSDT") == 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        assert(liq_engine.bufferedEvents("BTCUSDT") == 1);

        // 개행 없는 조각은 중지 시 버림
        writeAll(fds[1], "{\"partial\":");

        const auto stop_at = std::chrono::steady_clock::now();
        stop = true;
        reader.join();
        const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - stop_at
        ).count();

        assert(waited < 1000);
        assert(accepted == 1);
        assert(liq_engine.bufferedEvents("BTCUSDT") == 1);

        ::close(fds[1]);
        ::close(fds[0]);
    }

    std::cout << "[TEST] EventReplay PASSED\n";
    return 0;
}
