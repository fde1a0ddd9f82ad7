#include "common/Logger.h"
#include "common/Config.h"
#include "engine/EventReplay.h"
#include "engine/LiquidationEngine.h"
#include "engine/ReportJson.h"
#include "network/BinanceFuturesClient.h"
#include "network/BinanceLiquidationStream.h"
#include "network/CurlHttpClient.h"
#include "network/RateLimiter.h"

#include <nlohmann/json.hpp>

#include <unistd.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <chrono>
#include <vector>

using namespace liqhunter;

namespace {

std::atomic<bool> g_stop_requested(false);

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_requested = true;
    }
}

struct CliOptions {
    std::string config_path = "config/config.json";
    bool once = false;
    bool events_stdin = false;
    std::vector<std::string> symbols;
};

void printUsage() {
    std::cout << "Usage: liqhunter [--config path] [--once] [--symbols A,B] [--events-stdin]\n"
              << "  --config path    설정 파일 (기본값: config/config.json)\n"
              << "  --once           배치 한 번 계산 후 출력하고 종료\n"
              << "  --symbols A,B    설정의 심볼 목록 대신 사용\n"
              << "  --events-stdin   표준입력의 Binance forceOrder JSON(한 줄에 하나)을 청산 이벤트로 수집\n"
              << "                   (반응 모드에서 생략 시 fstream.binance.com 직접 구독)\n";
}

std::vector<std::string> splitSymbols(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

// false => exit (help or bad argument)
bool parseArgs(int argc, char* argv[], CliOptions& options, int& exit_code) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--once") {
            options.once = true;
        } else if (arg == "--symbols" && i + 1 < argc) {
            options.symbols = splitSymbols(argv[++i]);
        } else if (arg == "--events-stdin") {
            options.events_stdin = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            exit_code = 0;
            return false;
        } else {
            std::cerr << "알 수 없는 인자: " << arg << "\n";
            printUsage();
            exit_code = 2;
            return false;
        }
    }
    return true;
}

void printBatch(const std::vector<engine::SymbolReport>& batch) {
    std::cout << engine::batchToJson(batch, nowMs()).dump(2) << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    int exit_code = 0;
    if (!parseArgs(argc, argv, options, exit_code)) {
        return exit_code;
    }

    try {
        Config& config = Config::getInstance();
        config.load(options.config_path);
        if (!options.symbols.empty()) {
            config.setSymbols(options.symbols);
        }

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        const auto engine_config = config.getEngineConfig();
        LOG_INFO("LiqHunter 시작 - mode: {}, symbols: {}", toString(engine_config.mode), engine_config.symbols.size());

        // 모든 REST 요청이 공유하는 토큰 버킷
        auto rate_limiter = std::make_shared<network::RateLimiter>(
            engine_config.rate_limit_per_sec, engine_config.rate_limit_burst
        );
        auto http_client = std::make_shared<network::CurlHttpClient>(
            network::BinanceFuturesClient::kBaseUrl, engine_config.request_timeout_ms
        );
        auto source = std::make_shared<network::BinanceFuturesClient>(http_client, rate_limiter);

        auto liq_engine = std::make_shared<engine::LiquidationEngine>(engine_config, source);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (options.once) {
            // 녹화 재생: 입력을 끝까지 읽은 뒤 배치 계산
            if (options.events_stdin) {
                engine::replayEvents(STDIN_FILENO, *liq_engine, g_stop_requested);
            }
            printBatch(liq_engine->getBatch());
            return 0;
        }

        // 반응 모드 + stdin 입력 없음 => Binance forceOrder 스트림 직접 구독
        std::unique_ptr<network::BinanceLiquidationStream> stream;
        if (engine_config.mode == ClusterMode::REACTIVE && !options.events_stdin) {
            stream = std::make_unique<network::BinanceLiquidationStream>(engine_config.symbols);
            stream->start([liq_engine](const RawLiquidationEvent& event) {
                if (!liq_engine->ingestLiquidation(event)) {
                    LOG_DEBUG("[{}] 청산 이벤트 거부: {}", event.symbol, event.event_id);
                }
            });
        }

        liq_engine->setCycleCallback(printBatch);
        liq_engine->start();

        // 청산 이벤트 파이프 입력 (녹화된 스트림 재생 등)
        std::unique_ptr<std::thread> reader;
        if (options.events_stdin) {
            reader = std::make_unique<std::thread>([liq_engine]() {
                engine::replayEvents(STDIN_FILENO, *liq_engine, g_stop_requested);
            });
        }

        while (!g_stop_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO("종료 신호 수신");
        if (stream) {
            stream->stop();
        }
        if (reader && reader->joinable()) {
            reader->join();
        }
        liq_engine->stop();
        return 0;

    } catch (const common::ConfigError& e) {
        std::cerr << "설정 오류: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("치명적 오류: {}", e.what());
        std::cerr << "오류: " << e.what() << std::endl;
        return 1;
    }
}
