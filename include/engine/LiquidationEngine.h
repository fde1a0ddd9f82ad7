#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "common/Types.h"
#include "engine/ClusterStore.h"
#include "engine/EngineConfig.h"
#include "engine/RefreshScheduler.h"
#include "liquidation/ClusterBuilder.h"
#include "liquidation/LiquidationEventBuffer.h"
#include "network/IMarketDataSource.h"
#include "strategy/LevelAnalyzer.h"
#include "strategy/SignalGenerator.h"

namespace liqhunter {
namespace engine {

// 심볼 하나에 대한 전체 결과 (batch 단위)
struct SymbolReport {
    std::string symbol;
    ClusterMode mode = ClusterMode::PREDICTIVE;
    DataStatus status = DataStatus::UNAVAILABLE;
    std::optional<Price> current_price;
    Signal signal;
    std::optional<Signal> signal_long;
    std::optional<Signal> signal_short;
    std::vector<Cluster> clusters;
    strategy::SupportResistance levels;
    strategy::SentimentAnalysis sentiment;
    std::uint64_t generation = 0;
    TimestampMs data_age_ms = -1;
    TimestampMs generated_at_ms = 0;
    std::string error;
};

// Liquidation Engine - 가격/OI/청산 이벤트 -> 클러스터 -> 신호
class LiquidationEngine {
public:
    using CycleCallback = std::function<void(const std::vector<SymbolReport>&)>;

    // source throttles its own requests (shared RateLimiter).
    LiquidationEngine(
        const EngineConfig& config,
        std::shared_ptr<network::IMarketDataSource> source,
        RefreshScheduler::ClockFn clock = nowMs
    );

    ~LiquidationEngine();

    // ===== 엔진 제어 =====

    bool start();
    void stop();
    bool isRunning() const { return running_; }

    void run();  // 백그라운드 재계산 루프 (블로킹)

    // Called with the batch after every background cycle.
    void setCycleCallback(CycleCallback callback);

    // ===== 입력 =====

    // Out-of-order (older) prices are rejected.
    bool ingestPrice(const PriceSnapshot& snapshot);
    // Events for symbols outside config().symbols are rejected.
    bool ingestLiquidation(const RawLiquidationEvent& event);

    // ===== 계산 =====

    // Rebuilds the symbol's cluster generation now. Returns the data status
    // the generation was built from (UNAVAILABLE leaves the old generation).
    DataStatus recompute(const std::string& symbol);

    std::vector<Cluster> getClusters(const std::string& symbol);
    Signal getSignal(const std::string& symbol);
    SymbolReport getReport(const std::string& symbol);

    // One report per symbol, computed concurrently and returned in input
    // order. A failing or slow symbol never affects the others.
    std::vector<SymbolReport> getBatch();
    std::vector<SymbolReport> getBatch(const std::vector<std::string>& symbols);

    const EngineConfig& config() const { return config_; }
    size_t bufferedEvents(const std::string& symbol) const;

    // Signal journal rows written (one per symbol, generation and direction)
    std::uint64_t signalsJournaled() const;

private:
    SymbolReport buildReport(const std::string& symbol);
    void refreshIfDue(const std::string& symbol);
    double cycleIntervalSec() const;
    bool isConfiguredSymbol(const std::string& symbol) const;
    void journalSignal(const SymbolReport& report);

    EngineConfig config_;
    RefreshScheduler::ClockFn clock_;
    RefreshScheduler scheduler_;
    ClusterStore store_;
    liquidation::LiquidationEventStore events_;
    liquidation::ClusterBuilder predictive_builder_;
    liquidation::ClusterBuilder reactive_builder_;
    strategy::SignalGenerator signal_generator_;
    strategy::LevelAnalyzer level_analyzer_;

    std::atomic<bool> running_;
    std::unique_ptr<std::thread> worker_thread_;

    std::mutex callback_mutex_;
    CycleCallback cycle_callback_;

    mutable std::mutex journal_mutex_;
    std::map<std::string, std::pair<std::uint64_t, Direction>> journaled_;
    std::uint64_t signals_journaled_ = 0;
};

} // namespace engine
} // namespace liqhunter
