#include "engine/LiquidationEngine.h"
#include "common/Config.h"
#include "common/Logger.h"
#include "liquidation/LevelDistributor.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <stdexcept>

namespace liqhunter {
namespace engine {

namespace {
DataStatus worse(DataStatus a, DataStatus b) {
    auto rank = [](DataStatus s) {
        switch (s) {
            case DataStatus::FRESH: return 0;
            case DataStatus::STALE: return 1;
            case DataStatus::UNAVAILABLE: return 2;
        }
        return 2;
    };
    return rank(a) >= rank(b) ? a : b;
}
}

LiquidationEngine::LiquidationEngine(
    const EngineConfig& config,
    std::shared_ptr<network::IMarketDataSource> source,
    RefreshScheduler::ClockFn clock
)
    : config_(config)
    , clock_(clock ? clock : RefreshScheduler::ClockFn(nowMs))
    , scheduler_(std::move(source), config, clock_)
    , store_(config.reactive_cluster.bucket_width_pct,
             static_cast<TimestampMs>(config.reactive.lookback_sec * 1000.0))
    , events_(static_cast<size_t>(std::max(0, config.reactive.buffer_capacity)))
    , predictive_builder_(config.predictive_cluster)
    , reactive_builder_(config.reactive_cluster)
    , signal_generator_(config.signal)
    , level_analyzer_(config.levels, config.sentiment)
    , running_(false)
{
    Config::validate(config_);

    LOG_INFO("LiquidationEngine 초기화 - mode: {}, symbols: {}",
             toString(config_.mode), config_.symbols.size());
}

LiquidationEngine::~LiquidationEngine() {
    stop();
}

// ===== 엔진 제어 =====

bool LiquidationEngine::start() {
    if (running_) {
        LOG_WARN("엔진이 이미 실행 중입니다");
        return false;
    }

    LOG_INFO("========================================");
    LOG_INFO("청산 클러스터 엔진 시작");
    LOG_INFO("========================================");

    running_ = true;
    worker_thread_ = std::make_unique<std::thread>(&LiquidationEngine::run, this);
    return true;
}

void LiquidationEngine::stop() {
    if (!running_) {
        return;
    }

    LOG_INFO("========================================");
    LOG_INFO("청산 클러스터 엔진 중지");
    LOG_INFO("========================================");

    running_ = false;

    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
}

void LiquidationEngine::setCycleCallback(CycleCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cycle_callback_ = std::move(callback);
}

double LiquidationEngine::cycleIntervalSec() const {
    return config_.mode == ClusterMode::REACTIVE ? config_.reactive_rebuild_sec : config_.cluster_ttl_sec;
}

// ===== 메인 루프 =====

void LiquidationEngine::run() {
    LOG_INFO("재계산 루프 시작 (주기 {:.1f}s)", cycleIntervalSec());

    const auto cycle_interval = std::chrono::milliseconds(
        static_cast<long long>(cycleIntervalSec() * 1000.0)
    );
    const auto poll_interval = std::chrono::milliseconds(100);
    auto last_cycle = std::chrono::steady_clock::now() - cycle_interval;

    while (running_) {
        const auto now = std::chrono::steady_clock::now();
        if (now - last_cycle >= cycle_interval) {
            last_cycle = now;

            auto batch = getBatch();

            CycleCallback callback;
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                callback = cycle_callback_;
            }
            if (callback) {
                try {
                    callback(batch);
                } catch (const std::exception& e) {
                    LOG_ERROR("cycle callback 실패: {}", e.what());
                }
            }
        }

        std::this_thread::sleep_for(poll_interval);
    }

    LOG_INFO("재계산 루프 종료");
}

// ===== 입력 =====

bool LiquidationEngine::ingestPrice(const PriceSnapshot& snapshot) {
    if (!std::isfinite(snapshot.price) || snapshot.price <= 0.0) {
        LOG_WARN("[{}] 잘못된 가격 무시: {}", snapshot.symbol, snapshot.price);
        return false;
    }
    if (!scheduler_.storePrice(snapshot)) {
        LOG_DEBUG("[{}] out-of-order price rejected (ts {})", snapshot.symbol, snapshot.timestamp_ms);
        return false;
    }
    store_.applyPrice(snapshot.symbol, snapshot.price, clock_());
    return true;
}

bool LiquidationEngine::isConfiguredSymbol(const std::string& symbol) const {
    return std::find(config_.symbols.begin(), config_.symbols.end(), symbol) != config_.symbols.end();
}

bool LiquidationEngine::ingestLiquidation(const RawLiquidationEvent& event) {
    // 구독 심볼만 버퍼 생성 (전체 시장 스트림 재생 시 메모리 보호)
    if (event.symbol.empty() || !isConfiguredSymbol(event.symbol)) {
        return false;
    }
    return events_.append(event);
}

size_t LiquidationEngine::bufferedEvents(const std::string& symbol) const {
    return events_.size(symbol);
}

// ===== 계산 =====

DataStatus LiquidationEngine::recompute(const std::string& symbol) {
    const auto price = scheduler_.getPrice(symbol);
    if (!price.value) {
        LOG_WARN("[{}] 가격 없음 - 클러스터 재계산 생략 ({})", symbol, price.error);
        return DataStatus::UNAVAILABLE;
    }

    const TimestampMs now_ms = clock_();
    const Price current = price.value->price;
    DataStatus status = price.status;

    std::vector<Cluster> clusters;
    TimestampMs data_as_of = price.value->timestamp_ms;

    if (config_.mode == ClusterMode::PREDICTIVE) {
        const auto oi = scheduler_.getOpenInterest(symbol, current);
        if (!oi.value) {
            LOG_WARN("[{}] OI 없음 - 클러스터 재계산 생략 ({})", symbol, oi.error);
            return DataStatus::UNAVAILABLE;
        }
        status = worse(status, oi.status);
        data_as_of = std::min(data_as_of, oi.value->timestamp_ms);

        const auto level_set = liquidation::LevelDistributor::distributePredictive(
            *price.value, *oi.value, config_.leverage
        );
        clusters = predictive_builder_.build(level_set, now_ms);
    } else {
        // 교차 판정이 먼저 (소진 구간 기록 후 재빌드)
        store_.applyPrice(symbol, current, now_ms);

        const auto events = events_.snapshot(symbol);
        const auto level_set = liquidation::LevelDistributor::distributeReactive(
            symbol, current, events, now_ms, config_.reactive
        );
        clusters = reactive_builder_.build(level_set, now_ms);
        if (events.empty()) {
            status = worse(status, DataStatus::UNAVAILABLE);
        }
    }

    const auto generation = store_.publish(symbol, config_.mode, current, std::move(clusters), data_as_of, now_ms);
    scheduler_.markClustersBuilt(symbol);
    LOG_DEBUG("[{}] recompute done, generation {} ({})", symbol, generation, toString(status));
    return status;
}

void LiquidationEngine::refreshIfDue(const std::string& symbol) {
    if (scheduler_.clustersDue(symbol)) {
        recompute(symbol);
    }
}

std::vector<Cluster> LiquidationEngine::getClusters(const std::string& symbol) {
    refreshIfDue(symbol);
    const auto price = scheduler_.getPrice(symbol);
    return store_.clustersAt(symbol, price.value ? price.value->price : 0.0);
}

Signal LiquidationEngine::getSignal(const std::string& symbol) {
    return getReport(symbol).signal;
}

SymbolReport LiquidationEngine::buildReport(const std::string& symbol) {
    SymbolReport report;
    report.symbol = symbol;
    report.mode = config_.mode;
    report.generated_at_ms = clock_();

    const auto price = scheduler_.getPrice(symbol);
    if (!price.value) {
        report.status = DataStatus::UNAVAILABLE;
        report.error = price.error.empty() ? "no price" : price.error;
        report.signal = strategy::SignalGenerator::neutral(symbol, 0.0, "No price data");
        return report;
    }

    const DataStatus build_status = scheduler_.clustersDue(symbol) ? recompute(symbol) : DataStatus::FRESH;

    const Price current = price.value->price;
    report.current_price = current;
    report.status = worse(price.status, build_status);
    const auto oi = scheduler_.peekOpenInterest(symbol);
    if (config_.mode == ClusterMode::PREDICTIVE) {
        report.status = worse(report.status, oi.status);
    } else if (events_.size(symbol) == 0) {
        report.status = worse(report.status, DataStatus::UNAVAILABLE);
    }

    const auto generation = store_.latest(symbol);
    if (!generation) {
        report.status = DataStatus::UNAVAILABLE;
        report.signal = strategy::SignalGenerator::neutral(symbol, current, "No cluster data");
        return report;
    }

    report.generation = generation->generation;
    report.data_age_ms = std::max<TimestampMs>(0, report.generated_at_ms - generation->data_as_of_ms);
    report.clusters = store_.clustersAt(symbol, current);

    report.signal = signal_generator_.generate(symbol, current, report.clusters);
    report.signal_long = signal_generator_.evaluateDirection(symbol, current, report.clusters, Direction::LONG);
    report.signal_short = signal_generator_.evaluateDirection(symbol, current, report.clusters, Direction::SHORT);

    report.levels = level_analyzer_.supportResistance(current, report.clusters);

    report.sentiment = level_analyzer_.analyzeSentiment(oi.value);

    journalSignal(report);
    return report;
}

// 세대 x 방향당 한 번만 기록 (배치 + 온디맨드 중복 방지)
void LiquidationEngine::journalSignal(const SymbolReport& report) {
    const auto& signal = report.signal;
    if (signal.direction == Direction::NEUTRAL) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(journal_mutex_);
        const auto key = std::make_pair(report.generation, signal.direction);
        auto it = journaled_.find(report.symbol);
        if (it != journaled_.end() && it->second == key) {
            return;
        }
        journaled_[report.symbol] = key;
        ++signals_journaled_;
    }
    Logger::getInstance().logSignal(
        report.symbol, toString(signal.direction),
        signal.entry.value_or(0.0),
        signal.stop_loss.value_or(0.0),
        signal.take_profit.value_or(0.0),
        signal.confidence,
        signal.risk_reward.value_or(0.0)
    );
}

std::uint64_t LiquidationEngine::signalsJournaled() const {
    std::lock_guard<std::mutex> lock(journal_mutex_);
    return signals_journaled_;
}

SymbolReport LiquidationEngine::getReport(const std::string& symbol) {
    // 심볼 경계에서 실패 격리
    try {
        return buildReport(symbol);
    } catch (const std::exception& e) {
        LOG_WARN("[{}] report 실패, NEUTRAL 반환: {}", symbol, e.what());

        SymbolReport report;
        report.symbol = symbol;
        report.mode = config_.mode;
        report.status = DataStatus::UNAVAILABLE;
        report.generated_at_ms = clock_();
        report.error = e.what();
        report.signal = strategy::SignalGenerator::neutral(symbol, 0.0, std::string("Unavailable: ") + e.what());
        return report;
    }
}

std::vector<SymbolReport> LiquidationEngine::getBatch() {
    return getBatch(config_.symbols);
}

std::vector<SymbolReport> LiquidationEngine::getBatch(const std::vector<std::string>& symbols) {
    // 심볼별 동시 계산; 느린 심볼은 자기 슬롯만 늦춤
    std::vector<std::future<SymbolReport>> pending;
    pending.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        pending.push_back(std::async(std::launch::async, [this, symbol]() {
            return getReport(symbol);
        }));
    }

    std::vector<SymbolReport> batch;
    batch.reserve(symbols.size());
    for (auto& report : pending) {
        batch.push_back(report.get());
    }
    return batch;
}

} // namespace engine
} // namespace liqhunter
