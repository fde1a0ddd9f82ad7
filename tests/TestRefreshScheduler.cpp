#include "engine/RefreshScheduler.h"
#include "network/BinanceFuturesClient.h"
#include "network/IHttpClient.h"
#include "network/IMarketDataSource.h"
#include "network/RateLimiter.h"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace liqhunter;
using liqhunter::engine::DataKind;
using liqhunter::engine::EngineConfig;
using liqhunter::engine::RefreshScheduler;

namespace {

class FakeSource : public network::IMarketDataSource {
public:
    std::atomic<int> price_calls{0};
    std::atomic<int> oi_calls{0};
    std::atomic<int> failures_left{0};     // 앞으로 실패할 호출 수
    std::atomic<bool> always_fail{false};
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    int delay_ms = 0;
    double price = 100.0;
    TimestampMs price_ts = 1000;

    PriceSnapshot fetchPrice(const std::string& symbol) override {
        ++price_calls;
        const int now_in_flight = ++in_flight;
        int prev = max_in_flight.load();
        while (now_in_flight > prev && !max_in_flight.compare_exchange_weak(prev, now_in_flight)) {}
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
        --in_flight;

        maybeFail(symbol);
        PriceSnapshot s;
        s.symbol = symbol;
        s.price = price;
        s.timestamp_ms = price_ts;
        return s;
    }

    OpenInterestSnapshot fetchOpenInterest(const std::string& symbol, Price) override {
        ++oi_calls;
        maybeFail(symbol);
        OpenInterestSnapshot s;
        s.symbol = symbol;
        s.total_oi = 1e6;
        s.timestamp_ms = price_ts;
        return s;
    }

private:
    void maybeFail(const std::string& symbol) {
        if (always_fail) {
            throw std::runtime_error("upstream timeout for " + symbol);
        }
        if (failures_left > 0) {
            --failures_left;
            throw std::runtime_error("transient failure for " + symbol);
        }
    }
};

// Binance REST 응답 흉내 + 요청 수 집계
class CountingHttpClient : public network::IHttpClient {
public:
    std::atomic<int> requests{0};

    network::HttpResponse get(const std::string& endpoint, const std::map<std::string, std::string>&) override {
        ++requests;
        network::HttpResponse response;
        response.status_code = 200;
        if (endpoint == "/fapi/v1/ticker/price") {
            response.body = R"({"symbol":"BTCUSDT","price":"100.0","time":1000})";
        } else if (endpoint == "/fapi/v1/openInterest") {
            response.body = R"({"symbol":"BTCUSDT","openInterest":"500","time":1001})";
        } else if (endpoint == "/fapi/v1/depth") {
            response.body = R"({"bids":[["100","10"]],"asks":[["101","10"]]})";
        } else {
            response.status_code = 404;
        }
        return response;
    }
};

EngineConfig testConfig() {
    EngineConfig config;
    config.price_ttl_sec = 1.5;
    config.open_interest_ttl_sec = 15.0;
    config.cluster_ttl_sec = 5.0;
    config.stale_ceiling_sec = 120.0;
    config.jitter_fraction = 0.0;
    config.rate_limit_per_sec = 1000.0;
    config.rate_limit_burst = 1000;
    config.max_retries = 1;
    return config;
}

} // namespace

int main() {
    {
        auto source = std::make_shared<FakeSource>();
        TimestampMs now = 1000000;
        RefreshScheduler scheduler(source, testConfig(), [&now]() { return now; });

        auto first = scheduler.getPrice("BTCUSDT");
        assert(first.value && first.value->price == 100.0);
        assert(first.status == DataStatus::FRESH);
        assert(first.refreshed);
        assert(source->price_calls == 1);

        // TTL 내 => 캐시, 외부 호출 없음
        now += 1000;
        auto cached = scheduler.getPrice("BTCUSDT");
        assert(!cached.refreshed);
        assert(cached.status == DataStatus::FRESH);
        assert(source->price_calls == 1);

        // 만료 => 동기 갱신
        now += 600;
        auto refreshed = scheduler.getPrice("BTCUSDT");
        assert(refreshed.refreshed);
        assert(source->price_calls == 2);

        // 실패 => 1회 재시도 후 이전 값 제공
        source->always_fail = true;
        now += 2000;
        auto failed = scheduler.getPrice("BTCUSDT");
        assert(source->price_calls == 4);
        assert(failed.value && failed.value->price == 100.0);
        assert(failed.status == DataStatus::FRESH);
        assert(!failed.error.empty());

        // 하드 상한 초과 => STALE
        now += 200 * 1000;
        auto stale = scheduler.getPrice("BTCUSDT");
        assert(stale.status == DataStatus::STALE);
        assert(stale.value);

        // 복구
        source->always_fail = false;
        auto recovered = scheduler.getPrice("BTCUSDT");
        assert(recovered.status == DataStatus::FRESH);
        assert(recovered.error.empty());
        assert(recovered.fetched_at_ms == now);
    }

    {
        // 캐시 없음 + 실패 => UNAVAILABLE
        auto source = std::make_shared<FakeSource>();
        source->always_fail = true;
        TimestampMs now = 5000;
        RefreshScheduler scheduler(source, testConfig(), [&now]() { return now; });
        auto result = scheduler.getOpenInterest("ETHUSDT", 2000.0);
        assert(result.status == DataStatus::UNAVAILABLE);
        assert(!result.value);
        assert(source->oi_calls == 2);
        assert(scheduler.upstreamCalls() == 2);

        auto peek = scheduler.peekOpenInterest("ETHUSDT");
        assert(peek.status == DataStatus::UNAVAILABLE);
        assert(source->oi_calls == 2);
    }

    {
        // 첫 시도 실패, 재시도 성공
        auto source = std::make_shared<FakeSource>();
        source->failures_left = 1;
        TimestampMs now = 5000;
        RefreshScheduler scheduler(source, testConfig(), [&now]() { return now; });
        auto result = scheduler.getOpenInterest("SOLUSDT", 150.0);
        assert(result.status == DataStatus::FRESH);
        assert(result.value && result.value->total_oi == 1e6);
        assert(source->oi_calls == 2);
    }

    {
        // 지터: 첫 캐시 시 1회, 상한 = fraction x TTL
        auto source = std::make_shared<FakeSource>();
        EngineConfig config = testConfig();
        config.jitter_fraction = 0.1;
        config.jitter_seed = 42;
        TimestampMs now = 0;
        RefreshScheduler scheduler(source, config, [&now]() { return now; });

        std::set<double> jitters;
        for (int i = 0; i < 10; ++i) {
            const std::string symbol = "SYM" + std::to_string(i);
            assert(scheduler.jitterSec(symbol, DataKind::PRICE) == 0.0);
            scheduler.getPrice(symbol);
            const double jitter = scheduler.jitterSec(symbol, DataKind::PRICE);
            assert(jitter >= 0.0 && jitter <= 0.15);
            assert(scheduler.effectiveTtlSec(symbol, DataKind::PRICE) >= 1.5);
            assert(scheduler.effectiveTtlSec(symbol, DataKind::PRICE) <= 1.65);
            jitters.insert(jitter);
        }
        assert(jitters.size() > 1);

        const double before = scheduler.jitterSec("SYM0", DataKind::PRICE);
        now += 10 * 1000;
        scheduler.getPrice("SYM0");
        assert(scheduler.jitterSec("SYM0", DataKind::PRICE) == before);
    }

    {
        // push 가격 순서 보장
        auto source = std::make_shared<FakeSource>();
        TimestampMs now = 0;
        RefreshScheduler scheduler(source, testConfig(), [&now]() { return now; });

        PriceSnapshot newer{"BTCUSDT", 101.0, 2000};
        PriceSnapshot older{"BTCUSDT", 99.0, 1000};
        assert(scheduler.storePrice(newer));
        assert(!scheduler.storePrice(older));
        auto result = scheduler.getPrice("BTCUSDT");
        assert(result.value->price == 101.0);
        assert(source->price_calls == 0);

        // 만료 후 업스트림이 더 오래된 가격을 주면 캐시 유지
        source->price_ts = 500;
        now += 5000;
        auto after = scheduler.getPrice("BTCUSDT");
        assert(source->price_calls == 1);
        assert(after.value->price == 101.0);
        assert(after.value->timestamp_ms == 2000);
    }

    {
        // 클러스터 재계산 주기
        auto source = std::make_shared<FakeSource>();
        TimestampMs now = 0;
        RefreshScheduler scheduler(source, testConfig(), [&now]() { return now; });
        assert(scheduler.clustersDue("BTCUSDT"));
        scheduler.markClustersBuilt("BTCUSDT");
        assert(!scheduler.clustersDue("BTCUSDT"));
        now += 4999;
        assert(!scheduler.clustersDue("BTCUSDT"));
        now += 1;
        assert(scheduler.clustersDue("BTCUSDT"));
    }

    {
        // 같은 심볼 동시 접근 => 갱신은 한 번, 겹치지 않음
        auto source = std::make_shared<FakeSource>();
        source->delay_ms = 50;
        RefreshScheduler scheduler(source, testConfig(), []() { return TimestampMs(1000); });

        std::vector<std::thread> threads;
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back([&scheduler]() {
                auto r = scheduler.getPrice("BTCUSDT");
                assert(r.value);
            });
        }
        for (auto& t : threads) t.join();
        assert(source->price_calls == 1);
        assert(source->max_in_flight == 1);
    }

    {
        // HTTP 요청마다 토큰 1개 (OI 갱신 = openInterest + depth, 가격 재조회 없음)
        auto http = std::make_shared<CountingHttpClient>();
        auto limiter = std::make_shared<network::RateLimiter>(1000.0, 100);
        auto source = std::make_shared<network::BinanceFuturesClient>(http, limiter);
        TimestampMs now = 0;
        RefreshScheduler scheduler(source, testConfig(), [&now]() { return now; });

        auto price = scheduler.getPrice("BTCUSDT");
        assert(price.value && price.value->price == 100.0);
        assert(http->requests == 1);

        auto oi = scheduler.getOpenInterest("BTCUSDT", price.value->price);
        assert(oi.status == DataStatus::FRESH);
        assert(std::abs(oi.value->total_oi - 50000.0) < 1e-6);
        assert(http->requests == 3);
        assert(scheduler.upstreamCalls() == 2);
        assert(limiter->getStats().total_requests == http->requests);

        // 캐시 적중 => 요청도 토큰도 없음
        scheduler.getOpenInterest("BTCUSDT", price.value->price);
        assert(http->requests == 3);
        assert(limiter->getStats().total_requests == 3);
    }

    {
        // 공유 rate limiter => 토큰 대기 (실패 아님)
        auto http = std::make_shared<CountingHttpClient>();
        auto limiter = std::make_shared<network::RateLimiter>(20.0, 1);
        auto source = std::make_shared<network::BinanceFuturesClient>(http, limiter);
        TimestampMs now = 0;
        RefreshScheduler scheduler(source, testConfig(), [&now]() { return now; });

        const auto start = std::chrono::steady_clock::now();
        for (int i = 0; i < 5; ++i) {
            auto r = scheduler.getPrice("SYM" + std::to_string(i));
            assert(r.status == DataStatus::FRESH);
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start
        ).count();
        assert(elapsed >= 150);
        assert(http->requests == 5);
        assert(limiter->getStats().total_requests == 5);
        assert(limiter->getStats().forced_waits >= 1);
    }

    std::cout << "[TEST] RefreshScheduler PASSED\n";
    return 0;
}
