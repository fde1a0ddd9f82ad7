#include "network/RateLimiter.h"
#include "common/Config.h"
#include "common/Logger.h"

#include <algorithm>

namespace liqhunter {
namespace network {

RateLimiter::RateLimiter(double rate_per_second, int burst)
    : rate_per_second_(rate_per_second)
    , burst_(static_cast<double>(burst))
    , tokens_(static_cast<double>(burst))
    , last_refill_(Clock::now())
    , total_requests_(0)
    , rejected_requests_(0)
    , forced_waits_(0)
    , total_wait_time_(std::chrono::milliseconds(0))
    , is_blocked_(false)
{
    if (!(rate_per_second_ > 0.0)) {
        throw common::ConfigError("rate limit must be > 0 calls/second");
    }
    if (burst < 1) {
        throw common::ConfigError("rate limit burst must be >= 1");
    }
    LOG_INFO("RateLimiter 초기화 - {:.1f} calls/s, burst {}", rate_per_second_, burst);
}

void RateLimiter::refill(Clock::time_point now) {
    const double elapsed = std::chrono::duration<double>(now - last_refill_).count();
    if (elapsed > 0.0) {
        tokens_ = std::min(burst_, tokens_ + elapsed * rate_per_second_);
        last_refill_ = now;
    }
}

bool RateLimiter::tryAcquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto now = Clock::now();

    if (is_blocked_) {
        if (now < block_end_time_) {
            rejected_requests_++;
            return false;
        }
        is_blocked_ = false;
        cv_.notify_all();
    }

    refill(now);
    if (tokens_ >= 1.0) {
        tokens_ -= 1.0;
        total_requests_++;
        return true;
    }

    rejected_requests_++;
    return false;
}

void RateLimiter::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto wait_start = Clock::now();
    bool waited = false;

    while (true) {
        // 1. 차단 상태면 풀릴 때까지 대기
        if (is_blocked_) {
            if (Clock::now() < block_end_time_) {
                waited = true;
                cv_.wait_until(lock, block_end_time_);
                continue;
            }
            is_blocked_ = false;
        }

        // 2. 토큰 확인
        auto now = Clock::now();
        refill(now);
        if (tokens_ >= 1.0) {
            tokens_ -= 1.0;
            total_requests_++;
            break;
        }

        // 3. 다음 토큰이 생길 시점까지 대기
        const double missing = 1.0 - tokens_;
        const auto wake_time = now + std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(missing / rate_per_second_)
        );
        waited = true;
        cv_.wait_until(lock, wake_time);
    }

    if (waited) {
        forced_waits_++;
        total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - wait_start
        );
    }
}

void RateLimiter::handleRateLimitError(int status_code) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (status_code == 429) {
        LOG_WARN("429 Too Many Requests - 1초간 전체 일시정지");
        is_blocked_ = true;
        block_end_time_ = std::max(block_end_time_, Clock::now() + std::chrono::seconds(1));
        tokens_ = 0.0;
    } else if (status_code == 418) {
        LOG_ERROR("418 IP 차단 감지 - 1분간 전체 정지");
        is_blocked_ = true;
        block_end_time_ = std::max(block_end_time_, Clock::now() + std::chrono::minutes(1));
        tokens_ = 0.0;
    }
    cv_.notify_all();
}

double RateLimiter::availableTokens() {
    std::unique_lock<std::mutex> lock(mutex_);
    refill(Clock::now());
    return tokens_;
}

RateLimiter::Stats RateLimiter::getStats() const {
    std::unique_lock<std::mutex> lock(mutex_);

    Stats stats;
    stats.total_requests = total_requests_;
    stats.rejected_requests = rejected_requests_;
    stats.forced_waits = forced_waits_;
    stats.total_wait_time = total_wait_time_;

    return stats;
}

} // namespace network
} // namespace liqhunter
