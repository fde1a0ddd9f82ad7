#pragma once

#include <chrono>
#include <mutex>
#include <condition_variable>

namespace liqhunter {
namespace network {

// Token-bucket rate limiter shared by every outbound market-data call.
// acquire() waits for a token instead of failing (Thread-Safe).
class RateLimiter {
public:
    // rate_per_second tokens are added per second, up to burst.
    RateLimiter(double rate_per_second, int burst);

    // 토큰이 없으면 false (Non-blocking)
    bool tryAcquire();

    // 토큰이 생길 때까지 대기 (Blocking)
    void acquire();

    // 429 => pause everyone for 1s, 418 (IP ban) => 1 min
    void handleRateLimitError(int status_code);

    double availableTokens();

    struct Stats {
        int total_requests;
        int rejected_requests;
        int forced_waits;
        std::chrono::milliseconds total_wait_time;
    };
    Stats getStats() const;

private:
    using Clock = std::chrono::steady_clock;

    void refill(Clock::time_point now);

    const double rate_per_second_;
    const double burst_;
    double tokens_;
    Clock::time_point last_refill_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    int total_requests_;
    int rejected_requests_;
    int forced_waits_;
    std::chrono::milliseconds total_wait_time_;

    bool is_blocked_;
    Clock::time_point block_end_time_;
};

} // namespace network
} // namespace liqhunter
