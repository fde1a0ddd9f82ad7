#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "common/Types.h"

namespace liqhunter {
namespace liquidation {

// Fixed-capacity FIFO ring of raw liquidation events for one symbol.
// append() and snapshot() may be called from different threads.
class LiquidationEventBuffer {
public:
    explicit LiquidationEventBuffer(size_t capacity);

    // Returns false if the event was rejected (non-positive price/notional).
    bool append(const RawLiquidationEvent& event);

    // Copy of the current contents, oldest first.
    std::vector<RawLiquidationEvent> snapshot() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    std::uint64_t evictedCount() const;

private:
    const size_t capacity_;
    std::vector<RawLiquidationEvent> ring_;
    size_t head_ = 0;   // next write position
    size_t count_ = 0;
    std::uint64_t evicted_ = 0;
    mutable std::mutex mutex_;
};

// 심볼별 버퍼 모음
class LiquidationEventStore {
public:
    explicit LiquidationEventStore(size_t capacity_per_symbol);

    bool append(const RawLiquidationEvent& event);
    std::vector<RawLiquidationEvent> snapshot(const std::string& symbol) const;
    size_t size(const std::string& symbol) const;

private:
    std::shared_ptr<LiquidationEventBuffer> find(const std::string& symbol) const;

    const size_t capacity_per_symbol_;
    std::map<std::string, std::shared_ptr<LiquidationEventBuffer>> buffers_;
    mutable std::mutex mutex_;
};

} // namespace liquidation
} // namespace liqhunter
