#include "liquidation/LiquidationEventBuffer.h"
#include "common/Config.h"

#include <cmath>

namespace liqhunter {
namespace liquidation {

LiquidationEventBuffer::LiquidationEventBuffer(size_t capacity)
    : capacity_(capacity)
{
    if (capacity_ == 0) {
        throw common::ConfigError("liquidation buffer capacity must be > 0");
    }
    ring_.resize(capacity_);
}

bool LiquidationEventBuffer::append(const RawLiquidationEvent& event) {
    if (!std::isfinite(event.price) || event.price <= 0.0 ||
        !std::isfinite(event.notional) || event.notional <= 0.0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ring_[head_] = event;
    head_ = (head_ + 1) % capacity_;
    if (count_ < capacity_) {
        ++count_;
    } else {
        ++evicted_;
    }
    return true;
}

std::vector<RawLiquidationEvent> LiquidationEventBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<RawLiquidationEvent> out;
    out.reserve(count_);
    const size_t start = (head_ + capacity_ - count_) % capacity_;
    for (size_t i = 0; i < count_; ++i) {
        out.push_back(ring_[(start + i) % capacity_]);
    }
    return out;
}

size_t LiquidationEventBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

std::uint64_t LiquidationEventBuffer::evictedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evicted_;
}

LiquidationEventStore::LiquidationEventStore(size_t capacity_per_symbol)
    : capacity_per_symbol_(capacity_per_symbol)
{
    if (capacity_per_symbol_ == 0) {
        throw common::ConfigError("liquidation buffer capacity must be > 0");
    }
}

bool LiquidationEventStore::append(const RawLiquidationEvent& event) {
    if (event.symbol.empty()) {
        return false;
    }

    std::shared_ptr<LiquidationEventBuffer> buffer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = buffers_[event.symbol];
        if (!slot) {
            slot = std::make_shared<LiquidationEventBuffer>(capacity_per_symbol_);
        }
        buffer = slot;
    }
    return buffer->append(event);
}

std::vector<RawLiquidationEvent> LiquidationEventStore::snapshot(const std::string& symbol) const {
    auto buffer = find(symbol);
    return buffer ? buffer->snapshot() : std::vector<RawLiquidationEvent>{};
}

size_t LiquidationEventStore::size(const std::string& symbol) const {
    auto buffer = find(symbol);
    return buffer ? buffer->size() : 0;
}

std::shared_ptr<LiquidationEventBuffer> LiquidationEventStore::find(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buffers_.find(symbol);
    return it == buffers_.end() ? nullptr : it->second;
}

} // namespace liquidation
} // namespace liqhunter
