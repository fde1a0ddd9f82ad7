#pragma once

#include <atomic>

#include "engine/LiquidationEngine.h"

namespace liqhunter {
namespace engine {

// 녹화된 forceOrder 스트림 재생 (한 줄에 JSON 하나)
//
// Reads fd until EOF or until stop is set, checked every 200ms while idle.
// Each parsed event goes through engine.ingestLiquidation; a partial last
// line is parsed at EOF and dropped on stop. Returns the accepted count.
int replayEvents(int fd, LiquidationEngine& engine, const std::atomic<bool>& stop);

} // namespace engine
} // namespace liqhunter
