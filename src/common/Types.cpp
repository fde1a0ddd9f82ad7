#include "common/Types.h"

namespace liqhunter {

const char* toString(PositionSide side) {
    return side == PositionSide::LONG ? "long" : "short";
}

const char* toString(Direction direction) {
    switch (direction) {
        case Direction::LONG: return "LONG";
        case Direction::SHORT: return "SHORT";
        case Direction::NEUTRAL: return "NEUTRAL";
    }
    return "NEUTRAL";
}

const char* toString(ClusterMode mode) {
    return mode == ClusterMode::PREDICTIVE ? "predictive" : "reactive";
}

const char* toString(DataStatus status) {
    switch (status) {
        case DataStatus::FRESH: return "fresh";
        case DataStatus::STALE: return "stale";
        case DataStatus::UNAVAILABLE: return "unavailable";
    }
    return "unavailable";
}

} // namespace liqhunter
