#include "liquidation/LeverageCalculator.h"
#include "common/Config.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using liqhunter::PositionSide;
using liqhunter::liquidation::LeverageCalculator;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

bool rejects(const std::vector<double>& tiers) {
    try {
        LeverageCalculator::validateTiers(tiers);
    } catch (const liqhunter::common::ConfigError&) {
        return true;
    }
    return false;
}
}

int main() {
    {
        assert(near(LeverageCalculator::longLiquidationPrice(100.0, 10.0), 90.0));
        assert(near(LeverageCalculator::shortLiquidationPrice(100.0, 10.0), 110.0));
        assert(near(LeverageCalculator::longLiquidationPrice(100.0, 100.0), 99.0));
        assert(near(LeverageCalculator::shortLiquidationPrice(100.0, 100.0), 101.0));
        assert(near(LeverageCalculator::liquidationPrice(50000.0, 25.0, PositionSide::LONG), 48000.0, 1e-6));
        assert(near(LeverageCalculator::liquidationPrice(50000.0, 25.0, PositionSide::SHORT), 52000.0, 1e-6));
    }

    {
        // 고레버리지일수록 현재가에 가깝다
        const double tiers[] = {100.0, 50.0, 25.0, 10.0, 5.0};
        double prev_long_gap = 0.0;
        double prev_short_gap = 0.0;
        for (double leverage : tiers) {
            const double long_gap = 100.0 - LeverageCalculator::longLiquidationPrice(100.0, leverage);
            const double short_gap = LeverageCalculator::shortLiquidationPrice(100.0, leverage) - 100.0;
            assert(long_gap > prev_long_gap);
            assert(short_gap > prev_short_gap);
            prev_long_gap = long_gap;
            prev_short_gap = short_gap;
        }
    }

    {
        LeverageCalculator::validateTiers({100.0, 50.0, 25.0, 10.0, 5.0});
        LeverageCalculator::validateTiers({1.5});

        assert(rejects({}));
        assert(rejects({1.0}));
        assert(rejects({100.0, 0.5}));
        assert(rejects({-10.0}));
        assert(rejects({std::numeric_limits<double>::quiet_NaN()}));
        assert(rejects({std::numeric_limits<double>::infinity()}));
    }

    std::cout << "[TEST] LeverageCalculator PASSED\n";
    return 0;
}
