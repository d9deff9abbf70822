#include "backtest/CostModel.h"

#include <cassert>
#include <cmath>
#include <iostream>

using replaylab::Bar;
using replaylab::SizingPolicy;
using replaylab::backtest::CostModel;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}
}

int main() {
    // stop levels sit on the adverse side of the entry
    {
        assert(near(CostModel::stopLevel(1, 100.0, 0.05), 95.0));
        assert(near(CostModel::stopLevel(-1, 100.0, 0.05), 105.0));
        assert(near(CostModel::stopLevel(1, 250.0, 0.02), 245.0));
    }

    // long stops on the low, short stops on the high, touching counts
    {
        const Bar long_hit(0, 100, 101, 95.0, 97, 1);
        const Bar long_miss(0, 100, 101, 95.01, 97, 1);
        assert(CostModel::isStopTriggered(1, 95.0, long_hit));
        assert(!CostModel::isStopTriggered(1, 95.0, long_miss));

        const Bar short_hit(0, 100, 105.0, 99, 103, 1);
        const Bar short_miss(0, 100, 104.99, 99, 103, 1);
        assert(CostModel::isStopTriggered(-1, 105.0, short_hit));
        assert(!CostModel::isStopTriggered(-1, 105.0, short_miss));

        assert(!CostModel::isStopTriggered(0, 95.0, long_hit));
    }

    // commission and pnl
    {
        assert(near(CostModel::commission(100.0, 2.0, 0.001), 0.2));
        assert(near(CostModel::commission(100.0, 2.0, 0.0), 0.0));
        assert(near(CostModel::pnl(100.0, 105.0, 1, 2.0), 10.0));
        assert(near(CostModel::pnl(100.0, 105.0, -1, 2.0), -10.0));
        assert(near(CostModel::pnl(100.0, 90.0, -1, 3.0), 30.0));
        assert(near(CostModel::unrealizedPnl(0, 100.0, 150.0, 5.0), 0.0));
        assert(near(CostModel::unrealizedPnl(1, 100.0, 101.0, 5.0), 5.0));
    }

    // sizing
    {
        const double fixed = CostModel::positionSize(SizingPolicy::FIXED_INITIAL, 0.95, 10000.0, 12000.0, 100.0);
        assert(near(fixed, 95.0));

        const double compounding = CostModel::positionSize(SizingPolicy::COMPOUNDING, 0.95, 10000.0, 12000.0, 100.0);
        assert(near(compounding, 114.0));

        assert(CostModel::positionSize(SizingPolicy::FIXED_INITIAL, 0.95, 10000.0, 10000.0, 0.0) == 0.0);
        assert(CostModel::positionSize(SizingPolicy::COMPOUNDING, 0.95, 10000.0, -5.0, 100.0) == 0.0);
    }

    // same inputs, same outputs
    {
        for (int i = 0; i < 3; ++i) {
            assert(CostModel::stopLevel(1, 123.456, 0.0375) == CostModel::stopLevel(1, 123.456, 0.0375));
            assert(CostModel::commission(123.456, 7.89, 0.0015) == CostModel::commission(123.456, 7.89, 0.0015));
        }
    }

    std::cout << "[TEST] CostModel PASSED\n";
    return 0;
}
