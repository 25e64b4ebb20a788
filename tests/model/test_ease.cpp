#include <gtest/gtest.h>
#include "model/ease.h"

namespace heatcast {
namespace test {

TEST(EaseInOutCubic, Endpoints) {
    EXPECT_DOUBLE_EQ(easeInOutCubic(0.0), 0.0);
    EXPECT_DOUBLE_EQ(easeInOutCubic(1.0), 1.0);
}

TEST(EaseInOutCubic, Midpoint) {
    EXPECT_DOUBLE_EQ(easeInOutCubic(0.5), 0.5);
}

TEST(EaseInOutCubic, LowerHalfIsFourXCubed) {
    for (double x : {0.0, 0.05, 0.1, 0.25, 0.333, 0.4, 0.49, 0.4999}) {
        EXPECT_DOUBLE_EQ(easeInOutCubic(x), 4.0 * x * x * x) << "x=" << x;
    }
}

TEST(EaseInOutCubic, UpperHalfMirrorsLowerHalf) {
    // ease(1 - x) == 1 - ease(x)
    for (double x : {0.1, 0.2, 0.3, 0.45}) {
        EXPECT_NEAR(easeInOutCubic(1.0 - x), 1.0 - easeInOutCubic(x), 1e-12) << "x=" << x;
    }
}

TEST(EaseInOutCubic, MonotonicOnUnitInterval) {
    double prev = easeInOutCubic(0.0);
    for (int i = 1; i <= 1000; ++i) {
        const double x = static_cast<double>(i) / 1000.0;
        const double y = easeInOutCubic(x);
        EXPECT_GE(y, prev) << "x=" << x;
        EXPECT_GE(y, 0.0);
        EXPECT_LE(y, 1.0);
        prev = y;
    }
}

TEST(EaseInOutCubic, FlatNearEndsSteepInMiddle) {
    const double h = 0.01;
    const double slope_low  = (easeInOutCubic(h) - easeInOutCubic(0.0)) / h;
    const double slope_mid  = (easeInOutCubic(0.5 + h) - easeInOutCubic(0.5 - h)) / (2 * h);
    const double slope_high = (easeInOutCubic(1.0) - easeInOutCubic(1.0 - h)) / h;
    EXPECT_LT(slope_low, 0.01);
    EXPECT_LT(slope_high, 0.01);
    EXPECT_GT(slope_mid, 2.9);
}

}  // namespace test
}  // namespace heatcast
