// test_coord_gtest.cpp - Percentage to device coordinate conversion

#include <gtest/gtest.h>
#include "../deck/coord.hpp"

using namespace deck;

TEST(CoordTest, PercentOfMeasure) {
    EXPECT_DOUBLE_EQ(pct(50, 792), 396);
    EXPECT_DOUBLE_EQ(pct(0, 792), 0);
    EXPECT_DOUBLE_EQ(pct(100, 612), 612);
}

TEST(CoordTest, DeviceYIsFlipped) {
    EXPECT_DOUBLE_EQ(device_y(0, 612), 612);
    EXPECT_DOUBLE_EQ(device_y(100, 612), 0);
    EXPECT_DOUBLE_EQ(device_y(75, 612), 153);
    EXPECT_DOUBLE_EQ(device_x(75, 792), 594);
}

TEST(CoordTest, ValuesOutsideRangeExtrapolate) {
    EXPECT_DOUBLE_EQ(device_x(-10, 1000), -100);
    EXPECT_DOUBLE_EQ(device_x(150, 1000), 1500);
    EXPECT_DOUBLE_EQ(device_y(110, 1000), -100);
    EXPECT_DOUBLE_EQ(device_y(-10, 1000), 1100);
}

TEST(CoordTest, InverseY) {
    for (double yp : { 0.0, 12.5, 50.0, 99.0, 100.0 }) {
        EXPECT_NEAR(percent_from_device_y(device_y(yp, 612), 612), yp, 1e-9);
    }
}

TEST(CoordTest, DimenScalesSizeByWidth) {
    Dimen d = dimen(792, 612, 50, 50, 5);
    EXPECT_DOUBLE_EQ(d.x, 396);
    EXPECT_DOUBLE_EQ(d.y, 306);
    EXPECT_DOUBLE_EQ(d.size, 39.6);

    Dimen zero = dimen(792, 612, 10, 90, 0);
    EXPECT_DOUBLE_EQ(zero.size, 0);
    EXPECT_NEAR(zero.y, 61.2, 1e-9);
}

TEST(CoordTest, PwidthDefaultsOnZero) {
    EXPECT_DOUBLE_EQ(pwidth(0, 792, 123), 123);
    EXPECT_DOUBLE_EQ(pwidth(50, 792, 123), 396);
}

TEST(CoordTest, OpacityToAlpha) {
    EXPECT_EQ(opacity_to_alpha(0), 255);
    EXPECT_EQ(opacity_to_alpha(100), 255);
    EXPECT_EQ(opacity_to_alpha(50), 127);
    EXPECT_EQ(opacity_to_alpha(-5), 255);
}
