// test_color_gtest.cpp - Color string parsing

#include <gtest/gtest.h>
#include "../deck/color.hpp"

using namespace deck;

static void expect_rgba(const Rgba& c, int r, int g, int b, int a) {
    EXPECT_EQ(c.r, r);
    EXPECT_EQ(c.g, g);
    EXPECT_EQ(c.b, b);
    EXPECT_EQ(c.a, a);
}

TEST(ColorTest, NamedColors) {
    expect_rgba(parse_color("red"), 255, 0, 0, 255);
    expect_rgba(parse_color("steelblue"), 0x46, 0x82, 0xB4, 255);
    expect_rgba(parse_color("Gray"), 128, 128, 128, 255);
    EXPECT_TRUE(is_known_color("white"));
}

TEST(ColorTest, RgbFunctions) {
    expect_rgba(parse_color("rgb(127,127,127)"), 127, 127, 127, 255);
    expect_rgba(parse_color("rgb( 10 , 20 , 30 )"), 10, 20, 30, 255);
    expect_rgba(parse_color("rgba(255,0,0,0.5)"), 255, 0, 0, 127);
    expect_rgba(parse_color("rgb(300,-4,12)"), 255, 0, 12, 255);
}

TEST(ColorTest, HexForms) {
    expect_rgba(parse_color("#ff8000"), 255, 128, 0, 255);
    expect_rgba(parse_color("#0F0"), 0, 255, 0, 255);
    EXPECT_FALSE(is_known_color("#12345"));
    EXPECT_FALSE(is_known_color("#gggggg"));
}

TEST(ColorTest, Hsv) {
    expect_rgba(parse_color("hsv(0,100,100)"), 255, 0, 0, 255);
    expect_rgba(parse_color("hsv(120,100,100)"), 0, 255, 0, 255);
    expect_rgba(parse_color("hsv(240,100,50)"), 0, 0, 128, 255);
}

TEST(ColorTest, TransparentAndNone) {
    EXPECT_EQ(parse_color("none").a, 0);
    EXPECT_EQ(parse_color("transparent").a, 0);
}

TEST(ColorTest, UnknownIsOpaqueBlack) {
    expect_rgba(parse_color("not-a-color"), 0, 0, 0, 255);
    expect_rgba(parse_color(""), 0, 0, 0, 255);
    EXPECT_FALSE(is_known_color("not-a-color"));
    EXPECT_FALSE(is_known_color("   "));
}
