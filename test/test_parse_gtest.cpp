// test_parse_gtest.cpp - Intermediate XML parsing and slide auto-wrap

#include <gtest/gtest.h>
#include "../deck/parse.hpp"

using namespace deck;

class ParseTest : public ::testing::Test {
protected:
    RenderOptions options;
    Deck deck;
    DeckError err;

    DeckStatus parse(const std::string& xml) {
        return parse_deck(xml, options, &deck, &err);
    }
};

// ============================================================================
// Auto-wrap
// ============================================================================

TEST_F(ParseTest, WrapBareShape) {
    std::string wrapped = wrap_in_slide_if_needed("<rect xp=\"50\" yp=\"50\"/>", 792, 612);
    EXPECT_NE(wrapped.find("<deck>"), std::string::npos);
    EXPECT_NE(wrapped.find("<canvas width=\"792\" height=\"612\"/>"), std::string::npos);
    EXPECT_NE(wrapped.find("<slide>"), std::string::npos);
    EXPECT_LT(wrapped.find("<slide>"), wrapped.find("<rect"));
    ASSERT_EQ(parse(wrapped), DECK_OK);
    ASSERT_EQ(deck.slides.size(), 1u);
    EXPECT_EQ(deck.slides[0].rects.size(), 1u);
}

TEST_F(ParseTest, WrapDeckWithoutSlideKeepsCanvas) {
    std::string xml = "<deck><canvas width=\"1024\" height=\"768\"/><text xp=\"10\" yp=\"10\">Hi</text></deck>";
    std::string wrapped = wrap_in_slide_if_needed(xml, 792, 612);
    EXPECT_NE(wrapped.find("width=\"1024\""), std::string::npos);
    EXPECT_EQ(wrapped.find("width=\"792\""), std::string::npos);
    ASSERT_EQ(parse(wrapped), DECK_OK);
    EXPECT_EQ(deck.width, 1024);
    EXPECT_EQ(deck.height, 768);
    ASSERT_EQ(deck.slides.size(), 1u);
    ASSERT_EQ(deck.slides[0].texts.size(), 1u);
    EXPECT_EQ(deck.slides[0].texts[0].tdata, "Hi");
}

TEST_F(ParseTest, WrapLeavesSlidesAndBlankAlone) {
    std::string xml = "<deck><canvas width=\"792\" height=\"612\"/><slide/></deck>";
    EXPECT_EQ(wrap_in_slide_if_needed(xml, 792, 612), xml);
    EXPECT_EQ(wrap_in_slide_if_needed("", 792, 612), "");
    EXPECT_EQ(wrap_in_slide_if_needed("  \n ", 792, 612), "  \n ");
}

// ============================================================================
// Elements and attributes
// ============================================================================

TEST_F(ParseTest, FullSlide) {
    const char* xml =
        "<deck>\n"
        "  <canvas width=\"800\" height=\"600\"/>\n"
        "  <slide bg=\"black\" fg=\"white\" gradcolor1=\"red\" gradcolor2=\"blue\" gp=\"80\">\n"
        "    <rect xp=\"75\" yp=\"75\" wp=\"20\" hp=\"15\" color=\"steelblue\" opacity=\"50\"/>\n"
        "    <ellipse xp=\"10\" yp=\"10\" wp=\"5\" hr=\"100\"/>\n"
        "    <line xp1=\"0\" yp1=\"0\" xp2=\"100\" yp2=\"100\" sp=\"0.5\"/>\n"
        "    <arc xp=\"50\" yp=\"50\" wp=\"10\" hp=\"10\" a1=\"0\" a2=\"90\"/>\n"
        "    <curve xp1=\"0\" yp1=\"0\" xp2=\"50\" yp2=\"100\" xp3=\"100\" yp3=\"0\"/>\n"
        "    <polygon xc=\"10 20 30\" yc=\"10 20 10\" color=\"red\"/>\n"
        "    <text xp=\"50\" yp=\"50\" sp=\"5\" align=\"center\" rotation=\"45\">Hello</text>\n"
        "    <list xp=\"10\" yp=\"80\" sp=\"3\" type=\"bullet\">\n"
        "      <li>one</li><li color=\"red\">two</li>\n"
        "    </list>\n"
        "    <image xp=\"50\" yp=\"50\" width=\"640\" height=\"480\" name=\"pic.png\" caption=\"A picture\"/>\n"
        "  </slide>\n"
        "  <slide/>\n"
        "</deck>\n";
    ASSERT_EQ(parse(xml), DECK_OK) << err.describe();
    EXPECT_EQ(deck.width, 800);
    EXPECT_EQ(deck.height, 600);
    ASSERT_EQ(deck.slides.size(), 2u);

    const Slide& s = deck.slides[0];
    EXPECT_EQ(s.background(), "black");
    EXPECT_EQ(s.foreground(), "white");
    EXPECT_TRUE(s.has_gradient());
    EXPECT_DOUBLE_EQ(s.gp, 80);
    ASSERT_EQ(s.rects.size(), 1u);
    EXPECT_DOUBLE_EQ(s.rects[0].wp, 20);
    EXPECT_EQ(s.rects[0].color, "steelblue");
    EXPECT_DOUBLE_EQ(s.rects[0].opacity, 50);
    EXPECT_DOUBLE_EQ(s.ellipses[0].hr, 100);
    EXPECT_DOUBLE_EQ(s.lines[0].sp, 0.5);
    EXPECT_DOUBLE_EQ(s.arcs[0].a2, 90);
    EXPECT_DOUBLE_EQ(s.curves[0].yp2, 100);
    EXPECT_EQ(s.polygons[0].xc, "10 20 30");
    EXPECT_EQ(s.texts[0].align, "center");
    EXPECT_DOUBLE_EQ(s.texts[0].rotation, 45);
    ASSERT_EQ(s.lists[0].items.size(), 2u);
    EXPECT_EQ(s.lists[0].items[1].color, "red");
    EXPECT_EQ(s.lists[0].items[1].text, "two");
    EXPECT_EQ(s.images[0].width, 640);
    EXPECT_EQ(s.images[0].caption, "A picture");

    const Slide& empty = deck.slides[1];
    EXPECT_EQ(empty.background(), "white");
    EXPECT_EQ(empty.foreground(), "black");
    EXPECT_FALSE(empty.has_gradient());
}

TEST_F(ParseTest, ZeroCanvasUsesDefaults) {
    ASSERT_EQ(parse("<deck><canvas width=\"0\" height=\"0\"/><slide/></deck>"), DECK_OK);
    EXPECT_EQ(deck.width, DEFAULT_CANVAS_WIDTH);
    EXPECT_EQ(deck.height, DEFAULT_CANVAS_HEIGHT);
}

TEST_F(ParseTest, ZeroSlidesIsValid) {
    ASSERT_EQ(parse("<deck><canvas width=\"792\" height=\"612\"/></deck>"), DECK_OK);
    EXPECT_TRUE(deck.slides.empty());
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(ParseTest, MalformedXml) {
    EXPECT_EQ(parse("<deck><canvas width=\"792\"><slide></deck>"), DECK_ERR_PARSE);
    EXPECT_EQ(err.code, DECK_ERR_PARSE);
    EXPECT_EQ(err.stage, "parse");
    EXPECT_NE(err.message.find("malformed XML"), std::string::npos);
}

TEST_F(ParseTest, BadNumberNamesElementAndAttribute) {
    EXPECT_EQ(parse("<deck><canvas/><slide><rect xp=\"abc\"/></slide></deck>"), DECK_ERR_PARSE);
    EXPECT_NE(err.message.find("<rect>"), std::string::npos);
    EXPECT_NE(err.message.find("xp"), std::string::npos);
    EXPECT_NE(err.message.find("abc"), std::string::npos);
}

TEST_F(ParseTest, IntegerBeyondIntRange) {
    EXPECT_EQ(parse("<deck><canvas width=\"4294967297\" height=\"612\"/><slide/></deck>"), DECK_ERR_PARSE);
    EXPECT_NE(err.message.find("invalid integer"), std::string::npos);
    EXPECT_NE(err.message.find("4294967297"), std::string::npos);
    EXPECT_EQ(parse("<deck><canvas width=\"-2147483649\" height=\"612\"/><slide/></deck>"), DECK_ERR_PARSE);
}

TEST_F(ParseTest, BadPolygonList) {
    EXPECT_EQ(parse("<deck><canvas/><slide><polygon xc=\"1 2 x\" yc=\"1 2 3\"/></slide></deck>"), DECK_ERR_PARSE);
    EXPECT_NE(err.message.find("xc"), std::string::npos);
}

TEST_F(ParseTest, WrongRootAndMissingCanvas) {
    EXPECT_EQ(parse("<slides/>"), DECK_ERR_PARSE);
    EXPECT_NE(err.message.find("<deck>"), std::string::npos);
    err.clear();
    EXPECT_EQ(parse("<deck><slide/></deck>"), DECK_ERR_PARSE);
    EXPECT_NE(err.message.find("canvas"), std::string::npos);
}

TEST_F(ParseTest, FailureLeavesOutputUntouched) {
    deck.width = 1;
    deck.slides.resize(3);
    EXPECT_NE(parse("<deck>"), DECK_OK);
    EXPECT_EQ(deck.width, 1);
    EXPECT_EQ(deck.slides.size(), 3u);
}

TEST(NumberListTest, Splits) {
    std::vector<double> values;
    ASSERT_TRUE(parse_number_list(" 1  2.5\t-3 ", &values));
    ASSERT_EQ(values.size(), 3u);
    EXPECT_DOUBLE_EQ(values[1], 2.5);
    EXPECT_DOUBLE_EQ(values[2], -3);
    EXPECT_TRUE(parse_number_list("", &values));
    EXPECT_TRUE(values.empty());
    EXPECT_FALSE(parse_number_list("1,2", &values));
}
