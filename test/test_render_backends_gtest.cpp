// test_render_backends_gtest.cpp - Raster (PNG) and paginated (PDF) backends

#include <gtest/gtest.h>
#include "../deck/parse.hpp"
#include "../deck/raster.hpp"
#include "../deck/render_pdf.hpp"
#include "../deck/render_png.hpp"
#include "../deck/render_svg.hpp"
#include "../deck/dispatch.hpp"
#include "../lib/image.h"
#include "../lib/file.h"
#include <cstdio>
#include <cstdlib>
#include <unistd.h>

using namespace deck;

class BackendTest : public ::testing::Test {
protected:
    FontResolver resolver;
    RenderOptions options;
    Deck deck;
    DeckError err;

    void load(const std::string& xml) {
        ASSERT_EQ(parse_deck(xml, options, &deck, &err), DECK_OK) << err.describe();
    }

    std::string png() {
        FontSet fonts(&resolver);
        std::string bytes;
        EXPECT_EQ(render_png(deck, options, &fonts, &bytes, &err), DECK_OK) << err.describe();
        return bytes;
    }

    std::string pdf() {
        FontSet fonts(&resolver);
        std::string bytes;
        EXPECT_EQ(render_pdf(deck, options, &fonts, &bytes, &err), DECK_OK) << err.describe();
        return bytes;
    }
};

// decoded RGBA pixels of a PNG
struct Decoded {
    unsigned char* pixels = nullptr;
    int width = 0;
    int height = 0;

    explicit Decoded(const std::string& bytes) {
        pixels = image_load_from_memory((const unsigned char*)bytes.data(), bytes.size(), &width, &height, nullptr);
    }
    ~Decoded() { if (pixels) image_free(pixels); }

    const unsigned char* at(int x, int y) const { return pixels + ((size_t)y * width + x) * 4; }
};

// ============================================================================
// PNG
// ============================================================================

TEST_F(BackendTest, PngSignatureAndSize) {
    load("<deck><canvas width=\"320\" height=\"240\"/><slide/></deck>");
    std::string bytes = png();
    ASSERT_GT(bytes.size(), 8u);
    EXPECT_EQ(bytes.compare(0, 8, "\x89PNG\r\n\x1a\n"), 0);
    Decoded image(bytes);
    ASSERT_NE(image.pixels, nullptr);
    EXPECT_EQ(image.width, 320);
    EXPECT_EQ(image.height, 240);
    const unsigned char* corner = image.at(0, 0);
    EXPECT_EQ(corner[0], 255);
    EXPECT_EQ(corner[1], 255);
    EXPECT_EQ(corner[2], 255);
    EXPECT_EQ(corner[3], 255);
}

TEST_F(BackendTest, PngRectIsFilled) {
    load("<deck><canvas width=\"792\" height=\"612\"/><slide bg=\"black\">"
         "<rect xp=\"75\" yp=\"75\" wp=\"20\" hp=\"15\" color=\"red\"/></slide></deck>");
    Decoded image(png());
    ASSERT_NE(image.pixels, nullptr);
    const unsigned char* inside = image.at(594, 153);
    EXPECT_EQ(inside[0], 255);
    EXPECT_EQ(inside[1], 0);
    EXPECT_EQ(inside[2], 0);
    const unsigned char* outside = image.at(100, 500);
    EXPECT_EQ(outside[0], 0);
    EXPECT_EQ(outside[1], 0);
    EXPECT_EQ(outside[2], 0);
}

TEST_F(BackendTest, PngOpacityBlends) {
    load("<deck><canvas width=\"200\" height=\"200\"/><slide>"
         "<rect xp=\"50\" yp=\"50\" wp=\"50\" hp=\"50\" color=\"red\" opacity=\"50\"/></slide></deck>");
    Decoded image(png());
    ASSERT_NE(image.pixels, nullptr);
    const unsigned char* center = image.at(100, 100);
    EXPECT_NEAR(center[0], 255, 3);
    EXPECT_NEAR(center[1], 128, 4);
    EXPECT_NEAR(center[2], 128, 4);
}

TEST_F(BackendTest, PngDrawsImages) {
    char dir[] = "/tmp/deck-image-XXXXXX";
    ASSERT_NE(mkdtemp(dir), nullptr);
    std::string path = std::string(dir) + "/blue.png";

    RasterImage* source = raster_create(10, 10);
    ASSERT_NE(source, nullptr);
    raster_clear(source, Rgba{ 0, 0, 255, 255 });
    std::string encoded;
    ASSERT_TRUE(raster_encode_png(source, &encoded));
    raster_destroy(source);
    ASSERT_TRUE(write_binary_file(path.c_str(), encoded.data(), encoded.size()));

    load("<deck><canvas width=\"792\" height=\"612\"/><slide><image xp=\"50\" yp=\"50\" name=\"" + path +
         "\"/></slide></deck>");
    Decoded image(png());
    ASSERT_NE(image.pixels, nullptr);
    const unsigned char* center = image.at(396, 306);
    EXPECT_EQ(center[0], 0);
    EXPECT_EQ(center[1], 0);
    EXPECT_EQ(center[2], 255);

    unlink(path.c_str());
    rmdir(dir);
}

TEST_F(BackendTest, PngDeterministic) {
    load("<deck><canvas width=\"300\" height=\"200\"/><slide>"
         "<ellipse xp=\"50\" yp=\"50\" wp=\"30\" hp=\"30\" color=\"green\"/>"
         "<text xp=\"10\" yp=\"10\" sp=\"4\">Stable</text></slide></deck>");
    EXPECT_EQ(png(), png());
}

// ============================================================================
// Raster helpers
// ============================================================================

TEST(RasterTest, BlendOverOpaque) {
    RasterImage* image = raster_create(2, 2);
    ASSERT_NE(image, nullptr);
    raster_clear(image, Rgba{ 255, 255, 255, 255 });
    raster_blend_pixel(image, 0, 0, Rgba{ 255, 0, 0, 128 });
    raster_blend_pixel(image, 5, 5, Rgba{ 0, 0, 0, 255 });      // outside, ignored
    const uint8_t* px = (const uint8_t*)image->pixels;
    EXPECT_EQ(px[0], 255);
    EXPECT_NEAR(px[1], 127, 1);
    EXPECT_NEAR(px[2], 127, 1);
    EXPECT_EQ(px[3], 255);
    raster_destroy(image);
}

TEST(RasterTest, BlendOverTransparent) {
    RasterImage* image = raster_create(1, 1);
    ASSERT_NE(image, nullptr);
    raster_blend_pixel(image, 0, 0, Rgba{ 0, 255, 0, 100 });
    const uint8_t* px = (const uint8_t*)image->pixels;
    EXPECT_EQ(px[1], 255);
    EXPECT_EQ(px[3], 100);
    raster_destroy(image);
}

// ============================================================================
// PDF
// ============================================================================

TEST_F(BackendTest, PdfHeaderAndPages) {
    load("<deck><canvas width=\"792\" height=\"612\"/><slide/><slide bg=\"blue\"/><slide/></deck>");
    std::string bytes = pdf();
    EXPECT_EQ(bytes.compare(0, 5, "%PDF-"), 0);
    EXPECT_NE(bytes.find("/Count 3"), std::string::npos);
    EXPECT_NE(bytes.find("/MediaBox [0 0 792 612]"), std::string::npos);
    EXPECT_NE(bytes.find("/Creator (deck)"), std::string::npos);
    EXPECT_NE(bytes.find("%%EOF"), std::string::npos);
}

TEST_F(BackendTest, PdfRendersEverySlideRegardlessOfIndex) {
    load("<deck><canvas width=\"400\" height=\"300\"/><slide/><slide/></deck>");
    options.slide_index = 7;
    std::string bytes = pdf();
    EXPECT_NE(bytes.find("/Count 2"), std::string::npos);
}

TEST_F(BackendTest, PdfTitle) {
    load("<deck><canvas width=\"400\" height=\"300\"/><slide/></deck>");
    options.title = "Quarterly";
    std::string bytes = pdf();
    EXPECT_NE(bytes.find("/Title (Quarterly)"), std::string::npos);
}

TEST_F(BackendTest, PdfUsesStandardFonts) {
    load("<deck><canvas width=\"400\" height=\"300\"/><slide>"
         "<text xp=\"10\" yp=\"50\" sp=\"3\" type=\"code\">x = 1</text>"
         "<text xp=\"10\" yp=\"20\" sp=\"3\">plain</text></slide></deck>");
    std::string bytes = pdf();
    EXPECT_NE(bytes.find("/BaseFont /Courier"), std::string::npos);
    EXPECT_NE(bytes.find("/BaseFont /Helvetica"), std::string::npos);
}

TEST_F(BackendTest, PdfWithoutSlides) {
    load("<deck><canvas width=\"400\" height=\"300\"/></deck>");
    FontSet fonts(&resolver);
    std::string bytes;
    EXPECT_EQ(render_pdf(deck, options, &fonts, &bytes, &err), DECK_ERR_SLIDE_INDEX);
    EXPECT_TRUE(bytes.empty());
}

TEST(PdfFontNameTest, Mapping) {
    EXPECT_STREQ(get_pdf_font_name("Courier New", 400), "Courier");
    EXPECT_STREQ(get_pdf_font_name("DejaVu Sans Mono", 700), "Courier-Bold");
    EXPECT_STREQ(get_pdf_font_name("Times New Roman", 400), "Times-Roman");
    EXPECT_STREQ(get_pdf_font_name("Georgia", 400), "Times-Roman");
    EXPECT_STREQ(get_pdf_font_name("DejaVu Sans", 400), "Helvetica");
    EXPECT_STREQ(get_pdf_font_name("Arial", 700), "Helvetica-Bold");
    EXPECT_STREQ(get_pdf_font_name("Symbol", 400), "Symbol");
}

// ============================================================================
// Every shape kind on every backend
// ============================================================================

class AllKindsTest : public BackendTest {
protected:
    char dir[64];
    std::string image_path;

    void SetUp() override {
        snprintf(dir, sizeof(dir), "/tmp/deck-kinds-XXXXXX");
        ASSERT_NE(mkdtemp(dir), nullptr);
        image_path = std::string(dir) + "/dot.png";
        RasterImage* source = raster_create(4, 4);
        ASSERT_NE(source, nullptr);
        raster_clear(source, Rgba{ 255, 128, 0, 255 });
        std::string encoded;
        ASSERT_TRUE(raster_encode_png(source, &encoded));
        raster_destroy(source);
        ASSERT_TRUE(write_binary_file(image_path.c_str(), encoded.data(), encoded.size()));

        load("<deck><canvas width=\"400\" height=\"200\"/>"
             "<slide gradcolor1=\"red\" gradcolor2=\"blue\" gp=\"50\">"
             "<rect xp=\"10\" yp=\"80\" wp=\"5\" hp=\"5\" color=\"purple\"/>"
             "<ellipse xp=\"20\" yp=\"50\" wp=\"10\" hp=\"10\" color=\"yellow\"/>"
             "<line xp1=\"10\" yp1=\"90\" xp2=\"90\" yp2=\"90\" color=\"black\"/>"
             "<arc xp=\"50\" yp=\"50\" wp=\"20\" hp=\"20\" a1=\"0\" a2=\"90\" color=\"blue\"/>"
             "<curve xp1=\"10\" yp1=\"10\" xp2=\"50\" yp2=\"90\" xp3=\"90\" yp3=\"10\" color=\"green\"/>"
             "<polygon xc=\"70 80 75\" yc=\"20 20 30\" color=\"gray\"/>"
             "<text xp=\"5\" yp=\"70\" sp=\"3\">Plain</text>"
             "<text xp=\"5\" yp=\"60\" sp=\"2\" wp=\"30\" type=\"block\">a block of words that wraps</text>"
             "<text xp=\"5\" yp=\"40\" sp=\"2\" type=\"code\">x = 1\ny = 2</text>"
             "<text xp=\"60\" yp=\"70\" sp=\"3\" rotation=\"30\">Turned</text>"
             "<list xp=\"60\" yp=\"40\" sp=\"2\" type=\"bullet\"><li>one</li><li>two</li></list>"
             "<image xp=\"85\" yp=\"85\" name=\"" + image_path + "\"/>"
             "</slide></deck>");
    }

    void TearDown() override {
        unlink(image_path.c_str());
        rmdir(dir);
    }

    // uncompressed content stream for the same drawing render_pdf does
    std::string plain_pdf() {
        FontSet fonts(&resolver);
        PdfDoc* doc = pdf_new();
        EXPECT_NE(doc, nullptr);
        if (!doc) return "";
        pdf_set_compression(doc, false);
        PdfSurface surface(&fonts, doc);
        render_slide(&surface, deck, 0, options);
        unsigned char* data = nullptr;
        size_t length = 0;
        EXPECT_EQ(pdf_save_to_buffer(doc, &data, &length), PDF_OK);
        pdf_free(doc);
        std::string bytes(data ? (const char*)data : "", length);
        free(data);
        return bytes;
    }
};

TEST_F(AllKindsTest, EveryBackendRenders) {
    ASSERT_EQ(deck.slides.size(), 1u);

    FontSet fonts(&resolver);
    std::string svg;
    EXPECT_EQ(render_svg(deck, options, &fonts, &svg, &err), DECK_OK) << err.describe();
    EXPECT_NE(svg.find("</svg>"), std::string::npos);

    std::string raster = png();
    Decoded image(raster);
    ASSERT_NE(image.pixels, nullptr);
    EXPECT_EQ(image.width, 400);
    EXPECT_EQ(image.height, 200);

    std::string paged = pdf();
    EXPECT_EQ(paged.compare(0, 5, "%PDF-"), 0);
    EXPECT_NE(paged.find("/Count 1"), std::string::npos);
}

TEST_F(AllKindsTest, PdfArcIsFullEllipseOutline) {
    std::string bytes = plain_pdf();
    // center (200, 100), radius 40, stroked in blue
    size_t start = bytes.find("0 0 1 RG\n");
    ASSERT_NE(start, std::string::npos);
    size_t move = bytes.find("240 100 m\n", start);
    ASSERT_NE(move, std::string::npos);
    size_t close = bytes.find("240 100 c\nS\n", move);
    ASSERT_NE(close, std::string::npos);
    std::string path = bytes.substr(move, close - move);
    size_t curves = 0;
    for (size_t at = path.find(" c\n"); at != std::string::npos; at = path.find(" c\n", at + 1)) curves++;
    EXPECT_EQ(curves, 3u);   // plus the closing one found above
}

TEST_F(AllKindsTest, PdfCurveIsStraightLine) {
    std::string bytes = plain_pdf();
    // p1 (40, 180) and p3 (360, 180) on a top-down 200 point page
    EXPECT_NE(bytes.find("40 20 m\n360 20 l\nS\n"), std::string::npos);
}

TEST_F(AllKindsTest, PdfGradientUsesFirstColor) {
    std::string bytes = plain_pdf();
    EXPECT_NE(bytes.find("1 0 0 rg\n0 0 400 200 re\nf\n"), std::string::npos);
    EXPECT_EQ(bytes.find("0 0 1 rg\n"), std::string::npos);
}
