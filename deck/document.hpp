// document.hpp - In-memory deck model
//
// A Deck is built once per render call from the intermediate XML and is
// read-only afterwards. Positions and sizes are percentages of the canvas
// (see coord.hpp); empty strings mean "attribute not given".

#ifndef DECK_DOCUMENT_HPP
#define DECK_DOCUMENT_HPP

#include "defaults.hpp"
#include <string>
#include <vector>

namespace deck {

// ============================================================================
// Shapes
// ============================================================================

struct Rect {
    double xp = 0, yp = 0, wp = 0, hp = 0;
    double hr = 0;                  // height as percent of the computed width, overrides hp
    std::string color;
    double opacity = 0;             // 0-100, 0 means opaque
    std::string gradcolor1, gradcolor2;
    double gp = 0;
};

struct Ellipse {
    double xp = 0, yp = 0, wp = 0, hp = 0;
    double hr = 0;
    std::string color;
    double opacity = 0;
};

struct Line {
    double xp1 = 0, yp1 = 0, xp2 = 0, yp2 = 0;
    double sp = 0;
    std::string color;
    double opacity = 0;
};

struct Arc {
    double xp = 0, yp = 0, wp = 0, hp = 0;
    double a1 = 0, a2 = 0;          // degrees, counter-clockwise from 3 o'clock
    double sp = 0;
    std::string color;
    double opacity = 0;
};

// quadratic curve from p1 to p3 with control point p2
struct Curve {
    double xp1 = 0, yp1 = 0, xp2 = 0, yp2 = 0, xp3 = 0, yp3 = 0;
    double sp = 0;
    std::string color;
    double opacity = 0;
};

struct Polygon {
    std::string xc, yc;             // space separated percentage lists
    std::string color;
    double opacity = 0;
};

struct Text {
    double xp = 0, yp = 0, sp = 0, wp = 0, lp = 0;
    std::string type;               // "", "block", "code" or "plain"
    std::string align;
    std::string font;
    std::string color;
    double opacity = 0;
    double rotation = 0;
    std::string file;
    std::string link;
    std::string tdata;
};

struct ListItem {
    std::string color;
    std::string font;
    double opacity = 0;
    std::string text;
};

struct List {
    double xp = 0, yp = 0, sp = 0, wp = 0, lp = 0;
    std::string type;               // "", "bullet" or "number"
    std::string align;
    std::string font;
    std::string color;
    double opacity = 0;
    double rotation = 0;
    std::vector<ListItem> items;
};

struct Image {
    double xp = 0, yp = 0;
    int width = 0, height = 0;      // pixels, or width percent when height is 0
    double scale = 0;               // percent
    std::string autoscale;          // "on" fits the canvas width
    std::string name;               // file path
    std::string caption;
    std::string font;
    std::string color;
    std::string align;
    double sp = 0;
    std::string link;
};

// ============================================================================
// Slides and decks
// ============================================================================

struct Slide {
    std::string bg;                 // empty means DEFAULT_BACKGROUND
    std::string fg;                 // empty means DEFAULT_FOREGROUND
    std::string gradcolor1;
    std::string gradcolor2;
    double gp = 0;

    std::vector<Rect> rects;
    std::vector<Ellipse> ellipses;
    std::vector<Line> lines;
    std::vector<Arc> arcs;
    std::vector<Curve> curves;
    std::vector<Polygon> polygons;
    std::vector<Text> texts;
    std::vector<List> lists;
    std::vector<Image> images;

    bool has_gradient() const { return !gradcolor1.empty() && !gradcolor2.empty(); }
    const std::string& background() const;
    const std::string& foreground() const;
};

struct Deck {
    int width = DEFAULT_CANVAS_WIDTH;
    int height = DEFAULT_CANVAS_HEIGHT;
    std::vector<Slide> slides;
};

// ============================================================================
// Render options
// ============================================================================

struct RenderOptions {
    std::string layers = DEFAULT_LAYERS;
    double grid_percent = 0;        // 0 disables the grid overlay
    std::string title;
    std::string font_family = DEFAULT_FONT_FAMILY;
    int font_weight = DEFAULT_FONT_WEIGHT;
    int slide_index = 0;            // vector and raster render one slide
    int canvas_width = DEFAULT_CANVAS_WIDTH;    // used when the document omits a size
    int canvas_height = DEFAULT_CANVAS_HEIGHT;
};

} // namespace deck

#endif // DECK_DOCUMENT_HPP
