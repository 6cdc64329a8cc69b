// surface.hpp - Drawing surface interface implemented by every backend
//
// All coordinates are device units with the origin at the top-left and Y
// growing downward; the dispatcher has already applied the percentage
// conversion and the Y flip. A backend that lacks a primitive degrades it
// inside its own implementation.

#ifndef DECK_SURFACE_HPP
#define DECK_SURFACE_HPP

#include "color.hpp"
#include "font_face.hpp"
#include <string>
#include <vector>

namespace deck {

struct Point {
    double x, y;
};

// a color as written in the document plus its parsed channels
struct Paint {
    std::string source;
    Rgba rgba;
    double opacity;     // document opacity 0-100, 0 meaning opaque

    static Paint of(const std::string& source, double opacity = 0);

    // 0-1 for output formats with fractional alpha
    double alpha() const { return opacity > 0 ? opacity / 100.0 : 1.0; }
};

enum TextAnchor {
    ANCHOR_START,
    ANCHOR_MIDDLE,
    ANCHOR_END,
};

struct TextStyle {
    FontHandle font;
    std::string css_family;     // family name for vector output
    double size;                // pixels per em
    TextAnchor anchor;
    Paint paint;
};

// decoded RGBA pixels of an image element
struct ImageData {
    const unsigned char* pixels;
    int width;
    int height;
};

class DrawingSurface {
public:
    explicit DrawingSurface(FontSet* fonts) : fonts_(fonts) {}
    virtual ~DrawingSurface() = default;

    // index is zero based; title is empty when not requested
    virtual void begin_page(int index, double width, double height, const std::string& title) = 0;
    virtual void end_page() = 0;

    virtual void fill_background(const Paint& paint) = 0;
    // vertical gradient over the box: color1 at the top blending to color2
    // at gp percent of the height
    virtual void fill_linear_gradient(double x, double y, double w, double h,
        const Paint& color1, const Paint& color2, double gp) = 0;

    // x, y is the top-left corner
    virtual void fill_rect(double x, double y, double w, double h, const Paint& paint) = 0;
    virtual void fill_ellipse(double cx, double cy, double rx, double ry, const Paint& paint) = 0;
    virtual void stroke_line(double x1, double y1, double x2, double y2, double width, const Paint& paint) = 0;
    // start and end in device degrees, clockwise from 3 o'clock
    virtual void stroke_arc(double cx, double cy, double rx, double ry, double start, double end,
        double width, const Paint& paint) = 0;
    // quadratic curve from p1 to p3 with control point p2
    virtual void stroke_curve(double x1, double y1, double x2, double y2, double x3, double y3,
        double width, const Paint& paint) = 0;
    virtual void fill_polygon(const std::vector<Point>& points, const Paint& paint) = 0;

    // y is the text baseline
    virtual void draw_text(double x, double y, const std::string& text, const TextStyle& style) = 0;
    virtual double text_width(const std::string& text, const TextStyle& style);

    // centered on cx, cy and scaled to w x h; name is the source file
    virtual void draw_image(double cx, double cy, double w, double h, const ImageData& image,
        const std::string& name) = 0;

    // clockwise rotation in degrees about cx, cy for everything up to pop_rotation
    virtual void push_rotation(double degrees, double cx, double cy) = 0;
    virtual void pop_rotation() = 0;

    FontSet* fonts() { return fonts_; }

protected:
    FontSet* fonts_;
};

} // namespace deck

#endif // DECK_SURFACE_HPP
