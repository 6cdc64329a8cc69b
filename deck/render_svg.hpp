// render_svg.hpp - SVG backend
//
// Colors are written as the document spells them when that spelling is safe
// in a style attribute, otherwise as rgb(); numbers use two
// decimals so the output is stable across platforms.

#ifndef DECK_RENDER_SVG_HPP
#define DECK_RENDER_SVG_HPP

#include "document.hpp"
#include "error.hpp"
#include "surface.hpp"
#include "../lib/strbuf.h"
#include <string>

namespace deck {

class SvgSurface : public DrawingSurface {
public:
    explicit SvgSurface(FontSet* fonts);
    ~SvgSurface() override;

    SvgSurface(const SvgSurface&) = delete;
    SvgSurface& operator=(const SvgSurface&) = delete;

    void begin_page(int index, double width, double height, const std::string& title) override;
    void end_page() override;

    void fill_background(const Paint& paint) override;
    void fill_linear_gradient(double x, double y, double w, double h,
        const Paint& color1, const Paint& color2, double gp) override;
    void fill_rect(double x, double y, double w, double h, const Paint& paint) override;
    void fill_ellipse(double cx, double cy, double rx, double ry, const Paint& paint) override;
    void stroke_line(double x1, double y1, double x2, double y2, double width, const Paint& paint) override;
    void stroke_arc(double cx, double cy, double rx, double ry, double start, double end,
        double width, const Paint& paint) override;
    void stroke_curve(double x1, double y1, double x2, double y2, double x3, double y3,
        double width, const Paint& paint) override;
    void fill_polygon(const std::vector<Point>& points, const Paint& paint) override;
    void draw_text(double x, double y, const std::string& text, const TextStyle& style) override;
    void draw_image(double cx, double cy, double w, double h, const ImageData& image,
        const std::string& name) override;
    void push_rotation(double degrees, double cx, double cy) override;
    void pop_rotation() override;

    // document markup accumulated so far
    std::string output() const;

private:
    void indent();

    StrBuf* svg_;
    double width_, height_;
    int indent_level_;
    int gradient_count_;
};

// Render slide options.slide_index of deck as a standalone SVG document.
// The caller has checked the index.
DeckStatus render_svg(const Deck& deck, const RenderOptions& options, FontSet* fonts,
    std::string* out, DeckError* err);

} // namespace deck

#endif // DECK_RENDER_SVG_HPP
