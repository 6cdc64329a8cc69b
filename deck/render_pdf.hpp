// render_pdf.hpp - Paginated (PDF) backend
//
// One page per slide using the standard Type1 fonts. Layout widths still
// come from the Font Resolver's faces so wrapping matches the other
// backends. Gradients, arcs, curves and opacity are degraded to what the
// golden files expect: first gradient color, full ellipse outline, straight
// line from first to last point, and opaque paint.

#ifndef DECK_RENDER_PDF_HPP
#define DECK_RENDER_PDF_HPP

#include "document.hpp"
#include "error.hpp"
#include "surface.hpp"
#include "../lib/pdf_writer.h"
#include <string>

namespace deck {

class PdfSurface : public DrawingSurface {
public:
    PdfSurface(FontSet* fonts, PdfDoc* doc);

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

private:
    // device Y (top-down) to PDF Y (bottom-up)
    float flip(double y) const { return (float)(height_ - y); }
    void set_fill(const Paint& paint);
    void set_stroke(const Paint& paint, double width);

    PdfDoc* doc_;
    PdfPage* page_;
    double width_, height_;
    int saved_states_;
};

// Standard Type1 font for a resolved family: Courier, Times-Roman, Symbol
// or Helvetica, with the -Bold variant at weight 600 and above
const char* get_pdf_font_name(const std::string& family, int weight);

// Render every slide of deck, one page each.
DeckStatus render_pdf(const Deck& deck, const RenderOptions& options, FontSet* fonts,
    std::string* out, DeckError* err);

} // namespace deck

#endif // DECK_RENDER_PDF_HPP
