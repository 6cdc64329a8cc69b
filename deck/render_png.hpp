// render_png.hpp - Raster backend
//
// Shapes are rasterized by a ThorVG software canvas targeting the page
// buffer, one shape per draw call so later shapes composite over earlier
// ones in layer order. Text is FreeType glyph coverage blended onto the
// same buffer.

#ifndef DECK_RENDER_PNG_HPP
#define DECK_RENDER_PNG_HPP

#include "document.hpp"
#include "error.hpp"
#include "raster.hpp"
#include "surface.hpp"
#include <string>
#include <vector>
#include <thorvg_capi.h>

namespace deck {

class PngSurface : public DrawingSurface {
public:
    explicit PngSurface(FontSet* fonts);
    ~PngSurface() override;

    PngSurface(const PngSurface&) = delete;
    PngSurface& operator=(const PngSurface&) = delete;

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

    // the page buffer, nullptr before begin_page
    const RasterImage* image() const { return image_; }

private:
    static Rgba paint_color(const Paint& paint);
    // transform, push, draw and flush one shape; the canvas takes ownership
    void draw_shape(Tvg_Paint shape);
    void stroke_shape(Tvg_Paint shape, double width, const Paint& paint);

    RasterImage* image_;
    Tvg_Canvas canvas_;
    std::vector<Tvg_Matrix> transforms_;
};

// Render slide options.slide_index of deck as PNG bytes.
DeckStatus render_png(const Deck& deck, const RenderOptions& options, FontSet* fonts,
    std::string* out, DeckError* err);

} // namespace deck

#endif // DECK_RENDER_PNG_HPP
