#include "render_png.hpp"
#include "coord.hpp"
#include "dispatch.hpp"
#include "../lib/log.h"
#include <cmath>

namespace deck {

static const Tvg_Matrix IDENTITY = {
    1.0f, 0.0f, 0.0f,
    0.0f, 1.0f, 0.0f,
    0.0f, 0.0f, 1.0f
};

static Tvg_Matrix matrix_multiply(const Tvg_Matrix& a, const Tvg_Matrix& b) {
    return {
        a.e11 * b.e11 + a.e12 * b.e21 + a.e13 * b.e31,
        a.e11 * b.e12 + a.e12 * b.e22 + a.e13 * b.e32,
        a.e11 * b.e13 + a.e12 * b.e23 + a.e13 * b.e33,

        a.e21 * b.e11 + a.e22 * b.e21 + a.e23 * b.e31,
        a.e21 * b.e12 + a.e22 * b.e22 + a.e23 * b.e32,
        a.e21 * b.e13 + a.e22 * b.e23 + a.e23 * b.e33,

        a.e31 * b.e11 + a.e32 * b.e21 + a.e33 * b.e31,
        a.e31 * b.e12 + a.e32 * b.e22 + a.e33 * b.e32,
        a.e31 * b.e13 + a.e32 * b.e23 + a.e33 * b.e33
    };
}

PngSurface::PngSurface(FontSet* fonts) : DrawingSurface(fonts), image_(nullptr), canvas_(nullptr) {
    // the engine is reference counted, single threaded rasterizing keeps output deterministic
    tvg_engine_init(0);
}

PngSurface::~PngSurface() {
    if (canvas_) tvg_canvas_destroy(canvas_);
    raster_destroy(image_);
    tvg_engine_term();
}

Rgba PngSurface::paint_color(const Paint& paint) {
    Rgba color = paint.rgba;
    color.a = (uint8_t)(color.a * opacity_to_alpha(paint.opacity) / 255);
    return color;
}

void PngSurface::begin_page(int index, double width, double height, const std::string& title) {
    (void)index;  (void)title;
    if (canvas_) { tvg_canvas_destroy(canvas_);  canvas_ = nullptr; }
    raster_destroy(image_);
    transforms_.clear();

    image_ = raster_create((int)lround(width), (int)lround(height));
    if (!image_) {
        log_error("render_png: cannot allocate %.0fx%.0f page buffer", width, height);
        return;
    }
    canvas_ = tvg_swcanvas_create(TVG_ENGINE_OPTION_DEFAULT);
    if (!canvas_) {
        log_error("render_png: failed to create ThorVG canvas");
        return;
    }
    // straight alpha so glyph blending and the PNG encoder share one pixel format
    if (tvg_swcanvas_set_target(canvas_, image_->pixels, image_->width, image_->width, image_->height,
        TVG_COLORSPACE_ABGR8888S) != TVG_RESULT_SUCCESS) {
        log_error("render_png: failed to set canvas target");
        tvg_canvas_destroy(canvas_);
        canvas_ = nullptr;
    }
}

void PngSurface::end_page() {
    while (!transforms_.empty()) transforms_.pop_back();
}

void PngSurface::draw_shape(Tvg_Paint shape) {
    if (!transforms_.empty()) tvg_paint_set_transform(shape, &transforms_.back());
    tvg_canvas_remove(canvas_, NULL);  // clear previous shapes
    tvg_canvas_push(canvas_, shape);
    tvg_canvas_draw(canvas_, false);
    tvg_canvas_sync(canvas_);
}

void PngSurface::stroke_shape(Tvg_Paint shape, double width, const Paint& paint) {
    Rgba color = paint_color(paint);
    tvg_shape_set_stroke_width(shape, (float)width);
    tvg_shape_set_stroke_color(shape, color.r, color.g, color.b, color.a);
    tvg_shape_set_stroke_cap(shape, TVG_STROKE_CAP_BUTT);
    draw_shape(shape);
}

void PngSurface::fill_background(const Paint& paint) {
    if (!image_) return;
    raster_clear(image_, paint.rgba);
}

void PngSurface::fill_linear_gradient(double x, double y, double w, double h,
    const Paint& color1, const Paint& color2, double gp) {
    if (!canvas_) return;
    Tvg_Paint shape = tvg_shape_new();
    tvg_shape_append_rect(shape, (float)x, (float)y, (float)w, (float)h, 0, 0, true);

    Tvg_Gradient grad = tvg_linear_gradient_new();
    tvg_linear_gradient_set(grad, (float)x, (float)y, (float)x, (float)(y + h));
    Rgba c1 = paint_color(color1), c2 = paint_color(color2);
    Tvg_Color_Stop stops[2] = {
        { 0.0f, c1.r, c1.g, c1.b, c1.a },
        { (float)(gp / 100.0), c2.r, c2.g, c2.b, c2.a },
    };
    tvg_gradient_set_color_stops(grad, stops, 2);
    tvg_shape_set_gradient(shape, grad);
    draw_shape(shape);
}

void PngSurface::fill_rect(double x, double y, double w, double h, const Paint& paint) {
    if (!canvas_) return;
    Rgba color = paint_color(paint);
    Tvg_Paint shape = tvg_shape_new();
    tvg_shape_append_rect(shape, (float)x, (float)y, (float)w, (float)h, 0, 0, true);
    tvg_shape_set_fill_color(shape, color.r, color.g, color.b, color.a);
    draw_shape(shape);
}

void PngSurface::fill_ellipse(double cx, double cy, double rx, double ry, const Paint& paint) {
    if (!canvas_) return;
    Rgba color = paint_color(paint);
    Tvg_Paint shape = tvg_shape_new();
    tvg_shape_append_circle(shape, (float)cx, (float)cy, (float)rx, (float)ry, true);
    tvg_shape_set_fill_color(shape, color.r, color.g, color.b, color.a);
    draw_shape(shape);
}

void PngSurface::stroke_line(double x1, double y1, double x2, double y2, double width, const Paint& paint) {
    if (!canvas_) return;
    Tvg_Paint shape = tvg_shape_new();
    tvg_shape_move_to(shape, (float)x1, (float)y1);
    tvg_shape_line_to(shape, (float)x2, (float)y2);
    stroke_shape(shape, width, paint);
}

void PngSurface::stroke_arc(double cx, double cy, double rx, double ry, double start, double end,
    double width, const Paint& paint) {
    if (!canvas_) return;
    double span = end - start;
    if (fabs(span) > 360) span = span > 0 ? 360 : -360;
    // cubic approximation, at most a quarter turn per segment
    int segments = (int)ceil(fabs(span) / 90.0);
    if (segments == 0) return;
    double step = span / segments * M_PI / 180;
    double k = 4.0 / 3.0 * tan(step / 4);
    double t = start * M_PI / 180;

    Tvg_Paint shape = tvg_shape_new();
    tvg_shape_move_to(shape, (float)(cx + rx * cos(t)), (float)(cy + ry * sin(t)));
    for (int i = 0; i < segments; i++) {
        double t2 = t + step;
        double c1x = cx + rx * (cos(t) - k * sin(t));
        double c1y = cy + ry * (sin(t) + k * cos(t));
        double c2x = cx + rx * (cos(t2) + k * sin(t2));
        double c2y = cy + ry * (sin(t2) - k * cos(t2));
        tvg_shape_cubic_to(shape, (float)c1x, (float)c1y, (float)c2x, (float)c2y,
            (float)(cx + rx * cos(t2)), (float)(cy + ry * sin(t2)));
        t = t2;
    }
    stroke_shape(shape, width, paint);
}

void PngSurface::stroke_curve(double x1, double y1, double x2, double y2, double x3, double y3,
    double width, const Paint& paint) {
    if (!canvas_) return;
    // quadratic control point raised to cubic
    Tvg_Paint shape = tvg_shape_new();
    tvg_shape_move_to(shape, (float)x1, (float)y1);
    tvg_shape_cubic_to(shape,
        (float)(x1 + 2.0 / 3.0 * (x2 - x1)), (float)(y1 + 2.0 / 3.0 * (y2 - y1)),
        (float)(x3 + 2.0 / 3.0 * (x2 - x3)), (float)(y3 + 2.0 / 3.0 * (y2 - y3)),
        (float)x3, (float)y3);
    stroke_shape(shape, width, paint);
}

void PngSurface::fill_polygon(const std::vector<Point>& points, const Paint& paint) {
    if (!canvas_) return;
    if (points.size() < 3) return;
    Rgba color = paint_color(paint);
    Tvg_Paint shape = tvg_shape_new();
    tvg_shape_move_to(shape, (float)points[0].x, (float)points[0].y);
    for (size_t i = 1; i < points.size(); i++) {
        tvg_shape_line_to(shape, (float)points[i].x, (float)points[i].y);
    }
    tvg_shape_close(shape);
    tvg_shape_set_fill_color(shape, color.r, color.g, color.b, color.a);
    draw_shape(shape);
}

void PngSurface::draw_text(double x, double y, const std::string& text, const TextStyle& style) {
    if (!image_ || text.empty()) return;
    FT_Face face = fonts_->face(style.font, style.size);
    if (!face) return;  // no usable face, glyphs are skipped

    double pen_x = x;
    if (style.anchor != ANCHOR_START) {
        double width = fonts_->text_width(text, style.font, style.size);
        pen_x -= style.anchor == ANCHOR_MIDDLE ? width / 2 : width;
    }
    Rgba color = paint_color(style.paint);
    const Tvg_Matrix& m = transforms_.empty() ? IDENTITY : transforms_.back();

    // FreeType works with Y up, so a clockwise device rotation is counter-clockwise there
    double angle = atan2(m.e21, m.e11);
    FT_Matrix rotation;
    rotation.xx = (FT_Fixed)(cos(angle) * 0x10000L);
    rotation.xy = (FT_Fixed)(sin(angle) * 0x10000L);
    rotation.yx = (FT_Fixed)(-sin(angle) * 0x10000L);
    rotation.yy = (FT_Fixed)(cos(angle) * 0x10000L);

    FT_UInt previous = 0;
    bool kerning = FT_HAS_KERNING(face);
    const char* p = text.c_str();
    while (*p) {
        uint32_t cp = utf8_next(&p);
        FT_UInt index = FT_Get_Char_Index(face, cp);
        if (kerning && previous && index) {
            FT_Vector delta;
            if (!FT_Get_Kerning(face, previous, index, FT_KERNING_DEFAULT, &delta)) pen_x += delta.x / 64.0;
        }
        previous = index;

        double dx = m.e11 * pen_x + m.e12 * y + m.e13;
        double dy = m.e21 * pen_x + m.e22 * y + m.e23;
        double ix = floor(dx), iy = floor(dy);
        // sub-pixel pen position in 26.6, Y up
        FT_Vector offset;
        offset.x = (FT_Pos)((dx - ix) * 64);
        offset.y = (FT_Pos)(-(dy - iy) * 64);
        FT_Set_Transform(face, &rotation, &offset);

        if (FT_Load_Glyph(face, index, FT_LOAD_RENDER | FT_LOAD_NO_HINTING)) continue;
        FT_GlyphSlot slot = face->glyph;
        raster_render_bitmap(image_, &slot->bitmap, (int)ix + slot->bitmap_left, (int)iy - slot->bitmap_top, color);
        pen_x += slot->linearHoriAdvance / 65536.0;
    }
    FT_Set_Transform(face, nullptr, nullptr);
}

void PngSurface::draw_image(double cx, double cy, double w, double h, const ImageData& image,
    const std::string& name) {
    if (!image_) return;
    int iw = (int)w, ih = (int)h;
    int x = (int)(cx - w / 2), y = (int)(cy - h / 2);
    log_debug("render_png: image %s at %d,%d size %dx%d", name.c_str(), x, y, iw, ih);
    raster_blit_scaled(image_, image, x, y, iw, ih);
}

void PngSurface::push_rotation(double degrees, double cx, double cy) {
    double t = degrees * M_PI / 180;
    float c = (float)cos(t), s = (float)sin(t);
    Tvg_Matrix rotate = {
        c, -s, (float)(cx - c * cx + s * cy),
        s,  c, (float)(cy - s * cx - c * cy),
        0.0f, 0.0f, 1.0f
    };
    const Tvg_Matrix& top = transforms_.empty() ? IDENTITY : transforms_.back();
    transforms_.push_back(matrix_multiply(top, rotate));
}

void PngSurface::pop_rotation() {
    if (!transforms_.empty()) transforms_.pop_back();
}

DeckStatus render_png(const Deck& deck, const RenderOptions& options, FontSet* fonts,
    std::string* out, DeckError* err) {
    PngSurface surface(fonts);
    render_slide(&surface, deck, options.slide_index, options);
    if (!surface.image()) {
        return deck_fail(err, DECK_ERR_OUTPUT_IO, STAGE_RENDER, "cannot allocate page buffer");
    }
    if (!raster_encode_png(surface.image(), out)) {
        return deck_fail(err, DECK_ERR_OUTPUT_IO, STAGE_RENDER, "PNG encoding failed");
    }
    log_debug("render_png: slide %d, %zu bytes", options.slide_index + 1, out->size());
    return DECK_OK;
}

} // namespace deck
