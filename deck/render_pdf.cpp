#include "render_pdf.hpp"
#include "dispatch.hpp"
#include "../lib/log.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace deck {

const char* get_pdf_font_name(const std::string& family, int weight) {
    std::string name = family;
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return (char)tolower(c); });
    bool bold = weight >= 600;

    if (name.find("courier") != std::string::npos || name.find("mono") != std::string::npos ||
        name.find("console") != std::string::npos) {
        return bold ? "Courier-Bold" : "Courier";
    }
    if (name.find("symbol") != std::string::npos) return "Symbol";
    // "sans-serif" must not match the serif families below
    if (name.find("sans") == std::string::npos &&
        (name.find("times") != std::string::npos || name.find("serif") != std::string::npos ||
         name.find("georgia") != std::string::npos || name.find("palatino") != std::string::npos)) {
        return bold ? "Times-Bold" : "Times-Roman";
    }
    return bold ? "Helvetica-Bold" : "Helvetica";
}

PdfSurface::PdfSurface(FontSet* fonts, PdfDoc* doc)
    : DrawingSurface(fonts), doc_(doc), page_(nullptr), width_(0), height_(0), saved_states_(0) {}

void PdfSurface::begin_page(int index, double width, double height, const std::string& title) {
    (void)title;
    width_ = width;
    height_ = height;
    saved_states_ = 0;
    page_ = pdf_add_page(doc_, (float)width, (float)height);
    if (!page_) log_error("render_pdf: cannot add page %d", index + 1);
}

void PdfSurface::end_page() {
    while (saved_states_ > 0) pop_rotation();
    page_ = nullptr;
}

void PdfSurface::set_fill(const Paint& paint) {
    pdf_page_set_rgb_fill(page_, paint.rgba.r / 255.0f, paint.rgba.g / 255.0f, paint.rgba.b / 255.0f);
}

void PdfSurface::set_stroke(const Paint& paint, double width) {
    pdf_page_set_rgb_stroke(page_, paint.rgba.r / 255.0f, paint.rgba.g / 255.0f, paint.rgba.b / 255.0f);
    pdf_page_set_line_width(page_, (float)width);
    pdf_page_set_line_cap(page_, PDF_LINE_CAP_BUTT);
}

void PdfSurface::fill_background(const Paint& paint) {
    if (!page_) return;
    if (paint.rgba.a == 0) return;  // transparent leaves the page blank
    set_fill(paint);
    pdf_page_rectangle(page_, 0, 0, (float)width_, (float)height_);
    pdf_page_fill(page_);
}

void PdfSurface::fill_linear_gradient(double x, double y, double w, double h,
    const Paint& color1, const Paint& color2, double gp) {
    (void)color2;  (void)gp;
    fill_rect(x, y, w, h, color1);
}

void PdfSurface::fill_rect(double x, double y, double w, double h, const Paint& paint) {
    if (!page_) return;
    set_fill(paint);
    pdf_page_rectangle(page_, (float)x, flip(y + h), (float)w, (float)h);
    pdf_page_fill(page_);
}

void PdfSurface::fill_ellipse(double cx, double cy, double rx, double ry, const Paint& paint) {
    if (!page_) return;
    set_fill(paint);
    pdf_page_ellipse(page_, (float)cx, flip(cy), (float)rx, (float)ry);
    pdf_page_fill(page_);
}

void PdfSurface::stroke_line(double x1, double y1, double x2, double y2, double width, const Paint& paint) {
    if (!page_) return;
    set_stroke(paint, width);
    pdf_page_move_to(page_, (float)x1, flip(y1));
    pdf_page_line_to(page_, (float)x2, flip(y2));
    pdf_page_stroke(page_);
}

void PdfSurface::stroke_arc(double cx, double cy, double rx, double ry, double start, double end,
    double width, const Paint& paint) {
    (void)start;  (void)end;
    if (!page_) return;
    set_stroke(paint, width);
    pdf_page_ellipse(page_, (float)cx, flip(cy), (float)rx, (float)ry);
    pdf_page_stroke(page_);
}

void PdfSurface::stroke_curve(double x1, double y1, double x2, double y2, double x3, double y3,
    double width, const Paint& paint) {
    (void)x2;  (void)y2;
    stroke_line(x1, y1, x3, y3, width, paint);
}

void PdfSurface::fill_polygon(const std::vector<Point>& points, const Paint& paint) {
    if (!page_ || points.size() < 3) return;
    set_fill(paint);
    pdf_page_move_to(page_, (float)points[0].x, flip(points[0].y));
    for (size_t i = 1; i < points.size(); i++) {
        pdf_page_line_to(page_, (float)points[i].x, flip(points[i].y));
    }
    pdf_page_close_path(page_);
    pdf_page_fill(page_);
}

void PdfSurface::draw_text(double x, double y, const std::string& text, const TextStyle& style) {
    if (!page_ || text.empty()) return;
    double start = x;
    if (style.anchor != ANCHOR_START) {
        double width = text_width(text, style);
        start -= style.anchor == ANCHOR_MIDDLE ? width / 2 : width;
    }
    set_fill(style.paint);
    pdf_page_set_font_and_size(page_, get_pdf_font_name(style.font.family, style.font.weight), (float)style.size);
    pdf_page_text_out(page_, (float)start, flip(y), text.c_str());
}

void PdfSurface::draw_image(double cx, double cy, double w, double h, const ImageData& image,
    const std::string& name) {
    if (!page_ || !image.pixels) return;
    int status = pdf_page_draw_image_rgba(page_, image.pixels, image.width, image.height,
        (float)(cx - w / 2), flip(cy + h / 2), (float)w, (float)h);
    if (status != PDF_OK) log_warn("render_pdf: cannot embed image %s (0x%04X)", name.c_str(), status);
}

void PdfSurface::push_rotation(double degrees, double cx, double cy) {
    if (!page_) return;
    // clockwise on a top-down page is a negative angle on the bottom-up PDF page
    double phi = -degrees * M_PI / 180;
    double px = cx, py = height_ - cy;
    double a = cos(phi), b = sin(phi), c = -sin(phi), d = cos(phi);
    pdf_page_gsave(page_);
    pdf_page_concat(page_, (float)a, (float)b, (float)c, (float)d,
        (float)(px - a * px - c * py), (float)(py - b * px - d * py));
    saved_states_++;
}

void PdfSurface::pop_rotation() {
    if (!page_ || saved_states_ == 0) return;
    pdf_page_grestore(page_);
    saved_states_--;
}

DeckStatus render_pdf(const Deck& deck, const RenderOptions& options, FontSet* fonts,
    std::string* out, DeckError* err) {
    if (deck.slides.empty()) {
        return deck_fail(err, DECK_ERR_SLIDE_INDEX, STAGE_RENDER, "deck has no slides");
    }
    PdfDoc* doc = pdf_new();
    if (!doc) return deck_fail(err, DECK_ERR_OUTPUT_IO, STAGE_RENDER, "cannot create PDF document");
    pdf_set_compression(doc, true);
    pdf_set_info(doc, PDF_INFO_CREATOR, "deck");
    if (!options.title.empty()) pdf_set_info(doc, PDF_INFO_TITLE, options.title.c_str());

    PdfSurface surface(fonts, doc);
    for (int i = 0; i < (int)deck.slides.size(); i++) {
        render_slide(&surface, deck, i, options);
    }

    unsigned char* data = nullptr;
    size_t length = 0;
    int status = pdf_save_to_buffer(doc, &data, &length);
    pdf_free(doc);
    if (status != PDF_OK) {
        char message[64];
        snprintf(message, sizeof(message), "PDF serialization failed (0x%04X)", status);
        return deck_fail(err, DECK_ERR_OUTPUT_IO, STAGE_RENDER, message);
    }
    out->assign((const char*)data, length);
    free(data);
    log_debug("render_pdf: %zu pages, %zu bytes", deck.slides.size(), length);
    return DECK_OK;
}

} // namespace deck
