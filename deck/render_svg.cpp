#include "render_svg.hpp"
#include "dispatch.hpp"
#include "color.hpp"
#include "../lib/log.h"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace deck {

static const char* anchor_name(TextAnchor anchor) {
    switch (anchor) {
    case ANCHOR_MIDDLE: return "middle";
    case ANCHOR_END:    return "end";
    default:            return "start";
    }
}

// the document spelling when it is a color we understand and safe inside a
// style attribute, otherwise the parsed channels
static std::string svg_color(const Paint& paint) {
    const std::string& source = paint.source;
    bool safe = !source.empty() && is_known_color(source);
    for (size_t i = 0; safe && i < source.size(); i++) {
        unsigned char c = (unsigned char)source[i];
        safe = isalnum(c) || strchr("#(),.% -", c) != nullptr;
    }
    if (safe) return source;
    char buf[32];
    snprintf(buf, sizeof(buf), "rgb(%d,%d,%d)", paint.rgba.r, paint.rgba.g, paint.rgba.b);
    return buf;
}

SvgSurface::SvgSurface(FontSet* fonts)
    : DrawingSurface(fonts), svg_(strbuf_new_cap(8192)), width_(0), height_(0),
      indent_level_(0), gradient_count_(0) {}

SvgSurface::~SvgSurface() {
    strbuf_free(svg_);
}

std::string SvgSurface::output() const {
    return std::string(svg_->str, svg_->length);
}

void SvgSurface::indent() {
    strbuf_append_char_n(svg_, ' ', indent_level_ * 2);
}

void SvgSurface::begin_page(int index, double width, double height, const std::string& title) {
    (void)index;
    width_ = width;
    height_ = height;
    gradient_count_ = 0;
    strbuf_append_format(svg_,
        "<?xml version=\"1.0\"?>\n"
        "<svg width=\"%d\" height=\"%d\"\n"
        "     xmlns=\"http://www.w3.org/2000/svg\"\n"
        "     xmlns:xlink=\"http://www.w3.org/1999/xlink\">\n",
        (int)width, (int)height);
    indent_level_ = 1;
    if (!title.empty()) {
        indent();
        strbuf_append_str(svg_, "<title>");
        strbuf_append_xml_escaped(svg_, title.c_str());
        strbuf_append_str(svg_, "</title>\n");
    }
}

void SvgSurface::end_page() {
    // close any rotation group left open
    while (indent_level_ > 1) pop_rotation();
    indent_level_ = 0;
    strbuf_append_str(svg_, "</svg>\n");
}

void SvgSurface::fill_background(const Paint& paint) {
    indent();
    strbuf_append_format(svg_, "<rect x=\"0\" y=\"0\" width=\"%.2f\" height=\"%.2f\" style=\"fill:%s\"/>\n",
        width_, height_, svg_color(paint).c_str());
}

void SvgSurface::fill_linear_gradient(double x, double y, double w, double h,
    const Paint& color1, const Paint& color2, double gp) {
    // first gradient is "slidegrad", later ones get a numeric suffix
    std::string id = "slidegrad";
    if (gradient_count_ > 0) id += std::to_string(gradient_count_);
    gradient_count_++;

    indent();
    strbuf_append_str(svg_, "<defs>\n");
    indent_level_++;
    indent();
    strbuf_append_format(svg_,
        "<linearGradient id=\"%s\" x1=\"0%%\" y1=\"0%%\" x2=\"0%%\" y2=\"100%%\">\n", id.c_str());
    indent_level_++;
    indent();
    strbuf_append_format(svg_, "<stop offset=\"0%%\" stop-color=\"%s\" stop-opacity=\"%.2f\"/>\n",
        svg_color(color1).c_str(), color1.alpha());
    indent();
    strbuf_append_format(svg_, "<stop offset=\"%.2f%%\" stop-color=\"%s\" stop-opacity=\"%.2f\"/>\n",
        gp, svg_color(color2).c_str(), color2.alpha());
    indent_level_--;
    indent();
    strbuf_append_str(svg_, "</linearGradient>\n");
    indent_level_--;
    indent();
    strbuf_append_str(svg_, "</defs>\n");
    indent();
    strbuf_append_format(svg_,
        "<rect x=\"%.2f\" y=\"%.2f\" width=\"%.2f\" height=\"%.2f\" style=\"fill:url(#%s)\"/>\n",
        x, y, w, h, id.c_str());
}

void SvgSurface::fill_rect(double x, double y, double w, double h, const Paint& paint) {
    indent();
    strbuf_append_format(svg_,
        "<rect x=\"%.2f\" y=\"%.2f\" width=\"%.2f\" height=\"%.2f\" style=\"fill:%s;fill-opacity:%.2f\"/>\n",
        x, y, w, h, svg_color(paint).c_str(), paint.alpha());
}

void SvgSurface::fill_ellipse(double cx, double cy, double rx, double ry, const Paint& paint) {
    indent();
    strbuf_append_format(svg_,
        "<ellipse cx=\"%.2f\" cy=\"%.2f\" rx=\"%.2f\" ry=\"%.2f\" style=\"fill:%s;fill-opacity:%.2f\"/>\n",
        cx, cy, rx, ry, svg_color(paint).c_str(), paint.alpha());
}

void SvgSurface::stroke_line(double x1, double y1, double x2, double y2, double width, const Paint& paint) {
    indent();
    strbuf_append_format(svg_,
        "<line x1=\"%.2f\" y1=\"%.2f\" x2=\"%.2f\" y2=\"%.2f\" "
        "style=\"stroke:%s;stroke-width:%.2f;stroke-opacity:%.2f\"/>\n",
        x1, y1, x2, y2, svg_color(paint).c_str(), width, paint.alpha());
}

void SvgSurface::stroke_arc(double cx, double cy, double rx, double ry, double start, double end,
    double width, const Paint& paint) {
    double span = end - start;
    if (fabs(span) >= 360) {
        // an arc whose endpoints coincide draws nothing, so a full turn is an ellipse outline
        indent();
        strbuf_append_format(svg_,
            "<ellipse cx=\"%.2f\" cy=\"%.2f\" rx=\"%.2f\" ry=\"%.2f\" "
            "style=\"fill:none;stroke:%s;stroke-width:%.2f;stroke-opacity:%.2f\"/>\n",
            cx, cy, rx, ry, svg_color(paint).c_str(), width, paint.alpha());
        return;
    }
    double t1 = start * M_PI / 180, t2 = end * M_PI / 180;
    int large = fabs(span) > 180 ? 1 : 0;
    int sweep = end > start ? 1 : 0;
    indent();
    strbuf_append_format(svg_,
        "<path d=\"M %.2f %.2f A %.2f %.2f 0 %d %d %.2f %.2f\" "
        "style=\"fill:none;stroke:%s;stroke-width:%.2f;stroke-opacity:%.2f\"/>\n",
        cx + rx * cos(t1), cy + ry * sin(t1), rx, ry, large, sweep,
        cx + rx * cos(t2), cy + ry * sin(t2), svg_color(paint).c_str(), width, paint.alpha());
}

void SvgSurface::stroke_curve(double x1, double y1, double x2, double y2, double x3, double y3,
    double width, const Paint& paint) {
    indent();
    strbuf_append_format(svg_,
        "<path d=\"M %.2f %.2f Q %.2f %.2f %.2f %.2f\" "
        "style=\"fill:none;stroke:%s;stroke-width:%.2f;stroke-opacity:%.2f\"/>\n",
        x1, y1, x2, y2, x3, y3, svg_color(paint).c_str(), width, paint.alpha());
}

void SvgSurface::fill_polygon(const std::vector<Point>& points, const Paint& paint) {
    indent();
    strbuf_append_str(svg_, "<polygon points=\"");
    for (size_t i = 0; i < points.size(); i++) {
        if (i) strbuf_append_char(svg_, ' ');
        strbuf_append_format(svg_, "%.2f,%.2f", points[i].x, points[i].y);
    }
    strbuf_append_format(svg_, "\" style=\"fill:%s;fill-opacity:%.2f\"/>\n", svg_color(paint).c_str(), paint.alpha());
}

void SvgSurface::draw_text(double x, double y, const std::string& text, const TextStyle& style) {
    indent();
    strbuf_append_format(svg_, "<text x=\"%.2f\" y=\"%.2f\" style=\"fill:%s;font-size:%.2fpx;font-family:",
        x, y, svg_color(style.paint).c_str(), style.size);
    // the family comes straight from the font attribute
    strbuf_append_xml_escaped(svg_, style.css_family.c_str());
    strbuf_append_format(svg_, ";text-anchor:%s", anchor_name(style.anchor));
    if (style.paint.opacity > 0) {
        strbuf_append_format(svg_, ";fill-opacity:%.2f", style.paint.alpha());
    }
    if (style.font.weight >= 600) {
        strbuf_append_str(svg_, ";font-weight:bold");
    }
    strbuf_append_str(svg_, "\">");
    strbuf_append_xml_escaped(svg_, text.c_str());
    strbuf_append_str(svg_, "</text>\n");
}

void SvgSurface::draw_image(double cx, double cy, double w, double h, const ImageData& image,
    const std::string& name) {
    (void)image;
    indent();
    strbuf_append_format(svg_, "<image x=\"%.2f\" y=\"%.2f\" width=\"%.2f\" height=\"%.2f\" xlink:href=\"",
        cx - w / 2, cy - h / 2, w, h);
    strbuf_append_xml_escaped(svg_, name.c_str());
    strbuf_append_str(svg_, "\"/>\n");
}

void SvgSurface::push_rotation(double degrees, double cx, double cy) {
    indent();
    strbuf_append_format(svg_, "<g transform=\"rotate(%.2f,%.2f,%.2f)\">\n", degrees, cx, cy);
    indent_level_++;
}

void SvgSurface::pop_rotation() {
    if (indent_level_ <= 1) return;
    indent_level_--;
    indent();
    strbuf_append_str(svg_, "</g>\n");
}

DeckStatus render_svg(const Deck& deck, const RenderOptions& options, FontSet* fonts,
    std::string* out, DeckError* err) {
    (void)err;
    SvgSurface surface(fonts);
    render_slide(&surface, deck, options.slide_index, options);
    *out = surface.output();
    log_debug("render_svg: slide %d, %zu bytes", options.slide_index + 1, out->size());
    return DECK_OK;
}

} // namespace deck
