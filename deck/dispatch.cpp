#include "dispatch.hpp"
#include "coord.hpp"
#include "parse.hpp"
#include "../lib/log.h"
#include "../lib/image.h"
#include <cmath>
#include <cstdio>
#include <cstring>

namespace deck {

Paint Paint::of(const std::string& source, double opacity) {
    Paint paint;
    paint.source = source;
    paint.rgba = parse_color(source);
    paint.opacity = opacity;
    return paint;
}

double DrawingSurface::text_width(const std::string& text, const TextStyle& style) {
    return fonts_->text_width(text, style.font, style.size);
}

std::vector<std::string> split_layers(const std::string& layers) {
    std::vector<std::string> names;
    std::string current;
    for (char c : layers) {
        if (c == ':' || c == ',') {
            if (!current.empty()) names.push_back(current);
            current.clear();
        } else if (c != ' ') {
            current.push_back(c);
        }
    }
    if (!current.empty()) names.push_back(current);
    return names;
}

TextAnchor anchor_from_align(const std::string& align) {
    if (align == "center" || align == "middle" || align == "mid" || align == "c") return ANCHOR_MIDDLE;
    if (align == "right" || align == "end" || align == "e") return ANCHOR_END;
    return ANCHOR_START;
}

static std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

static std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            if (!current.empty()) words.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) words.push_back(current);
    return words;
}

int wrap_text(DrawingSurface* surface, const std::string& text, double x, double y,
    double width, double leading, const TextStyle& style) {
    TextStyle word_style = style;
    word_style.anchor = ANCHOR_START;
    double factor = style.font.mono ? MONO_WORD_SPACING_FACTOR : WORD_SPACING_FACTOR;
    double spacing = surface->text_width("M", word_style) * factor;
    double edge = x + width;
    double pen_x = x, pen_y = y;
    int breaks = 0;

    for (const std::string& word : split_words(text)) {
        if (word == "\\n") {
            pen_x = x;
            pen_y += leading;
            breaks++;
            continue;
        }
        surface->draw_text(pen_x, pen_y, word, word_style);
        pen_x += surface->text_width(word, word_style) + spacing;
        if (pen_x > edge) {
            pen_x = x;
            pen_y += leading;
            breaks++;
        }
    }
    return breaks;
}

// ============================================================================
// Per-shape layout
// ============================================================================

class SlideRenderer {
public:
    SlideRenderer(DrawingSurface* surface, const Deck& deck, const Slide& slide, const RenderOptions& options)
        : surface_(surface), slide_(slide), options_(options), w_(deck.width), h_(deck.height) {}

    void draw_layer(const std::string& layer);
    void draw_grid(double percent);

private:
    static std::string shape_color(const std::string& color) {
        return color.empty() ? std::string(DEFAULT_SHAPE_COLOR) : color;
    }
    static double stroke_width(double sp) {
        return sp == 0 ? DEFAULT_STROKE_WIDTH : sp;
    }
    TextStyle text_style(const std::string& font, const std::string& color, double opacity,
        double size, TextAnchor anchor);

    void draw_rect(const Rect& rect);
    void draw_ellipse(const Ellipse& ellipse);
    void draw_line(const Line& line);
    void draw_arc(const Arc& arc);
    void draw_curve(const Curve& curve);
    void draw_polygon(const Polygon& polygon);
    void draw_text(const Text& text);
    void draw_list(const List& list);
    void draw_image(const Image& image);

    DrawingSurface* surface_;
    const Slide& slide_;
    const RenderOptions& options_;
    double w_, h_;
};

TextStyle SlideRenderer::text_style(const std::string& font, const std::string& color, double opacity,
    double size, TextAnchor anchor) {
    FontSet* fonts = surface_->fonts();
    TextStyle style;
    style.font = fonts->resolve(font.empty() ? options_.font_family : font, options_.font_weight);
    style.css_family = fonts->resolver()->css_family(font, options_.font_family);
    style.size = size;
    style.anchor = anchor;
    style.paint = Paint::of(color.empty() ? slide_.foreground() : color, opacity);
    return style;
}

void SlideRenderer::draw_layer(const std::string& layer) {
    if (layer == "image") {
        for (const Image& image : slide_.images) draw_image(image);
    } else if (layer == "rect") {
        for (const Rect& rect : slide_.rects) draw_rect(rect);
    } else if (layer == "ellipse") {
        for (const Ellipse& ellipse : slide_.ellipses) draw_ellipse(ellipse);
    } else if (layer == "curve") {
        for (const Curve& curve : slide_.curves) draw_curve(curve);
    } else if (layer == "arc") {
        for (const Arc& arc : slide_.arcs) draw_arc(arc);
    } else if (layer == "line") {
        for (const Line& line : slide_.lines) draw_line(line);
    } else if (layer == "poly") {
        for (const Polygon& polygon : slide_.polygons) draw_polygon(polygon);
    } else if (layer == "text") {
        for (const Text& text : slide_.texts) draw_text(text);
    } else if (layer == "list") {
        for (const List& list : slide_.lists) draw_list(list);
    }
    // unknown layer names are skipped
}

void SlideRenderer::draw_rect(const Rect& rect) {
    Dimen d = dimen(w_, h_, rect.xp, rect.yp, 0);
    double w = pct(rect.wp, w_);
    double h = rect.hr != 0 ? pct(rect.hr, w) : pct(rect.hp, h_);
    if (!rect.gradcolor1.empty() && !rect.gradcolor2.empty()) {
        double gp = (rect.gp <= 0 || rect.gp > 100) ? 100 : rect.gp;
        surface_->fill_linear_gradient(d.x - w / 2, d.y - h / 2, w, h,
            Paint::of(rect.gradcolor1, rect.opacity), Paint::of(rect.gradcolor2, rect.opacity), gp);
        return;
    }
    surface_->fill_rect(d.x - w / 2, d.y - h / 2, w, h, Paint::of(shape_color(rect.color), rect.opacity));
}

void SlideRenderer::draw_ellipse(const Ellipse& ellipse) {
    Dimen d = dimen(w_, h_, ellipse.xp, ellipse.yp, 0);
    double w = pct(ellipse.wp, w_);
    double h = ellipse.hr != 0 ? pct(ellipse.hr, w) : pct(ellipse.hp, h_);
    surface_->fill_ellipse(d.x, d.y, w / 2, h / 2, Paint::of(shape_color(ellipse.color), ellipse.opacity));
}

void SlideRenderer::draw_line(const Line& line) {
    Dimen p1 = dimen(w_, h_, line.xp1, line.yp1, 0);
    Dimen p2 = dimen(w_, h_, line.xp2, line.yp2, 0);
    surface_->stroke_line(p1.x, p1.y, p2.x, p2.y, stroke_width(line.sp),
        Paint::of(shape_color(line.color), line.opacity));
}

void SlideRenderer::draw_arc(const Arc& arc) {
    Dimen d = dimen(w_, h_, arc.xp, arc.yp, 0);
    // both radii scale with the canvas width so a wp == hp arc is circular
    double w = pct(arc.wp, w_);
    double h = pct(arc.hp, w_);
    surface_->stroke_arc(d.x, d.y, w / 2, h / 2, 360 - arc.a1, 360 - arc.a2, stroke_width(arc.sp),
        Paint::of(shape_color(arc.color), arc.opacity));
}

void SlideRenderer::draw_curve(const Curve& curve) {
    Dimen p1 = dimen(w_, h_, curve.xp1, curve.yp1, 0);
    Dimen p2 = dimen(w_, h_, curve.xp2, curve.yp2, 0);
    Dimen p3 = dimen(w_, h_, curve.xp3, curve.yp3, 0);
    surface_->stroke_curve(p1.x, p1.y, p2.x, p2.y, p3.x, p3.y, stroke_width(curve.sp),
        Paint::of(shape_color(curve.color), curve.opacity));
}

void SlideRenderer::draw_polygon(const Polygon& polygon) {
    std::vector<double> xs, ys;
    if (!parse_number_list(polygon.xc, &xs) || !parse_number_list(polygon.yc, &ys) ||
        xs.size() != ys.size() || xs.size() < 3) {
        log_debug("dispatch: skipping polygon with %zu x and %zu y coordinates", xs.size(), ys.size());
        return;
    }
    std::vector<Point> points;
    points.reserve(xs.size());
    for (size_t i = 0; i < xs.size(); i++) {
        points.push_back(Point{ device_x(xs[i], w_), device_y(ys[i], h_) });
    }
    surface_->fill_polygon(points, Paint::of(shape_color(polygon.color), polygon.opacity));
}

void SlideRenderer::draw_text(const Text& text) {
    Dimen d = dimen(w_, h_, text.xp, text.yp, text.sp);
    double fs = d.size;
    bool code = text.type == "code";
    TextStyle style = text_style(code ? "mono" : text.font, text.color, text.opacity, fs,
        code ? ANCHOR_START : anchor_from_align(text.align));
    double lp = text.lp == 0 ? DEFAULT_LINE_SPACING : text.lp;
    double leading = lp * fs;

    if (text.rotation != 0) surface_->push_rotation(360 - text.rotation, d.x, d.y);

    if (code) {
        std::vector<std::string> lines = split_lines(text.tdata);
        double bw = pwidth(text.wp, w_, w_ - d.x - 20);
        double bh = lines.size() * leading;
        // background sits below the glyphs
        surface_->fill_rect(d.x - fs, d.y - fs, bw, bh, Paint::of(CODE_BACKGROUND));
        for (size_t i = 0; i < lines.size(); i++) {
            if (!lines[i].empty()) surface_->draw_text(d.x, d.y + i * leading, lines[i], style);
        }
    } else if (text.type == "block") {
        wrap_text(surface_, text.tdata, d.x, d.y, pwidth(text.wp, w_, w_ / 2), leading, style);
    } else {
        std::vector<std::string> lines = split_lines(text.tdata);
        for (size_t i = 0; i < lines.size(); i++) {
            if (!lines[i].empty()) surface_->draw_text(d.x, d.y + i * leading, lines[i], style);
        }
    }

    if (text.rotation != 0) surface_->pop_rotation();
}

void SlideRenderer::draw_list(const List& list) {
    Dimen d = dimen(w_, h_, list.xp, list.yp, list.sp);
    double fs = d.size;
    double lp = list.lp == 0 ? DEFAULT_LIST_SPACING : list.lp;
    double leading = lp * fs;
    double wrap_width = pct(list.wp == 0 ? DEFAULT_LIST_WRAP : list.wp, w_);
    bool bullet = list.type == "bullet";
    bool number = list.type == "number";
    TextAnchor anchor = anchor_from_align(list.align);
    double x = d.x, y = d.y;
    if (bullet) x += 1.2 * fs;

    if (list.rotation != 0) surface_->push_rotation(360 - list.rotation, d.x, d.y);

    for (size_t i = 0; i < list.items.size(); i++) {
        const ListItem& item = list.items[i];
        const std::string& color = item.color.empty() ? list.color : item.color;
        const std::string& font = item.font.empty() ? list.font : item.font;
        double opacity = item.opacity != 0 ? item.opacity : list.opacity;
        TextStyle style = text_style(font, color, opacity, fs, anchor);
        std::string content = number ? std::to_string(i + 1) + ". " + item.text : item.text;

        if (bullet) surface_->fill_ellipse(x - fs, y - fs / 4, fs / 4, fs / 4, style.paint);
        if (anchor == ANCHOR_MIDDLE) {
            surface_->draw_text(x, y, content, style);
            y += leading;
        } else {
            int breaks = wrap_text(surface_, content, x, y, wrap_width, leading, style);
            y += leading * (1 + breaks);
        }
    }

    if (list.rotation != 0) surface_->pop_rotation();
}

void SlideRenderer::draw_image(const Image& image) {
    int natural_w = 0, natural_h = 0;
    unsigned char* pixels = image_load(image.name.c_str(), &natural_w, &natural_h, nullptr);
    if (!pixels) {
        log_warn("dispatch: cannot load image %s, skipping", image.name.c_str());
        return;
    }

    Dimen d = dimen(w_, h_, image.xp, image.yp, 0);
    double iw = image.width, ih = image.height;
    if (image.width == 0 && image.height == 0) {
        iw = natural_w;
        ih = natural_h;
    } else if (image.height == 0 && image.width > 0) {
        // width is a percentage of the canvas, aspect preserved
        iw = pct(image.width, w_);
        ih = iw * natural_h / natural_w;
    }
    if (image.scale > 0) {
        iw *= image.scale / 100;
        ih *= image.scale / 100;
    }
    if (image.autoscale == "on" && iw > 0) {
        double ratio = w_ / iw;
        iw = w_;
        ih *= ratio;
    }

    ImageData data = { pixels, natural_w, natural_h };
    surface_->draw_image(d.x, d.y, iw, ih, data, image.name);
    image_free(pixels);

    if (!image.caption.empty()) {
        double capsize = pwidth(image.sp, w_, pct(2, w_));
        TextStyle style = text_style(image.font.empty() ? "sans" : image.font, image.color, 0, capsize,
            anchor_from_align(image.align.empty() ? "center" : image.align));
        surface_->draw_text(d.x, d.y + ih / 2 + 1.5 * capsize, image.caption, style);
    }
}

void SlideRenderer::draw_grid(double percent) {
    Paint paint = Paint::of(slide_.foreground());
    double label_size = pct(1.0, w_);
    TextStyle label = text_style("sans", slide_.foreground(), 0, label_size, ANCHOR_START);
    if (percent < MIN_GRID_PERCENT) percent = MIN_GRID_PERCENT;
    int steps = (int)floor(100.0 / percent + 1e-9);
    char buf[32];

    for (int i = 0; i <= steps; i++) {
        double value = i * percent;
        double x = pct(value, w_);
        surface_->stroke_line(x, 0, x, h_, GRID_STROKE_WIDTH, paint);
        snprintf(buf, sizeof(buf), "%g", value);
        label.anchor = ANCHOR_MIDDLE;
        surface_->draw_text(x, h_ - label_size * 0.5, buf, label);
    }
    for (int i = 0; i <= steps; i++) {
        double value = i * percent;
        double y = device_y(value, h_);
        surface_->stroke_line(0, y, w_, y, GRID_STROKE_WIDTH, paint);
        snprintf(buf, sizeof(buf), "%g", value);
        label.anchor = ANCHOR_START;
        surface_->draw_text(label_size * 0.5, y - label_size * 0.25, buf, label);
    }
}

// ============================================================================
// Slide entry point
// ============================================================================

void render_slide(DrawingSurface* surface, const Deck& deck, int index, const RenderOptions& options) {
    const Slide& slide = deck.slides[index];
    double w = deck.width, h = deck.height;
    std::string title = options.title.empty() ? "" : options.title + ": Slide " + std::to_string(index + 1);

    surface->begin_page(index, w, h, title);
    surface->fill_background(Paint::of(slide.background()));
    if (slide.has_gradient()) {
        double gp = (slide.gp <= 0 || slide.gp > 100) ? 100 : slide.gp;
        surface->fill_linear_gradient(0, 0, w, h, Paint::of(slide.gradcolor1), Paint::of(slide.gradcolor2), gp);
    }

    SlideRenderer renderer(surface, deck, slide, options);
    for (const std::string& layer : split_layers(options.layers)) {
        renderer.draw_layer(layer);
    }
    if (options.grid_percent > 0) renderer.draw_grid(options.grid_percent);
    surface->end_page();
}

} // namespace deck
