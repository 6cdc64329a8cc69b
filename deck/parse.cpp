#include "parse.hpp"
#include "../lib/log.h"
#include "../lib/file.h"
#include "../lib/strbuf.h"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

namespace deck {

const std::string& Slide::background() const {
    static const std::string dflt(DEFAULT_BACKGROUND);
    return bg.empty() ? dflt : bg;
}

const std::string& Slide::foreground() const {
    static const std::string dflt(DEFAULT_FOREGROUND);
    return fg.empty() ? dflt : fg;
}

// ============================================================================
// Slide auto-wrap
// ============================================================================

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && isspace((unsigned char)s[b])) b++;
    while (e > b && isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

// cut a <canvas .../> or <canvas ...></canvas> element out of content
static std::string take_canvas(std::string* content) {
    size_t start = content->find("<canvas");
    if (start == std::string::npos) return "";
    size_t gt = content->find('>', start);
    if (gt == std::string::npos) return "";
    size_t end = gt + 1;
    if ((*content)[gt - 1] != '/') {
        size_t close = content->find("</canvas>", gt);
        if (close == std::string::npos) return "";
        end = close + strlen("</canvas>");
    }
    std::string canvas = content->substr(start, end - start);
    content->erase(start, end - start);
    *content = trim(*content);
    return canvas;
}

std::string wrap_in_slide_if_needed(const std::string& xml, int width, int height) {
    std::string content = trim(xml);
    if (xml.find("<slide") != std::string::npos || content.empty()) return xml;

    size_t open = xml.find("<deck>");
    if (open != std::string::npos) {
        size_t start = open + strlen("<deck>");
        size_t end = xml.find("</deck>", start);
        if (end == std::string::npos) return xml;
        content = trim(xml.substr(start, end - start));
        if (content.empty()) return xml;
    }

    std::string canvas = take_canvas(&content);
    StrBuf* sb = strbuf_new();
    strbuf_append_str(sb, "<deck>\n  ");
    if (canvas.empty()) {
        strbuf_append_format(sb, "<canvas width=\"%d\" height=\"%d\"/>", width, height);
    } else {
        strbuf_append_str_n(sb, canvas.data(), canvas.size());
    }
    strbuf_append_str(sb, "\n  <slide>\n    ");
    strbuf_append_str_n(sb, content.data(), content.size());
    strbuf_append_str(sb, "\n  </slide>\n</deck>");
    std::string wrapped(sb->str ? sb->str : "", sb->length);
    strbuf_free(sb);
    return wrapped;
}

bool parse_number_list(const std::string& text, std::vector<double>* out) {
    out->clear();
    const char* p = text.c_str();
    while (*p) {
        while (*p && isspace((unsigned char)*p)) p++;
        if (!*p) break;
        char* end = nullptr;
        errno = 0;
        double v = strtod(p, &end);
        if (end == p || errno == ERANGE || (*end && !isspace((unsigned char)*end))) return false;
        out->push_back(v);
        p = end;
    }
    return true;
}

// ============================================================================
// XML to Deck
// ============================================================================

class DeckParser {
public:
    DeckParser(const RenderOptions& options, DeckError* err) : options_(options), err_(err) {}

    bool parse_root(xmlNodePtr root, Deck* deck);

private:
    bool fail(xmlNodePtr node, const char* attr, const std::string& value, const char* what);
    std::string str(xmlNodePtr node, const char* attr);
    std::string content(xmlNodePtr node);
    bool num(xmlNodePtr node, const char* attr, double* out);
    bool integer(xmlNodePtr node, const char* attr, int* out);

    bool parse_canvas(xmlNodePtr node, Deck* deck);
    bool parse_slide(xmlNodePtr node, Slide* slide);
    bool parse_rect(xmlNodePtr node, Rect* rect);
    bool parse_ellipse(xmlNodePtr node, Ellipse* ellipse);
    bool parse_line(xmlNodePtr node, Line* line);
    bool parse_arc(xmlNodePtr node, Arc* arc);
    bool parse_curve(xmlNodePtr node, Curve* curve);
    bool parse_polygon(xmlNodePtr node, Polygon* polygon);
    bool parse_text(xmlNodePtr node, Text* text);
    bool parse_list(xmlNodePtr node, List* list);
    bool parse_image(xmlNodePtr node, Image* image);

    const RenderOptions& options_;
    DeckError* err_;
};

static bool is_element(xmlNodePtr node, const char* name) {
    return node->type == XML_ELEMENT_NODE && xmlStrcmp(node->name, (const xmlChar*)name) == 0;
}

bool DeckParser::fail(xmlNodePtr node, const char* attr, const std::string& value, const char* what) {
    std::string msg = "element <" + std::string((const char*)node->name) + "> line " +
        std::to_string(xmlGetLineNo(node));
    if (attr) msg += ": attribute " + std::string(attr) + ": " + what + " \"" + value + "\"";
    else msg += ": " + std::string(what);
    deck_fail(err_, DECK_ERR_PARSE, STAGE_PARSE, msg);
    return false;
}

std::string DeckParser::str(xmlNodePtr node, const char* attr) {
    xmlChar* value = xmlGetProp(node, (const xmlChar*)attr);
    if (!value) return "";
    std::string result((const char*)value);
    xmlFree(value);
    return result;
}

std::string DeckParser::content(xmlNodePtr node) {
    xmlChar* value = xmlNodeGetContent(node);
    if (!value) return "";
    std::string result((const char*)value);
    xmlFree(value);
    return result;
}

// absent or empty attributes read as zero
bool DeckParser::num(xmlNodePtr node, const char* attr, double* out) {
    std::string value = trim(str(node, attr));
    if (value.empty()) return true;
    char* end = nullptr;
    errno = 0;
    double v = strtod(value.c_str(), &end);
    if (end == value.c_str() || *end || errno == ERANGE) return fail(node, attr, value, "invalid number");
    *out = v;
    return true;
}

bool DeckParser::integer(xmlNodePtr node, const char* attr, int* out) {
    std::string value = trim(str(node, attr));
    if (value.empty()) return true;
    char* end = nullptr;
    errno = 0;
    long v = strtol(value.c_str(), &end, 10);
    if (end == value.c_str() || *end || errno == ERANGE || v > INT_MAX || v < INT_MIN) {
        return fail(node, attr, value, "invalid integer");
    }
    *out = (int)v;
    return true;
}

bool DeckParser::parse_root(xmlNodePtr root, Deck* deck) {
    if (!root || !is_element(root, "deck")) {
        deck_fail(err_, DECK_ERR_PARSE, STAGE_PARSE,
            std::string("root element must be <deck>, found <") + (root ? (const char*)root->name : "none") + ">");
        return false;
    }
    bool has_canvas = false;
    for (xmlNodePtr child = root->children; child; child = child->next) {
        if (is_element(child, "canvas")) {
            if (!parse_canvas(child, deck)) return false;
            has_canvas = true;
        } else if (is_element(child, "slide")) {
            Slide slide;
            if (!parse_slide(child, &slide)) return false;
            deck->slides.push_back(std::move(slide));
        }
    }
    if (!has_canvas) {
        deck_fail(err_, DECK_ERR_PARSE, STAGE_PARSE, "missing <canvas> element");
        return false;
    }
    return true;
}

bool DeckParser::parse_canvas(xmlNodePtr node, Deck* deck) {
    int width = 0, height = 0;
    if (!integer(node, "width", &width) || !integer(node, "height", &height)) return false;
    if (width < 0) return fail(node, "width", std::to_string(width), "negative canvas size");
    if (height < 0) return fail(node, "height", std::to_string(height), "negative canvas size");
    deck->width = width ? width : options_.canvas_width;
    deck->height = height ? height : options_.canvas_height;
    return true;
}

bool DeckParser::parse_slide(xmlNodePtr node, Slide* slide) {
    slide->bg = str(node, "bg");
    slide->fg = str(node, "fg");
    slide->gradcolor1 = str(node, "gradcolor1");
    slide->gradcolor2 = str(node, "gradcolor2");
    if (!num(node, "gp", &slide->gp)) return false;

    for (xmlNodePtr child = node->children; child; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) continue;
        bool ok = true;
        if (is_element(child, "rect")) {
            slide->rects.emplace_back();
            ok = parse_rect(child, &slide->rects.back());
        } else if (is_element(child, "ellipse")) {
            slide->ellipses.emplace_back();
            ok = parse_ellipse(child, &slide->ellipses.back());
        } else if (is_element(child, "line")) {
            slide->lines.emplace_back();
            ok = parse_line(child, &slide->lines.back());
        } else if (is_element(child, "arc")) {
            slide->arcs.emplace_back();
            ok = parse_arc(child, &slide->arcs.back());
        } else if (is_element(child, "curve")) {
            slide->curves.emplace_back();
            ok = parse_curve(child, &slide->curves.back());
        } else if (is_element(child, "polygon")) {
            slide->polygons.emplace_back();
            ok = parse_polygon(child, &slide->polygons.back());
        } else if (is_element(child, "text")) {
            slide->texts.emplace_back();
            ok = parse_text(child, &slide->texts.back());
        } else if (is_element(child, "list")) {
            slide->lists.emplace_back();
            ok = parse_list(child, &slide->lists.back());
        } else if (is_element(child, "image")) {
            slide->images.emplace_back();
            ok = parse_image(child, &slide->images.back());
        } else {
            log_debug("parse: ignoring element <%s>", (const char*)child->name);
        }
        if (!ok) return false;
    }
    return true;
}

bool DeckParser::parse_rect(xmlNodePtr node, Rect* rect) {
    rect->color = str(node, "color");
    rect->gradcolor1 = str(node, "gradcolor1");
    rect->gradcolor2 = str(node, "gradcolor2");
    return num(node, "xp", &rect->xp) && num(node, "yp", &rect->yp) &&
        num(node, "wp", &rect->wp) && num(node, "hp", &rect->hp) &&
        num(node, "hr", &rect->hr) && num(node, "opacity", &rect->opacity) &&
        num(node, "gp", &rect->gp);
}

bool DeckParser::parse_ellipse(xmlNodePtr node, Ellipse* ellipse) {
    ellipse->color = str(node, "color");
    return num(node, "xp", &ellipse->xp) && num(node, "yp", &ellipse->yp) &&
        num(node, "wp", &ellipse->wp) && num(node, "hp", &ellipse->hp) &&
        num(node, "hr", &ellipse->hr) && num(node, "opacity", &ellipse->opacity);
}

bool DeckParser::parse_line(xmlNodePtr node, Line* line) {
    line->color = str(node, "color");
    return num(node, "xp1", &line->xp1) && num(node, "yp1", &line->yp1) &&
        num(node, "xp2", &line->xp2) && num(node, "yp2", &line->yp2) &&
        num(node, "sp", &line->sp) && num(node, "opacity", &line->opacity);
}

bool DeckParser::parse_arc(xmlNodePtr node, Arc* arc) {
    arc->color = str(node, "color");
    return num(node, "xp", &arc->xp) && num(node, "yp", &arc->yp) &&
        num(node, "wp", &arc->wp) && num(node, "hp", &arc->hp) &&
        num(node, "a1", &arc->a1) && num(node, "a2", &arc->a2) &&
        num(node, "sp", &arc->sp) && num(node, "opacity", &arc->opacity);
}

bool DeckParser::parse_curve(xmlNodePtr node, Curve* curve) {
    curve->color = str(node, "color");
    return num(node, "xp1", &curve->xp1) && num(node, "yp1", &curve->yp1) &&
        num(node, "xp2", &curve->xp2) && num(node, "yp2", &curve->yp2) &&
        num(node, "xp3", &curve->xp3) && num(node, "yp3", &curve->yp3) &&
        num(node, "sp", &curve->sp) && num(node, "opacity", &curve->opacity);
}

bool DeckParser::parse_polygon(xmlNodePtr node, Polygon* polygon) {
    polygon->xc = str(node, "xc");
    polygon->yc = str(node, "yc");
    polygon->color = str(node, "color");
    std::vector<double> values;
    if (!parse_number_list(polygon->xc, &values)) return fail(node, "xc", polygon->xc, "invalid number list");
    if (!parse_number_list(polygon->yc, &values)) return fail(node, "yc", polygon->yc, "invalid number list");
    return num(node, "opacity", &polygon->opacity);
}

// contents of an included file, tabs expanded to four spaces
static bool read_include_file(const std::string& path, std::string* out) {
    char* data = read_text_file(path.c_str());
    if (!data) return false;
    out->clear();
    for (const char* p = data; *p; p++) {
        if (*p == '\t') out->append("    ");
        else out->push_back(*p);
    }
    free(data);
    return true;
}

bool DeckParser::parse_text(xmlNodePtr node, Text* text) {
    text->type = str(node, "type");
    text->align = str(node, "align");
    text->font = str(node, "font");
    text->color = str(node, "color");
    text->file = str(node, "file");
    text->link = str(node, "link");
    text->tdata = content(node);
    if (!text->file.empty() && !read_include_file(text->file, &text->tdata)) {
        log_warn("parse: cannot read text file %s, keeping inline text", text->file.c_str());
    }
    return num(node, "xp", &text->xp) && num(node, "yp", &text->yp) &&
        num(node, "sp", &text->sp) && num(node, "wp", &text->wp) &&
        num(node, "lp", &text->lp) && num(node, "opacity", &text->opacity) &&
        num(node, "rotation", &text->rotation);
}

bool DeckParser::parse_list(xmlNodePtr node, List* list) {
    list->type = str(node, "type");
    list->align = str(node, "align");
    list->font = str(node, "font");
    list->color = str(node, "color");
    if (!(num(node, "xp", &list->xp) && num(node, "yp", &list->yp) &&
        num(node, "sp", &list->sp) && num(node, "wp", &list->wp) &&
        num(node, "lp", &list->lp) && num(node, "opacity", &list->opacity) &&
        num(node, "rotation", &list->rotation))) return false;

    for (xmlNodePtr child = node->children; child; child = child->next) {
        if (!is_element(child, "li")) continue;
        ListItem item;
        item.color = str(child, "color");
        item.font = str(child, "font");
        item.text = content(child);
        if (!num(child, "opacity", &item.opacity)) return false;
        list->items.push_back(std::move(item));
    }
    return true;
}

bool DeckParser::parse_image(xmlNodePtr node, Image* image) {
    image->autoscale = str(node, "autoscale");
    image->name = str(node, "name");
    image->caption = str(node, "caption");
    image->font = str(node, "font");
    image->color = str(node, "color");
    image->align = str(node, "align");
    image->link = str(node, "link");
    return num(node, "xp", &image->xp) && num(node, "yp", &image->yp) &&
        integer(node, "width", &image->width) && integer(node, "height", &image->height) &&
        num(node, "scale", &image->scale) && num(node, "sp", &image->sp);
}

DeckStatus parse_deck(const std::string& xml, const RenderOptions& options, Deck* out, DeckError* err) {
    xmlParserCtxtPtr ctxt = xmlNewParserCtxt();
    if (!ctxt) return deck_fail(err, DECK_ERR_PARSE, STAGE_PARSE, "cannot create XML parser");

    xmlDocPtr doc = xmlCtxtReadMemory(ctxt, xml.data(), (int)xml.size(), "deck.xml", "UTF-8",
        XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
    if (!doc) {
        const xmlError* xerr = xmlCtxtGetLastError(ctxt);
        std::string msg = "malformed XML";
        if (xerr && xerr->message) {
            msg += " at line " + std::to_string(xerr->line) + ": " + trim(xerr->message);
        }
        xmlFreeParserCtxt(ctxt);
        return deck_fail(err, DECK_ERR_PARSE, STAGE_PARSE, msg);
    }

    Deck deck;
    deck.width = options.canvas_width;
    deck.height = options.canvas_height;
    DeckParser parser(options, err);
    bool ok = parser.parse_root(xmlDocGetRootElement(doc), &deck);
    xmlFreeDoc(doc);
    xmlFreeParserCtxt(ctxt);
    if (!ok) return err ? err->code : DECK_ERR_PARSE;

    log_debug("parse: deck %dx%d with %zu slides", deck.width, deck.height, deck.slides.size());
    *out = std::move(deck);
    return DECK_OK;
}

} // namespace deck
