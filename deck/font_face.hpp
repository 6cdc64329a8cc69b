// font_face.hpp - Per-render FreeType faces for measuring and rasterizing text
//
// A FontSet belongs to one render call: FreeType libraries are not safe to
// share between threads, so each render opens its own. Faces that fail to
// load are reported once as a font load warning and replaced by built-in
// metrics (measuring) or skipped glyphs (rasterizing).

#ifndef DECK_FONT_FACE_HPP
#define DECK_FONT_FACE_HPP

#include "font_resolver.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <ft2build.h>
#include FT_FREETYPE_H

namespace deck {

class FontSet {
public:
    explicit FontSet(FontResolver* resolver);
    ~FontSet();

    FontSet(const FontSet&) = delete;
    FontSet& operator=(const FontSet&) = delete;

    FontHandle resolve(const std::string& family, int weight) { return resolver_->resolve(family, weight); }
    FontResolver* resolver() { return resolver_; }

    // face sized to size pixels per em, nullptr when the handle has no usable file
    FT_Face face(const FontHandle& handle, double size);

    // advance width of UTF-8 text at size
    double text_width(const std::string& text, const FontHandle& handle, double size);

    int warning_count() const { return warnings_; }

private:
    FontResolver* resolver_;
    FT_Library library_;
    std::unordered_map<std::string, FT_Face> faces_;   // path -> face, nullptr if it failed
    int warnings_;
};

// decode one UTF-8 sequence at *p and advance past it; malformed bytes yield U+FFFD
uint32_t utf8_next(const char** p);

} // namespace deck

#endif // DECK_FONT_FACE_HPP
