#include "font_face.hpp"
#include "../lib/log.h"

namespace deck {

static log_category_t* font_log() {
    static log_category_t* category = log_get_category("deck.font");
    return category;
}

uint32_t utf8_next(const char** p) {
    const unsigned char* s = (const unsigned char*)*p;
    uint32_t cp;
    int extra;
    if (s[0] < 0x80) { cp = s[0];  extra = 0; }
    else if ((s[0] & 0xE0) == 0xC0) { cp = s[0] & 0x1F;  extra = 1; }
    else if ((s[0] & 0xF0) == 0xE0) { cp = s[0] & 0x0F;  extra = 2; }
    else if ((s[0] & 0xF8) == 0xF0) { cp = s[0] & 0x07;  extra = 3; }
    else { *p += 1;  return 0xFFFD; }
    for (int i = 1; i <= extra; i++) {
        if ((s[i] & 0xC0) != 0x80) { *p += i;  return 0xFFFD; }
        cp = (cp << 6) | (s[i] & 0x3F);
    }
    *p += 1 + extra;
    return cp;
}

FontSet::FontSet(FontResolver* resolver) : resolver_(resolver), library_(nullptr), warnings_(0) {
    if (FT_Init_FreeType(&library_)) {
        clog_error(font_log(), "failed to initialize FreeType, using built-in metrics");
        library_ = nullptr;
    }
}

FontSet::~FontSet() {
    for (auto& entry : faces_) {
        if (entry.second) FT_Done_Face(entry.second);
    }
    if (library_) FT_Done_FreeType(library_);
}

FT_Face FontSet::face(const FontHandle& handle, double size) {
    if (!library_ || size <= 0) return nullptr;
    if (handle.path.empty()) {
        auto missing = faces_.find("");
        if (missing == faces_.end()) {
            clog_warn(font_log(), "no font file for %s:%d, using built-in default face",
                handle.family.c_str(), handle.weight);
            warnings_++;
            faces_[""] = nullptr;
        }
        return nullptr;
    }

    FT_Face ft_face = nullptr;
    auto it = faces_.find(handle.path);
    if (it != faces_.end()) {
        ft_face = it->second;
    } else {
        if (FT_New_Face(library_, handle.path.c_str(), 0, &ft_face)) {
            clog_warn(font_log(), "failed to load font %s (%s), using built-in default face",
                handle.path.c_str(), handle.family.c_str());
            warnings_++;
            ft_face = nullptr;
        } else {
            clog_debug(font_log(), "font loaded: %s, units per em: %d", handle.path.c_str(), ft_face->units_per_EM);
        }
        faces_[handle.path] = ft_face;
    }
    if (!ft_face) return nullptr;

    // 26.6 fixed point char size at 72 dpi, so one point is one device unit
    FT_Set_Char_Size(ft_face, 0, (FT_F26Dot6)(size * 64.0 + 0.5), 72, 72);
    return ft_face;
}

double FontSet::text_width(const std::string& text, const FontHandle& handle, double size) {
    if (size <= 0 || text.empty()) return 0;
    FT_Face ft_face = face(handle, size);
    const char* p = text.c_str();
    if (!ft_face) {
        // estimate: average glyph advance relative to the em size
        double per_char = handle.mono ? 0.6 : 0.5;
        int count = 0;
        while (*p) { utf8_next(&p);  count++; }
        return count * per_char * size;
    }
    double width = 0;
    FT_UInt previous = 0;
    bool kerning = FT_HAS_KERNING(ft_face);
    while (*p) {
        uint32_t cp = utf8_next(&p);
        FT_UInt index = FT_Get_Char_Index(ft_face, cp);
        if (kerning && previous && index) {
            FT_Vector delta;
            if (!FT_Get_Kerning(ft_face, previous, index, FT_KERNING_DEFAULT, &delta)) width += delta.x / 64.0;
        }
        if (!FT_Load_Glyph(ft_face, index, FT_LOAD_NO_HINTING)) {
            width += ft_face->glyph->advance.x / 64.0;
        }
        previous = index;
    }
    return width;
}

} // namespace deck
