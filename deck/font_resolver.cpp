#include "font_resolver.hpp"
#include "defaults.hpp"
#include "../lib/log.h"
#include "../lib/file.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <strings.h>

namespace deck {

static log_category_t* font_log() {
    static log_category_t* category = log_get_category("deck.font");
    return category;
}

const char* const EMAIL_SAFE_FONTS[] = {
    "Arial", "Helvetica", "Georgia", "Times", "Courier", "Verdana", "Tahoma",
    "Impact", "Comic Sans MS", "Trebuchet MS", "Arial Black", "Palatino",
    "Lucida Console",
};
const int EMAIL_SAFE_FONT_COUNT = sizeof(EMAIL_SAFE_FONTS) / sizeof(EMAIL_SAFE_FONTS[0]);

static std::string to_lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return (char)tolower(c); });
    return out;
}

static bool is_mono_family(const std::string& family) {
    std::string lower = to_lower(family);
    return lower.find("mono") != std::string::npos || lower.find("courier") != std::string::npos ||
        lower.find("console") != std::string::npos || lower.find("consolas") != std::string::npos;
}

std::string font_alias(const std::string& family) {
    std::string lower = to_lower(family);
    if (lower == "sans") return "Arial";
    if (lower == "serif") return "Times";
    if (lower == "mono") return "Courier";
    if (lower == "symbol") return "Symbol";
    return family;
}

std::string email_safe_substitute(const std::string& family) {
    std::string lower = to_lower(family);
    for (int i = 0; i < EMAIL_SAFE_FONT_COUNT; i++) {
        if (lower.find(to_lower(EMAIL_SAFE_FONTS[i])) != std::string::npos) return EMAIL_SAFE_FONTS[i];
    }
    return "";
}

// ============================================================================
// FontResolver
// ============================================================================

FontResolver::FontResolver(const std::string& font_dir) : font_dir_(font_dir) {
    if (font_dir_.empty()) {
        const char* env = getenv("DECK_FONT_DIR");
        if (env && *env) font_dir_ = env;
    }
    font_config_ = FcInitLoadConfigAndFonts();
    if (!font_config_) {
        clog_error(font_log(), "fontconfig initialization failed, system fonts unavailable");
    }
    pthread_rwlock_init(&lock_, nullptr);
    clog_debug(font_log(), "font resolver ready, font dir: %s", font_dir_.empty() ? "(none)" : font_dir_.c_str());
}

FontResolver::~FontResolver() {
    pthread_rwlock_destroy(&lock_);
    if (font_config_) FcConfigDestroy(font_config_);
}

std::string FontResolver::find_in_font_dir(const std::string& family, int weight) {
    if (font_dir_.empty()) return "";
    std::string compact;
    for (char c : family) {
        if (c != ' ') compact.push_back(c);
    }
    const char* bold_suffixes[] = { "-Bold.ttf", "-Bold.otf" };
    const char* regular_suffixes[] = { ".ttf", "-Regular.ttf", ".otf", "-Regular.otf" };
    for (const std::string& name : { family, compact }) {
        if (weight >= 600) {
            for (const char* suffix : bold_suffixes) {
                std::string path = font_dir_ + "/" + name + suffix;
                if (file_exists(path.c_str())) return path;
            }
        }
        for (const char* suffix : regular_suffixes) {
            std::string path = font_dir_ + "/" + name + suffix;
            if (file_exists(path.c_str())) return path;
        }
    }
    return "";
}

// exact: accept the match only when fontconfig found the family itself,
// since FcFontMatch always returns its best substitute
std::string FontResolver::find_with_fontconfig(const std::string& family, int weight, bool exact) {
    if (!font_config_) return "";
    FcPattern* pattern = FcPatternCreate();
    if (!pattern) return "";
    FcPatternAddString(pattern, FC_FAMILY, (const FcChar8*)family.c_str());
    FcPatternAddInteger(pattern, FC_WEIGHT, FcWeightFromOpenType(weight));
    FcConfigSubstitute(font_config_, pattern, FcMatchPattern);
    FcDefaultSubstitute(pattern);

    std::string path;
    FcResult result;
    FcPattern* match = FcFontMatch(font_config_, pattern, &result);
    if (match) {
        FcChar8* file = nullptr;
        if (FcPatternGetString(match, FC_FILE, 0, &file) == FcResultMatch && file) {
            bool family_ok = !exact;
            FcChar8* name = nullptr;
            for (int i = 0; !family_ok && FcPatternGetString(match, FC_FAMILY, i, &name) == FcResultMatch; i++) {
                if (strcasecmp((const char*)name, family.c_str()) == 0) family_ok = true;
            }
            if (family_ok) path = (const char*)file;
        }
        FcPatternDestroy(match);
    }
    FcPatternDestroy(pattern);
    return path;
}

std::string FontResolver::find_font_file(const std::string& family, int weight, bool exact) {
    std::string path = find_in_font_dir(family, weight);
    if (path.empty()) path = find_with_fontconfig(family, weight, exact);
    return path;
}

// called with the write lock held
FontHandle FontResolver::lookup(const std::string& family, int weight) {
    FontHandle handle;
    handle.weight = weight;
    handle.family = family;
    handle.path = find_font_file(family, weight, true);
    if (handle.path.empty()) {
        std::string safe = email_safe_substitute(family);
        if (!safe.empty() && strcasecmp(safe.c_str(), family.c_str()) != 0) {
            handle.path = find_font_file(safe, weight, true);
            if (!handle.path.empty()) handle.family = safe;
        }
    }
    if (handle.path.empty()) {
        // keep code text monospaced when the requested mono family is missing
        handle.family = is_mono_family(family) ? "monospace" : "sans-serif";
        handle.path = find_with_fontconfig(handle.family, weight, false);
    }
    handle.fallback = handle.family != family;
    handle.mono = is_mono_family(handle.family) || is_mono_family(family);

    if (handle.fallback) {
        clog_info(font_log(), "font %s:%d not found, using %s (%s)", family.c_str(), weight,
            handle.family.c_str(), handle.path.empty() ? "built-in metrics" : handle.path.c_str());
    } else {
        clog_debug(font_log(), "font %s:%d -> %s", family.c_str(), weight, handle.path.c_str());
    }
    return handle;
}

FontHandle FontResolver::resolve(const std::string& requested, int weight) {
    std::string family = font_alias(requested.empty() ? std::string(DEFAULT_FONT_FAMILY) : requested);
    std::string key = to_lower(family) + ":" + std::to_string(weight);

    pthread_rwlock_rdlock(&lock_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        FontHandle handle = it->second;
        pthread_rwlock_unlock(&lock_);
        return handle;
    }
    pthread_rwlock_unlock(&lock_);

    pthread_rwlock_wrlock(&lock_);
    it = cache_.find(key);    // another render may have filled it meanwhile
    if (it == cache_.end()) {
        it = cache_.emplace(key, lookup(family, weight)).first;
    }
    FontHandle handle = it->second;
    pthread_rwlock_unlock(&lock_);
    return handle;
}

bool FontResolver::available(const std::string& family, int weight) {
    FontHandle handle = resolve(family, weight);
    return !handle.fallback && !handle.path.empty();
}

std::string FontResolver::css_family(const std::string& font, const std::string& default_family) {
    const std::string& name = font.empty() ? default_family : font;
    std::string lower = to_lower(name);
    if (lower == "sans") return "sans-serif";
    if (lower == "serif") return "serif";
    if (lower == "mono") return "monospace";
    if (lower == "symbol") return "Symbol";
    if (!font.empty()) return font;

    if (available(name, DEFAULT_FONT_WEIGHT)) return name;
    std::string safe = email_safe_substitute(name);
    if (!safe.empty()) return safe;
    return "sans-serif";
}

size_t FontResolver::cached_count() {
    pthread_rwlock_rdlock(&lock_);
    size_t count = cache_.size();
    pthread_rwlock_unlock(&lock_);
    return count;
}

} // namespace deck
