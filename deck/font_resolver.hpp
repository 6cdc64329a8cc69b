// font_resolver.hpp - (family, weight) to font file lookup with fallbacks
//
// Resolution order:
//   1. the requested family at the requested weight, from the cache, the
//      DECK_FONT_DIR directory, or the system font database (fontconfig)
//   2. the first email-safe family contained in the requested name
//   3. generic sans-serif
// The cache is shared by concurrent renders and guarded by a read-preferring
// rwlock; lookups take the read lock, misses take the write lock.

#ifndef DECK_FONT_RESOLVER_HPP
#define DECK_FONT_RESOLVER_HPP

#include <pthread.h>
#include <string>
#include <unordered_map>
#include <fontconfig/fontconfig.h>

namespace deck {

struct FontHandle {
    std::string path;           // empty when no file could be found at all
    std::string family;         // family actually used
    int weight = 400;
    bool fallback = false;      // true when family differs from the request
    bool mono = false;          // monospaced family
};

class FontResolver {
public:
    // font_dir overrides DECK_FONT_DIR; empty means use the environment
    explicit FontResolver(const std::string& font_dir = "");
    ~FontResolver();

    FontResolver(const FontResolver&) = delete;
    FontResolver& operator=(const FontResolver&) = delete;

    FontHandle resolve(const std::string& family, int weight);

    // true when the family itself (not a substitute) has a file at this weight
    bool available(const std::string& family, int weight);

    // family name for vector output: explicit names verbatim, logical names
    // as CSS generics, empty names resolved from default_family
    std::string css_family(const std::string& font, const std::string& default_family);

    const std::string& font_dir() const { return font_dir_; }
    size_t cached_count();

private:
    std::string find_font_file(const std::string& family, int weight, bool exact);
    std::string find_in_font_dir(const std::string& family, int weight);
    std::string find_with_fontconfig(const std::string& family, int weight, bool exact);
    FontHandle lookup(const std::string& family, int weight);

    std::string font_dir_;
    FcConfig* font_config_;
    pthread_rwlock_t lock_;
    std::unordered_map<std::string, FontHandle> cache_;
};

// logical names (sans, serif, mono, symbol) to concrete families
std::string font_alias(const std::string& family);

// fixed list of widely available families used for substitution
extern const char* const EMAIL_SAFE_FONTS[];
extern const int EMAIL_SAFE_FONT_COUNT;

// closest email-safe family by case-insensitive containment, empty if none
std::string email_safe_substitute(const std::string& family);

} // namespace deck

#endif // DECK_FONT_RESOLVER_HPP
