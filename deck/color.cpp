#include "color.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <strings.h>

namespace deck {

// ============================================================================
// Named Colors
// ============================================================================

static const struct { const char* name; uint32_t rgb; } named_colors[] = {
    // Basic colors
    {"black", 0x000000}, {"white", 0xFFFFFF}, {"red", 0xFF0000},
    {"green", 0x008000}, {"blue", 0x0000FF}, {"yellow", 0xFFFF00},
    {"cyan", 0x00FFFF}, {"magenta", 0xFF00FF}, {"gray", 0x808080},
    {"grey", 0x808080}, {"silver", 0xC0C0C0}, {"maroon", 0x800000},
    {"olive", 0x808000}, {"lime", 0x00FF00}, {"aqua", 0x00FFFF},
    {"teal", 0x008080}, {"navy", 0x000080}, {"fuchsia", 0xFF00FF},
    {"purple", 0x800080}, {"orange", 0xFFA500}, {"pink", 0xFFC0CB},
    {"brown", 0xA52A2A}, {"coral", 0xFF7F50}, {"gold", 0xFFD700},
    {"indigo", 0x4B0082}, {"ivory", 0xFFFFF0}, {"khaki", 0xF0E68C},
    {"lavender", 0xE6E6FA}, {"rebeccapurple", 0x663399},
    // Reds
    {"crimson", 0xDC143C}, {"darkred", 0x8B0000}, {"firebrick", 0xB22222},
    {"indianred", 0xCD5C5C}, {"lightcoral", 0xF08080}, {"salmon", 0xFA8072},
    {"darksalmon", 0xE9967A}, {"lightsalmon", 0xFFA07A}, {"orangered", 0xFF4500},
    {"tomato", 0xFF6347},
    // Oranges & Yellows
    {"darkorange", 0xFF8C00}, {"peachpuff", 0xFFDAB9}, {"moccasin", 0xFFE4B5},
    {"palegoldenrod", 0xEEE8AA}, {"lightyellow", 0xFFFFE0}, {"lemonchiffon", 0xFFFACD},
    {"lightgoldenrodyellow", 0xFAFAD2}, {"darkkhaki", 0xBDB76B},
    // Greens
    {"limegreen", 0x32CD32}, {"lightgreen", 0x90EE90}, {"palegreen", 0x98FB98},
    {"darkgreen", 0x006400}, {"forestgreen", 0x228B22}, {"seagreen", 0x2E8B57},
    {"mediumseagreen", 0x3CB371}, {"springgreen", 0x00FF7F}, {"mediumspringgreen", 0x00FA9A},
    {"darkseagreen", 0x8FBC8F}, {"mediumaquamarine", 0x66CDAA}, {"yellowgreen", 0x9ACD32},
    {"olivedrab", 0x6B8E23}, {"darkolivegreen", 0x556B2F}, {"greenyellow", 0xADFF2F},
    {"chartreuse", 0x7FFF00}, {"lawngreen", 0x7CFC00}, {"lightseagreen", 0x20B2AA},
    // Blues
    {"lightblue", 0xADD8E6}, {"powderblue", 0xB0E0E6}, {"lightskyblue", 0x87CEFA},
    {"skyblue", 0x87CEEB}, {"deepskyblue", 0x00BFFF}, {"dodgerblue", 0x1E90FF},
    {"cornflowerblue", 0x6495ED}, {"steelblue", 0x4682B4}, {"royalblue", 0x4169E1},
    {"mediumblue", 0x0000CD}, {"darkblue", 0x00008B}, {"midnightblue", 0x191970},
    {"cadetblue", 0x5F9EA0}, {"lightsteelblue", 0xB0C4DE}, {"slateblue", 0x6A5ACD},
    {"mediumslateblue", 0x7B68EE}, {"darkslateblue", 0x483D8B},
    // Purples
    {"mediumpurple", 0x9370DB}, {"blueviolet", 0x8A2BE2}, {"darkviolet", 0x9400D3},
    {"darkorchid", 0x9932CC}, {"mediumorchid", 0xBA55D3}, {"orchid", 0xDA70D6},
    {"plum", 0xDDA0DD}, {"violet", 0xEE82EE}, {"thistle", 0xD8BFD8},
    {"darkmagenta", 0x8B008B}, {"mediumvioletred", 0xC71585}, {"deeppink", 0xFF1493},
    {"hotpink", 0xFF69B4}, {"lightpink", 0xFFB6C1}, {"palevioletred", 0xDB7093},
    // Cyans & Teals
    {"lightcyan", 0xE0FFFF}, {"paleturquoise", 0xAFEEEE}, {"aquamarine", 0x7FFFD4},
    {"turquoise", 0x40E0D0}, {"mediumturquoise", 0x48D1CC}, {"darkturquoise", 0x00CED1},
    {"darkcyan", 0x008B8B},
    // Browns & Tans
    {"tan", 0xD2B48C}, {"burlywood", 0xDEB887}, {"wheat", 0xF5DEB3},
    {"sandybrown", 0xF4A460}, {"goldenrod", 0xDAA520}, {"darkgoldenrod", 0xB8860B},
    {"peru", 0xCD853F}, {"chocolate", 0xD2691E}, {"sienna", 0xA0522D},
    {"saddlebrown", 0x8B4513}, {"rosybrown", 0xBC8F8F},
    // Grays
    {"lightgray", 0xD3D3D3}, {"lightgrey", 0xD3D3D3}, {"darkgray", 0xA9A9A9},
    {"darkgrey", 0xA9A9A9}, {"dimgray", 0x696969}, {"dimgrey", 0x696969},
    {"lightslategray", 0x778899}, {"lightslategrey", 0x778899}, {"slategray", 0x708090},
    {"slategrey", 0x708090}, {"darkslategray", 0x2F4F4F}, {"darkslategrey", 0x2F4F4F},
    {"gainsboro", 0xDCDCDC},
    // Whites
    {"snow", 0xFFFAFA}, {"honeydew", 0xF0FFF0}, {"mintcream", 0xF5FFFA},
    {"azure", 0xF0FFFF}, {"aliceblue", 0xF0F8FF}, {"ghostwhite", 0xF8F8FF},
    {"whitesmoke", 0xF5F5F5}, {"seashell", 0xFFF5EE}, {"beige", 0xF5F5DC},
    {"oldlace", 0xFDF5E6}, {"floralwhite", 0xFFFAF0}, {"linen", 0xFAF0E6},
    {"lavenderblush", 0xFFF0F5}, {"mistyrose", 0xFFE4E1}, {"papayawhip", 0xFFEFD5},
    {"blanchedalmond", 0xFFEBCD}, {"bisque", 0xFFE4C4}, {"antiquewhite", 0xFAEBD7},
    {"cornsilk", 0xFFF8DC}, {"navajowhite", 0xFFDEAD},
    {nullptr, 0}
};

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static uint8_t clamp_channel(double v) {
    if (v < 0) return 0;
    if (v > 255) return 255;
    return (uint8_t)v;
}

static bool parse_hex(const char* value, Rgba* c) {
    size_t len = strlen(value);
    for (size_t i = 0; i < len; i++) {
        if (hex_digit(value[i]) < 0) return false;
    }
    if (len == 3) {
        c->r = hex_digit(value[0]) * 17;
        c->g = hex_digit(value[1]) * 17;
        c->b = hex_digit(value[2]) * 17;
        return true;
    }
    if (len == 6) {
        c->r = hex_digit(value[0]) * 16 + hex_digit(value[1]);
        c->g = hex_digit(value[2]) * 16 + hex_digit(value[3]);
        c->b = hex_digit(value[4]) * 16 + hex_digit(value[5]);
        return true;
    }
    return false;
}

// hsv(h,s,v): hue in degrees, saturation and value in percent
static void hsv_to_rgb(double h, double s, double v, Rgba* c) {
    h = fmod(h, 360.0);
    if (h < 0) h += 360.0;
    s /= 100.0;  v /= 100.0;
    double chroma = v * s;
    double x = chroma * (1 - fabs(fmod(h / 60.0, 2) - 1));
    double m = v - chroma;
    double r = 0, g = 0, b = 0;
    if (h < 60)       { r = chroma; g = x; }
    else if (h < 120) { r = x; g = chroma; }
    else if (h < 180) { g = chroma; b = x; }
    else if (h < 240) { g = x; b = chroma; }
    else if (h < 300) { r = x; b = chroma; }
    else              { r = chroma; b = x; }
    c->r = clamp_channel((r + m) * 255.0 + 0.5);
    c->g = clamp_channel((g + m) * 255.0 + 0.5);
    c->b = clamp_channel((b + m) * 255.0 + 0.5);
}

static bool parse_color_checked(const std::string& input, Rgba* c) {
    c->r = 0;  c->g = 0;  c->b = 0;  c->a = 255;  // default black
    const char* value = input.c_str();
    while (*value && isspace((unsigned char)*value)) value++;
    if (!*value) return false;

    if (strcasecmp(value, "none") == 0 || strcasecmp(value, "transparent") == 0) {
        c->a = 0;
        return true;
    }

    if (*value == '#') return parse_hex(value + 1, c);

    if (strncasecmp(value, "rgb", 3) == 0) {
        const char* p = strchr(value, '(');
        if (!p) return false;
        double r, g, b, a = 1.0;
        int n = sscanf(p + 1, "%lf , %lf , %lf , %lf", &r, &g, &b, &a);
        if (n < 3) return false;
        c->r = clamp_channel(r);
        c->g = clamp_channel(g);
        c->b = clamp_channel(b);
        if (n == 4) c->a = clamp_channel(a * 255.0);
        return true;
    }

    if (strncasecmp(value, "hsv", 3) == 0) {
        const char* p = strchr(value, '(');
        if (!p) return false;
        double h, s, v;
        if (sscanf(p + 1, "%lf , %lf , %lf", &h, &s, &v) != 3) return false;
        hsv_to_rgb(h, s, v, c);
        return true;
    }

    for (int i = 0; named_colors[i].name != nullptr; i++) {
        if (strcasecmp(value, named_colors[i].name) == 0) {
            uint32_t rgb = named_colors[i].rgb;
            c->r = (rgb >> 16) & 0xFF;
            c->g = (rgb >> 8) & 0xFF;
            c->b = rgb & 0xFF;
            return true;
        }
    }
    return false;
}

Rgba parse_color(const std::string& value) {
    Rgba c;
    if (!parse_color_checked(value, &c)) {
        c.r = 0;  c.g = 0;  c.b = 0;  c.a = 255;
    }
    return c;
}

bool is_known_color(const std::string& value) {
    Rgba c;
    return parse_color_checked(value, &c);
}

} // namespace deck
