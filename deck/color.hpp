// color.hpp - Color strings as written in deck documents
//
// Accepts SVG/X11 color names, rgb(r,g,b), rgba(r,g,b,a), #rgb, #rrggbb and
// hsv(h,s,v). The original string is kept so the vector backend can emit
// it verbatim; raster and paginated backends use the parsed channels.

#ifndef DECK_COLOR_HPP
#define DECK_COLOR_HPP

#include <cstdint>
#include <string>

namespace deck {

struct Rgba {
    uint8_t r, g, b, a;
};

// unknown or malformed strings parse as opaque black
Rgba parse_color(const std::string& value);

// true when the string names a color parse_color understands
bool is_known_color(const std::string& value);

} // namespace deck

#endif // DECK_COLOR_HPP
