// coord.hpp - Percentage space to device space conversion
//
// Documents place everything in percentages of the canvas. X grows to the
// right from the left edge; Y is measured up from the bottom edge, so it is
// flipped when converted to device units (origin top-left, Y down).
// Values outside [0, 100] extrapolate; nothing is clamped.

#ifndef DECK_COORD_HPP
#define DECK_COORD_HPP

namespace deck {

struct Dimen {
    double x;
    double y;
    double size;
};

// value percent of measure
inline double pct(double value, double measure) {
    return value / 100.0 * measure;
}

inline double device_x(double xp, double width) {
    return pct(xp, width);
}

inline double device_y(double yp, double height) {
    return pct(100.0 - yp, height);
}

// inverse of device_y
double percent_from_device_y(double y, double height);

// position plus sp-derived size (font size or stroke width)
Dimen dimen(double width, double height, double xp, double yp, double sp);

// wp percent of width, or dflt when wp is zero
double pwidth(double wp, double width, double dflt);

// document opacity (0-100, 0 meaning unset) to an 8-bit alpha
int opacity_to_alpha(double opacity);

} // namespace deck

#endif // DECK_COORD_HPP
