#include "coord.hpp"
#include "defaults.hpp"

namespace deck {

double percent_from_device_y(double y, double height) {
    return 100.0 - y / height * 100.0;
}

Dimen dimen(double width, double height, double xp, double yp, double sp) {
    Dimen d;
    d.x = pct(xp, width);
    d.y = pct(100.0 - yp, height);
    d.size = pct(sp, width) * FONT_FACTOR;
    return d;
}

double pwidth(double wp, double width, double dflt) {
    if (wp == 0) return dflt;
    return pct(wp, width);
}

int opacity_to_alpha(double opacity) {
    if (opacity > 0) return (int)(255.0 * opacity / 100.0);
    return 255;
}

} // namespace deck
