// defaults.hpp - Rendering constants shared by the layout code and all backends

#ifndef DECK_DEFAULTS_HPP
#define DECK_DEFAULTS_HPP

namespace deck {

// canvas size used when the document does not specify one
constexpr int DEFAULT_CANVAS_WIDTH = 792;
constexpr int DEFAULT_CANVAS_HEIGHT = 612;

constexpr const char* DEFAULT_LAYERS = "image:rect:ellipse:curve:arc:line:poly:text:list";

// geometric shapes without a color use this regardless of the slide foreground
constexpr const char* DEFAULT_SHAPE_COLOR = "rgb(127,127,127)";
constexpr const char* DEFAULT_BACKGROUND = "white";
constexpr const char* DEFAULT_FOREGROUND = "black";
constexpr const char* CODE_BACKGROUND = "rgb(240,240,240)";

constexpr const char* DEFAULT_FONT_FAMILY = "Arial";
constexpr int DEFAULT_FONT_WEIGHT = 400;

constexpr double DEFAULT_LINE_SPACING = 1.4;    // text lp
constexpr double DEFAULT_LIST_SPACING = 2.0;    // list lp
constexpr double DEFAULT_LIST_WRAP = 95.0;      // list wp
constexpr double DEFAULT_STROKE_WIDTH = 2.0;
constexpr double GRID_STROKE_WIDTH = 0.25;
constexpr double MIN_GRID_PERCENT = 0.5;        // finer grids are drawn at this spacing

// extra space between wrapped words, as a fraction of the width of "M"
constexpr double WORD_SPACING_FACTOR = 0.3;
constexpr double MONO_WORD_SPACING_FACTOR = 1.0;

// scale applied to sp-derived font and stroke sizes
constexpr double FONT_FACTOR = 1.0;

// file watcher timing, in seconds
constexpr int WATCH_POLL_INTERVAL = 2;
constexpr int WATCH_FRESHNESS_WINDOW = 10;
constexpr int WATCH_SHUTDOWN_TIMEOUT = 30;

} // namespace deck

#endif // DECK_DEFAULTS_HPP
