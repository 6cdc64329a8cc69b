// dispatch.hpp - Layer dispatcher and the shared text, list, image and grid layout
//
// The layout here is written once against DrawingSurface; backends only
// supply primitives. The Deck is never modified.

#ifndef DECK_DISPATCH_HPP
#define DECK_DISPATCH_HPP

#include "document.hpp"
#include "surface.hpp"
#include <string>
#include <vector>

namespace deck {

// layer names separated by ':' or ','; empty names are dropped
std::vector<std::string> split_layers(const std::string& layers);

// "center", "middle", "mid", "c" -> middle; "right", "end", "e" -> end; otherwise start
TextAnchor anchor_from_align(const std::string& align);

// Draw one slide: background, gradient, layers in order, grid overlay.
// index must be a valid slide index.
void render_slide(DrawingSurface* surface, const Deck& deck, int index, const RenderOptions& options);

// Word-wrap text starting at x, y within width; each word is drawn
// start-anchored and the literal token "\n" forces a break.
// Returns the number of line breaks produced.
int wrap_text(DrawingSurface* surface, const std::string& text, double x, double y,
    double width, double leading, const TextStyle& style);

} // namespace deck

#endif // DECK_DISPATCH_HPP
