// parse.hpp - Intermediate XML to Deck

#ifndef DECK_PARSE_HPP
#define DECK_PARSE_HPP

#include "document.hpp"
#include "error.hpp"
#include <string>

namespace deck {

// Wrap slide-less input in a single synthetic slide. Input that already has
// a <slide> or is blank comes back unchanged; shapes directly inside <deck>
// or bare shape elements are placed in
//   <deck><canvas width height/><slide>...</slide></deck>
std::string wrap_in_slide_if_needed(const std::string& xml, int width, int height);

// Parse intermediate XML. On failure returns DECK_ERR_PARSE with err naming
// the element and attribute at fault; out is left untouched.
DeckStatus parse_deck(const std::string& xml, const RenderOptions& options, Deck* out, DeckError* err);

// split a space separated list of numbers, false if any entry is not a number
bool parse_number_list(const std::string& text, std::vector<double>* out);

} // namespace deck

#endif // DECK_PARSE_HPP
