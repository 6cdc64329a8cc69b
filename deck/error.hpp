// error.hpp - Status codes and stage-labelled errors for the render pipeline

#ifndef DECK_ERROR_HPP
#define DECK_ERROR_HPP

#include <string>

namespace deck {

enum DeckStatus {
    DECK_OK = 0,
    DECK_ERR_COMPILE,               // DSL compiler rejected the input
    DECK_ERR_PARSE,                 // malformed intermediate XML
    DECK_ERR_UNSUPPORTED_FORMAT,    // no backend for the requested format
    DECK_ERR_SLIDE_INDEX,           // slide index outside the deck
    DECK_ERR_OUTPUT_IO,             // output could not be produced or written
};

// stage names used to label errors
extern const char* const STAGE_COMPILE;
extern const char* const STAGE_PARSE;
extern const char* const STAGE_RENDER;
extern const char* const STAGE_OUTPUT;

struct DeckError {
    DeckStatus code = DECK_OK;
    std::string stage;
    std::string message;

    // "<stage>: <message>"
    std::string describe() const;
    void clear();
};

const char* deck_status_name(DeckStatus status);

// fill err (when non-null) and return code, for one-line error returns
DeckStatus deck_fail(DeckError* err, DeckStatus code, const char* stage, const std::string& message);

} // namespace deck

#endif // DECK_ERROR_HPP
