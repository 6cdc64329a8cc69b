#include "error.hpp"

namespace deck {

const char* const STAGE_COMPILE = "compile";
const char* const STAGE_PARSE = "parse";
const char* const STAGE_RENDER = "render";
const char* const STAGE_OUTPUT = "output";

std::string DeckError::describe() const {
    if (stage.empty()) return message;
    return stage + ": " + message;
}

void DeckError::clear() {
    code = DECK_OK;
    stage.clear();
    message.clear();
}

const char* deck_status_name(DeckStatus status) {
    switch (status) {
    case DECK_OK: return "ok";
    case DECK_ERR_COMPILE: return "CompileError";
    case DECK_ERR_PARSE: return "ParseError";
    case DECK_ERR_UNSUPPORTED_FORMAT: return "UnsupportedFormatError";
    case DECK_ERR_SLIDE_INDEX: return "SlideIndexError";
    case DECK_ERR_OUTPUT_IO: return "OutputIOError";
    }
    return "unknown";
}

DeckStatus deck_fail(DeckError* err, DeckStatus code, const char* stage, const std::string& message) {
    if (err) {
        err->code = code;
        err->stage = stage ? stage : "";
        err->message = message;
    }
    return code;
}

} // namespace deck
