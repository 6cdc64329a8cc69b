// compiler.hpp - DSL to intermediate XML
//
// The deck DSL is compiled by an external executable (decksh). The
// pipeline only sees the DslCompiler interface so tests and embedders can
// substitute their own.

#ifndef DECK_COMPILER_HPP
#define DECK_COMPILER_HPP

#include "error.hpp"
#include <string>

namespace deck {

class DslCompiler {
public:
    virtual ~DslCompiler() = default;
    // compile DSL source to XML; DECK_ERR_COMPILE with the compiler's message on failure
    virtual DeckStatus compile(const std::string& dsl, std::string* xml, DeckError* err) = 0;
};

// Runs an external compiler as "<executable> <source file>" and captures
// its standard output.
class ExternalCompiler : public DslCompiler {
public:
    // empty executable means $DECKSH, then "decksh" on PATH
    explicit ExternalCompiler(const std::string& executable = "");

    DeckStatus compile(const std::string& dsl, std::string* xml, DeckError* err) override;
    const std::string& executable() const { return executable_; }

private:
    std::string executable_;
};

// Input is already XML
class PassthroughCompiler : public DslCompiler {
public:
    DeckStatus compile(const std::string& dsl, std::string* xml, DeckError* err) override;
};

// decksh emits a few color attributes without quotes; quote them so the
// XML parser accepts the document
std::string quote_color_attributes(const std::string& xml);

} // namespace deck

#endif // DECK_COMPILER_HPP
