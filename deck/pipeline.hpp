// pipeline.hpp - One-shot render: DSL -> XML -> Deck -> output bytes
//
// A Pipeline holds no per-render state, so one instance may serve
// concurrent renders from several threads. Each render opens its own
// FontSet; only the FontResolver cache is shared.

#ifndef DECK_PIPELINE_HPP
#define DECK_PIPELINE_HPP

#include "compiler.hpp"
#include "document.hpp"
#include "error.hpp"
#include "font_resolver.hpp"
#include <string>

namespace deck {

enum OutputFormat {
    FORMAT_SVG,
    FORMAT_PNG,
    FORMAT_PDF,
    FORMAT_XML,
};

// "svg", "png", "pdf" or "xml"; anything else is DECK_ERR_UNSUPPORTED_FORMAT
DeckStatus format_from_id(const std::string& id, OutputFormat* format, DeckError* err);

// file extension without the dot, same as the format id
const char* format_extension(OutputFormat format);

// input path with its extension replaced by the format's
std::string derive_output_path(const std::string& input, OutputFormat format);

class Pipeline {
public:
    Pipeline(FontResolver* fonts, DslCompiler* compiler);

    DeckStatus compile(const std::string& dsl, std::string* xml, DeckError* err);

    // wrap, parse and render intermediate XML; out is empty on any error
    DeckStatus render_xml(const std::string& xml, const std::string& format_id,
        const RenderOptions& options, std::string* out, DeckError* err);
    DeckStatus render_xml(const std::string& xml, OutputFormat format,
        const RenderOptions& options, std::string* out, DeckError* err);

    // compile then render_xml
    DeckStatus render(const std::string& dsl, const std::string& format_id,
        const RenderOptions& options, std::string* out, DeckError* err);

    // Render a .dsh (compiled) or .xml (used as is) file. An empty output
    // path is derived from the input; the path written is stored in
    // written when non-null.
    DeckStatus render_file(const std::string& input, const std::string& output,
        const std::string& format_id, const RenderOptions& options,
        std::string* written, DeckError* err);

    FontResolver* fonts() { return fonts_; }
    DslCompiler* compiler() { return compiler_; }

private:
    FontResolver* fonts_;
    DslCompiler* compiler_;
};

// true when path ends with ext (".dsh", ".xml"), ignoring case
bool has_extension(const std::string& path, const char* ext);

} // namespace deck

#endif // DECK_PIPELINE_HPP
