#include "pipeline.hpp"
#include "font_face.hpp"
#include "parse.hpp"
#include "render_pdf.hpp"
#include "render_png.hpp"
#include "render_svg.hpp"
#include "../lib/log.h"
#include "../lib/file.h"
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace deck {

DeckStatus format_from_id(const std::string& id, OutputFormat* format, DeckError* err) {
    if (id == "svg") { *format = FORMAT_SVG;  return DECK_OK; }
    if (id == "png") { *format = FORMAT_PNG;  return DECK_OK; }
    if (id == "pdf") { *format = FORMAT_PDF;  return DECK_OK; }
    if (id == "xml") { *format = FORMAT_XML;  return DECK_OK; }
    return deck_fail(err, DECK_ERR_UNSUPPORTED_FORMAT, STAGE_RENDER, "unsupported format: " + id);
}

const char* format_extension(OutputFormat format) {
    switch (format) {
    case FORMAT_SVG: return "svg";
    case FORMAT_PNG: return "png";
    case FORMAT_PDF: return "pdf";
    case FORMAT_XML: return "xml";
    }
    return "";
}

bool has_extension(const std::string& path, const char* ext) {
    size_t len = strlen(ext);
    if (path.size() < len) return false;
    for (size_t i = 0; i < len; i++) {
        if (tolower((unsigned char)path[path.size() - len + i]) != tolower((unsigned char)ext[i])) return false;
    }
    return true;
}

std::string derive_output_path(const std::string& input, OutputFormat format) {
    size_t slash = input.find_last_of('/');
    size_t dot = input.find_last_of('.');
    std::string stem = (dot != std::string::npos && (slash == std::string::npos || dot > slash))
        ? input.substr(0, dot) : input;
    return stem + "." + format_extension(format);
}

Pipeline::Pipeline(FontResolver* fonts, DslCompiler* compiler) : fonts_(fonts), compiler_(compiler) {}

DeckStatus Pipeline::compile(const std::string& dsl, std::string* xml, DeckError* err) {
    DeckStatus status = compiler_->compile(dsl, xml, err);
    if (status != DECK_OK) {
        xml->clear();
        if (err) err->stage = STAGE_COMPILE;
    }
    return status;
}

DeckStatus Pipeline::render_xml(const std::string& xml, const std::string& format_id,
    const RenderOptions& options, std::string* out, DeckError* err) {
    out->clear();
    OutputFormat format;
    DeckStatus status = format_from_id(format_id, &format, err);
    if (status != DECK_OK) return status;
    return render_xml(xml, format, options, out, err);
}

DeckStatus Pipeline::render_xml(const std::string& xml, OutputFormat format,
    const RenderOptions& options, std::string* out, DeckError* err) {
    out->clear();
    if (format == FORMAT_XML) {
        *out = xml;
        return DECK_OK;
    }

    std::string wrapped = wrap_in_slide_if_needed(xml, options.canvas_width, options.canvas_height);
    Deck deck;
    DeckStatus status = parse_deck(wrapped, options, &deck, err);
    if (status != DECK_OK) return status;

    if (format != FORMAT_PDF) {
        int index = options.slide_index;
        if (index < 0 || index >= (int)deck.slides.size()) {
            return deck_fail(err, DECK_ERR_SLIDE_INDEX, STAGE_RENDER,
                "slide index out of range: " + std::to_string(index));
        }
    }

    FontSet font_set(fonts_);
    std::string bytes;
    switch (format) {
    case FORMAT_SVG: status = render_svg(deck, options, &font_set, &bytes, err);  break;
    case FORMAT_PNG: status = render_png(deck, options, &font_set, &bytes, err);  break;
    case FORMAT_PDF: status = render_pdf(deck, options, &font_set, &bytes, err);  break;
    default: break;
    }
    if (font_set.warning_count() > 0) {
        log_warn("pipeline: %d font load warning(s) while rendering %s", font_set.warning_count(),
            format_extension(format));
    }
    if (status != DECK_OK) return status;
    out->swap(bytes);
    return DECK_OK;
}

DeckStatus Pipeline::render(const std::string& dsl, const std::string& format_id,
    const RenderOptions& options, std::string* out, DeckError* err) {
    out->clear();
    OutputFormat format;
    DeckStatus status = format_from_id(format_id, &format, err);
    if (status != DECK_OK) return status;

    std::string xml;
    status = compile(dsl, &xml, err);
    if (status != DECK_OK) return status;
    return render_xml(xml, format, options, out, err);
}

DeckStatus Pipeline::render_file(const std::string& input, const std::string& output,
    const std::string& format_id, const RenderOptions& options,
    std::string* written, DeckError* err) {
    OutputFormat format;
    DeckStatus status = format_from_id(format_id, &format, err);
    if (status != DECK_OK) return status;

    bool is_xml = has_extension(input, ".xml");
    char* content = read_text_file(input.c_str());
    if (!content) {
        return deck_fail(err, is_xml ? DECK_ERR_PARSE : DECK_ERR_COMPILE,
            is_xml ? STAGE_PARSE : STAGE_COMPILE, "cannot read " + input);
    }
    std::string source(content);
    free(content);

    std::string bytes;
    if (is_xml) {
        status = render_xml(source, format, options, &bytes, err);
    } else {
        std::string xml;
        status = compile(source, &xml, err);
        if (status == DECK_OK) status = render_xml(xml, format, options, &bytes, err);
    }
    if (status != DECK_OK) return status;

    std::string path = output.empty() ? derive_output_path(input, format) : output;
    if (!write_binary_file(path.c_str(), bytes.data(), bytes.size())) {
        return deck_fail(err, DECK_ERR_OUTPUT_IO, STAGE_OUTPUT, "cannot write " + path);
    }
    log_info("rendered %s -> %s (%zu bytes)", input.c_str(), path.c_str(), bytes.size());
    if (written) *written = path;
    return DECK_OK;
}

} // namespace deck
