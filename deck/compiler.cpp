#include "compiler.hpp"
#include "../lib/log.h"
#include "../lib/file.h"
#include "../lib/strbuf.h"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

namespace deck {

static void replace_all(std::string* text, const char* from, const char* to) {
    size_t from_len = strlen(from), to_len = strlen(to);
    size_t pos = 0;
    while ((pos = text->find(from, pos)) != std::string::npos) {
        text->replace(pos, from_len, to);
        pos += to_len;
    }
}

std::string quote_color_attributes(const std::string& xml) {
    std::string fixed = xml;
    replace_all(&fixed, "color=red", "color=\"red\"");
    replace_all(&fixed, "color=gray", "color=\"gray\"");
    return fixed;
}

// single-quote a shell word
static std::string shell_quote(const std::string& word) {
    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += "'";
    return quoted;
}

static std::string temp_path(const char* suffix_tag) {
    const char* dir = getenv("TMPDIR");
    if (!dir || !*dir) dir = "/tmp";
    std::string pattern = std::string(dir) + "/deck-" + suffix_tag + "-XXXXXX";
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    int fd = mkstemp(buf.data());
    if (fd < 0) return "";
    close(fd);
    return std::string(buf.data());
}

ExternalCompiler::ExternalCompiler(const std::string& executable) : executable_(executable) {
    if (executable_.empty()) {
        const char* env = getenv("DECKSH");
        executable_ = (env && *env) ? env : "decksh";
    }
}

DeckStatus ExternalCompiler::compile(const std::string& dsl, std::string* xml, DeckError* err) {
    std::string source = temp_path("src");
    std::string errors = temp_path("err");
    if (source.empty() || errors.empty()) {
        if (!source.empty()) unlink(source.c_str());
        if (!errors.empty()) unlink(errors.c_str());
        return deck_fail(err, DECK_ERR_COMPILE, STAGE_COMPILE,
            std::string("cannot create temporary file: ") + strerror(errno));
    }
    if (!write_binary_file(source.c_str(), dsl.data(), dsl.size())) {
        unlink(source.c_str());
        unlink(errors.c_str());
        return deck_fail(err, DECK_ERR_COMPILE, STAGE_COMPILE, "cannot write compiler input");
    }

    std::string command = shell_quote(executable_) + " " + shell_quote(source) + " 2>" + shell_quote(errors);
    log_debug("compiler: executing command: %s", command.c_str());

    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        unlink(source.c_str());
        unlink(errors.c_str());
        return deck_fail(err, DECK_ERR_COMPILE, STAGE_COMPILE,
            "failed to execute " + executable_ + ": " + strerror(errno));
    }

    StrBuf* output_buf = strbuf_new();
    char buffer[4096];
    size_t bytes_read;
    while ((bytes_read = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        strbuf_append_str_n(output_buf, buffer, bytes_read);
    }
    int exit_status = pclose(pipe);
    unlink(source.c_str());

    char* stderr_text = read_text_file(errors.c_str());
    unlink(errors.c_str());
    std::string diagnostics = stderr_text ? stderr_text : "";
    free(stderr_text);
    while (!diagnostics.empty() && (diagnostics.back() == '\n' || diagnostics.back() == '\r')) diagnostics.pop_back();

    int exit_code = (exit_status != -1 && WIFEXITED(exit_status)) ? WEXITSTATUS(exit_status) : -1;
    log_debug("compiler: command completed with exit code: %d", exit_code);
    if (exit_code != 0) {
        strbuf_free(output_buf);
        std::string message = executable_ + " exited with status " + std::to_string(exit_code);
        if (exit_code == 127) message += " (compiler not found)";
        if (!diagnostics.empty()) message += ": " + diagnostics;
        return deck_fail(err, DECK_ERR_COMPILE, STAGE_COMPILE, message);
    }

    xml->assign(output_buf->str ? output_buf->str : "", output_buf->length);
    strbuf_free(output_buf);
    *xml = quote_color_attributes(*xml);
    return DECK_OK;
}

DeckStatus PassthroughCompiler::compile(const std::string& dsl, std::string* xml, DeckError* err) {
    (void)err;
    *xml = dsl;
    return DECK_OK;
}

} // namespace deck
