// strbuf.h - growable byte buffer used to assemble SVG markup and PDF streams
#ifndef STRBUF_H
#define STRBUF_H

#include <stdlib.h>
#include <stdarg.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// str is NUL terminated after every append, but length counts every byte
// so PNG and deflate output can pass through unchanged
typedef struct {
    char* str;
    size_t length;
    size_t capacity;
} StrBuf;

StrBuf* strbuf_new();
StrBuf* strbuf_new_cap(size_t size);
StrBuf* strbuf_create(const char *str);
void strbuf_free(StrBuf *sb);
// empties the buffer, keeping its storage
void strbuf_reset(StrBuf *sb);
bool strbuf_ensure_cap(StrBuf *sb, size_t min_capacity);

void strbuf_append_str(StrBuf *sb, const char *str);
void strbuf_append_str_n(StrBuf *sb, const char *str, size_t n);
void strbuf_append_char(StrBuf *sb, char c);
void strbuf_append_char_n(StrBuf *sb, char c, size_t n);
void strbuf_append_int(StrBuf *sb, int value);
void strbuf_append_format(StrBuf *sb, const char *format, ...);
void strbuf_vappend_format(StrBuf *sb, const char *format, va_list args);
// & < > and " become entities
void strbuf_append_xml_escaped(StrBuf *sb, const char *str);

// hands the bytes to the caller (free them) and leaves sb empty; sb itself
// still has to be released with strbuf_free
char* strbuf_release(StrBuf *sb, size_t *length);

#ifdef __cplusplus
}
#endif

#endif // STRBUF_H
