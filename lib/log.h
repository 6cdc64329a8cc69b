// log.h - leveled, categorized logging for slidedeck
//
// Messages go through a category ("deck.font", "deck.watch", ...) or the
// default one. A category takes its level and target from the most specific
// rule loaded before it is first used:
//
//   [rules]
//   *.INFO            stderr
//   deck.font.DEBUG   >font.log
//   deck.watch.WARN   stdout
//
#ifndef LOG_H
#define LOG_H

#include <stdio.h>
#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

#define LOG_OK              0
#define LOG_WRONG_FORMAT   -3
#define LOG_WRITE_FAIL     -4
#define LOG_INIT_FAIL      -5

#define LOG_MAX_CATEGORIES 32

typedef enum {
    LOG_LEVEL_DEBUG = 20,
    LOG_LEVEL_INFO = 40,
    LOG_LEVEL_NOTICE = 60,
    LOG_LEVEL_WARN = 80,
    LOG_LEVEL_ERROR = 100,
    LOG_LEVEL_FATAL = 120
} log_level;

typedef struct log_category_s {
    char name[64];
    int level;          // messages below this level are dropped
    FILE *output;
    int enabled;
} log_category_t;

extern log_category_t *log_default_category;

// rules must be parsed before log_init; config may be NULL or ""
int log_parse_config_file(const char *filename);
int log_parse_config_string(const char *config);
int log_init(const char *config);
// closes rule targets and forgets rules and categories
void log_fini(void);

// the named category, created on first use
log_category_t* log_get_category(const char *cname);

int clog_error(log_category_t *category, const char *format, ...);
int clog_warn(log_category_t *category, const char *format, ...);
int clog_info(log_category_t *category, const char *format, ...);
int clog_debug(log_category_t *category, const char *format, ...);
int clog_vlog(log_category_t *category, int level, const char *format, va_list args);

int log_error(const char *format, ...);
int log_warn(const char *format, ...);
int log_info(const char *format, ...);
int log_debug(const char *format, ...);

int log_level_enabled(log_category_t *category, const int level);
void log_set_level(log_category_t *category, int level);
void log_set_output(log_category_t *category, FILE *output);
void log_enable_timestamps(int enable);

const char* log_level_to_string(int level);
// -1 for an unknown name; case-insensitive
int log_level_from_string(const char *name);

#ifdef __cplusplus
}
#endif

#endif // LOG_H
