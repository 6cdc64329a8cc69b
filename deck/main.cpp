// main.cpp - deck command line: render, watch and golden

#include "compiler.hpp"
#include "font_resolver.hpp"
#include "golden.hpp"
#include "pipeline.hpp"
#include "watcher.hpp"
#include "../lib/log.h"
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

using namespace deck;

static volatile sig_atomic_t shutdown_requested = 0;

static void handle_signal(int sig) {
    (void)sig;
    shutdown_requested = 1;
}

static void print_help() {
    printf("deck - render slide decks to SVG, PNG and PDF\n\n");
    printf("Usage:\n");
    printf("  deck render <input.dsh|input.xml> [-t <format>] [-o <output>] [options]\n");
    printf("  deck watch [--formats svg,png,pdf] [--output <dir>] <path> [paths...]\n");
    printf("  deck golden <base_dir> [--category <name>] [--cleanup]\n\n");
    printf("Render options:\n");
    printf("  -t, --to <format>     svg, png, pdf or xml (default: svg)\n");
    printf("  -o, --output <file>   output file (default: input name with the format extension)\n");
    printf("  --grid <percent>      overlay a percentage grid (0 or at least %g)\n", MIN_GRID_PERCENT);
    printf("  --layers <list>       drawing order (default: %s)\n", DEFAULT_LAYERS);
    printf("  --title <text>        document title\n");
    printf("  --slide <n>           slide to render for svg and png, 1-based (default: 1)\n");
    printf("  --font <family>       default font family (default: %s)\n\n", DEFAULT_FONT_FAMILY);
    printf("Environment:\n");
    printf("  DECKSH                DSL compiler executable (default: decksh)\n");
    printf("  DECK_FONT_DIR         directory searched for fonts before the system\n");
}

// parse one render option at argv[*i]; 1 consumed, 0 not a render option, -1 error
static int parse_render_option(int argc, char* argv[], int* i, RenderOptions* options) {
    const char* arg = argv[*i];
    const char* names[] = { "--grid", "--layers", "--title", "--slide", "--font" };
    int which = -1;
    for (int n = 0; n < 5; n++) {
        if (strcmp(arg, names[n]) == 0) which = n;
    }
    if (which < 0) return 0;
    if (*i + 1 >= argc) {
        printf("Error: %s option requires an argument\n", arg);
        return -1;
    }
    const char* value = argv[++(*i)];
    char* end = NULL;
    switch (which) {
    case 0:
        options->grid_percent = strtod(value, &end);
        if (*end || !(options->grid_percent == 0 || options->grid_percent >= MIN_GRID_PERCENT)) {
            printf("Error: invalid grid percent '%s'\n", value);
            return -1;
        }
        break;
    case 1: options->layers = value;  break;
    case 2: options->title = value;  break;
    case 3: {
        long slide = strtol(value, &end, 10);
        if (*end || slide < 1) {
            printf("Error: invalid slide number '%s'\n", value);
            return -1;
        }
        options->slide_index = (int)slide - 1;
        break;
    }
    case 4: options->font_family = value;  break;
    }
    return 1;
}

static int exec_render(int argc, char* argv[]) {
    const char* input_file = NULL;
    const char* output_file = NULL;
    const char* to_format = "svg";
    RenderOptions options;

    for (int i = 1; i < argc; i++) {
        int consumed = parse_render_option(argc, argv, &i, &options);
        if (consumed < 0) return 1;
        if (consumed > 0) continue;
        if (strcmp(argv[i], "-t") == 0 || strcmp(argv[i], "--to") == 0) {
            if (i + 1 >= argc) {
                printf("Error: -t option requires a format argument\n");
                return 1;
            }
            to_format = argv[++i];
        } else if (strcmp(argv[i], "-o") == 0 || strcmp(argv[i], "--output") == 0) {
            if (i + 1 >= argc) {
                printf("Error: -o option requires an output file argument\n");
                return 1;
            }
            output_file = argv[++i];
        } else if (argv[i][0] != '-') {
            if (input_file) {
                printf("Error: Multiple input files not supported\n");
                return 1;
            }
            input_file = argv[i];
        } else {
            printf("Error: Unknown option '%s'\n", argv[i]);
            return 1;
        }
    }
    if (!input_file) {
        printf("Error: Input file is required\n");
        return 1;
    }

    FontResolver fonts;
    ExternalCompiler compiler;
    Pipeline pipeline(&fonts, &compiler);
    DeckError err;
    std::string written;
    DeckStatus status = pipeline.render_file(input_file, output_file ? output_file : "", to_format,
        options, &written, &err);
    if (status != DECK_OK) {
        fprintf(stderr, "Error: %s (%s)\n", err.describe().c_str(), deck_status_name(status));
        return 1;
    }
    printf("%s\n", written.c_str());
    return 0;
}

static int exec_watch(int argc, char* argv[]) {
    WatchConfig config;
    for (int i = 1; i < argc; i++) {
        int consumed = parse_render_option(argc, argv, &i, &config.options);
        if (consumed < 0) return 1;
        if (consumed > 0) continue;
        if (strcmp(argv[i], "--formats") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --formats option requires a list\n");
                return 1;
            }
            config.formats = argv[++i];
        } else if (strcmp(argv[i], "--output") == 0 || strcmp(argv[i], "-o") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --output option requires a directory\n");
                return 1;
            }
            config.output_dir = argv[++i];
        } else if (argv[i][0] != '-') {
            config.roots.push_back(argv[i]);
        } else {
            printf("Error: Unknown option '%s'\n", argv[i]);
            return 1;
        }
    }
    if (config.roots.empty()) {
        printf("Error: at least one path to watch is required\n");
        return 1;
    }

    FontResolver fonts;
    ExternalCompiler compiler;
    Pipeline pipeline(&fonts, &compiler);
    Watcher watcher(&pipeline, config);

    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, NULL);
    sigaction(SIGTERM, &action, NULL);

    if (!watcher.start()) return 1;
    log_info("watching %zu path(s), press Ctrl-C to stop", config.roots.size());
    while (!shutdown_requested) {
        usleep(100000);
    }
    log_info("shutting down file watcher...");
    if (!watcher.stop()) {
        // leave without unwinding so busy renders never see a destroyed pipeline
        log_warn("renders still running, exiting without waiting");
        log_fini();
        _exit(1);
    }
    return 0;
}

static int exec_golden(int argc, char* argv[]) {
    const char* base_dir = NULL;
    const char* category = "";
    bool cleanup = false;
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--category") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --category option requires a name\n");
                return 1;
            }
            category = argv[++i];
        } else if (strcmp(argv[i], "--cleanup") == 0) {
            cleanup = true;
        } else if (argv[i][0] != '-' && !base_dir) {
            base_dir = argv[i];
        } else {
            printf("Error: Unknown option '%s'\n", argv[i]);
            return 1;
        }
    }
    if (!base_dir) {
        printf("Error: golden test base directory is required\n");
        return 1;
    }

    FontResolver fonts;
    ExternalCompiler compiler;
    Pipeline pipeline(&fonts, &compiler);
    GoldenRunner runner(&pipeline, base_dir);
    if (cleanup) return runner.cleanup() ? 0 : 1;

    std::string error;
    if (!runner.load(&error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return 1;
    }
    GoldenSummary summary = runner.run_all(category);
    std::string title = *category ? "Results for '" + std::string(category) + "':" : "Results Summary:";
    printf("\n%s", summary.format(title).c_str());
    if (*category && summary.total == 0) return 1;
    return summary.failed > 0 ? 1 : 0;
}

int main(int argc, char* argv[]) {
    // Initialize logging system with config file if available
    if (access("log.conf", F_OK) == 0) {
        if (log_parse_config_file("log.conf") != LOG_OK) {
            fprintf(stderr, "Warning: Failed to parse log.conf, using defaults\n");
        }
    }
    log_init("");

    int exit_code = 0;
    if (argc < 2 || strcmp(argv[1], "--help") == 0 || strcmp(argv[1], "-h") == 0) {
        print_help();
        exit_code = argc < 2 ? 1 : 0;
    } else if (strcmp(argv[1], "render") == 0) {
        exit_code = exec_render(argc - 1, argv + 1);
    } else if (strcmp(argv[1], "watch") == 0) {
        exit_code = exec_watch(argc - 1, argv + 1);
    } else if (strcmp(argv[1], "golden") == 0) {
        exit_code = exec_golden(argc - 1, argv + 1);
    } else {
        printf("Error: Unknown command '%s'\n", argv[1]);
        print_help();
        exit_code = 1;
    }

    log_fini();
    return exit_code;
}
