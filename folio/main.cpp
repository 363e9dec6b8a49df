// main.cpp - folio command line driver
//
// Runs the pagination session headless against the estimated layout.

#include "folio_config.hpp"
#include "folio_estimated_layout.hpp"
#include "folio_outline.hpp"
#include "folio_session.hpp"
#include "folio_task_runner.hpp"
#include "../lib/log.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <unistd.h>

using namespace folio;

static const int DEFAULT_MAX_PASSES = 10000;

static void print_help(const char* prog) {
    printf("Folio page reflow engine\n\n");
    printf("Usage:\n");
    printf("  %s paginate <outline> [-c <config>] [-o <output>] [--max-passes <n>]\n", prog);
    printf("  %s measure <outline> [-c <config>]\n", prog);
    printf("\nOptions:\n");
    printf("  -c, --config <file>    reflow and layout parameters (key = value)\n");
    printf("  -o, --output <file>    write the paginated outline to a file\n");
    printf("  --max-passes <n>       stop after n scheduled tasks (default %d)\n", DEFAULT_MAX_PASSES);
    printf("  -v, --verbose          debug logging\n");
}

struct CliOptions {
    const char* command;
    const char* input_file;
    const char* config_file;
    const char* output_file;
    int max_passes;
    bool verbose;
};

static bool parse_options(int argc, char* argv[], CliOptions* opts) {
    memset(opts, 0, sizeof(*opts));
    opts->max_passes = DEFAULT_MAX_PASSES;
    if (argc < 2) return false;
    opts->command = argv[1];

    for (int i = 2; i < argc; i++) {
        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                printf("Error: %s requires a file\n", argv[i]);
                return false;
            }
            opts->config_file = argv[++i];
        } else if (strcmp(argv[i], "-o") == 0 || strcmp(argv[i], "--output") == 0) {
            if (i + 1 >= argc) {
                printf("Error: %s requires a file\n", argv[i]);
                return false;
            }
            opts->output_file = argv[++i];
        } else if (strcmp(argv[i], "--max-passes") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --max-passes requires a number\n");
                return false;
            }
            opts->max_passes = atoi(argv[++i]);
            if (opts->max_passes < 1) {
                printf("Error: --max-passes must be positive\n");
                return false;
            }
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            opts->verbose = true;
        } else if (argv[i][0] != '-' && !opts->input_file) {
            opts->input_file = argv[i];
        } else {
            printf("Error: Unknown option '%s'\n", argv[i]);
            return false;
        }
    }
    if (!opts->input_file) {
        printf("Error: no input outline given\n");
        return false;
    }
    return true;
}

static void print_measure(const Document& doc, EstimatedLayout& layout, const ReflowParams& params) {
    for (int i = 0; i < doc.page_count(); i++) {
        float height = layout.page_content_height(i);
        printf("page %d: %d blocks, height %.1f / %.1f%s\n", i + 1, doc.page(i)->child_count(),
               height, params.page_capacity,
               height > params.page_capacity + params.height_tolerance ? "  OVERFLOW" : "");
    }
}

static int exec_measure(const CliOptions& opts, const FolioConfig& config) {
    Document doc;
    if (!outline_load_file(opts.input_file, &doc)) return 1;

    EstimatedLayout layout(config.layout);
    layout.commit(doc);
    print_measure(doc, layout, config.reflow);
    return 0;
}

static int exec_paginate(const CliOptions& opts, const FolioConfig& config) {
    Document doc;
    if (!outline_load_file(opts.input_file, &doc)) return 1;

    EstimatedLayout layout(config.layout);
    ManualTaskRunner runner;
    PaginationSession session(make_editor_state(doc, Schema::standard()), &layout, &runner,
                              config.reflow, nullptr);

    int ran = runner.run_until_idle(opts.max_passes);
    if (runner.pending_count() > 0) {
        log_error("reflow did not converge after %d tasks", ran);
    }
    log_info("paginate: %d passes, %d reflows, %d -> %d pages", session.passes(), session.reflows(),
             doc.page_count(), session.doc().page_count());

    std::string text = outline_write(session.doc());
    if (opts.output_file) {
        FILE* out = fopen(opts.output_file, "wb");
        if (!out) {
            log_error("cannot open output file '%s'", opts.output_file);
            return 1;
        }
        size_t written = fwrite(text.data(), 1, text.size(), out);
        fclose(out);
        if (written != text.size()) {
            log_error("short write to '%s'", opts.output_file);
            return 1;
        }
    } else {
        fputs(text.c_str(), stdout);
    }

    print_measure(session.doc(), layout, config.reflow);
    session.shutdown();
    return runner.pending_count() > 0 ? 2 : 0;
}

int main(int argc, char* argv[]) {
    if (access("log.conf", F_OK) == 0) {
        if (log_parse_config_file("log.conf") != LOG_OK) {
            fprintf(stderr, "Warning: Failed to parse log.conf, using defaults\n");
        }
    }
    log_init("");

    if (argc >= 2 && (strcmp(argv[1], "--help") == 0 || strcmp(argv[1], "-h") == 0)) {
        print_help(argv[0]);
        return 0;
    }

    CliOptions opts;
    if (!parse_options(argc, argv, &opts)) {
        print_help(argv[0]);
        return 1;
    }
    if (opts.verbose) {
        log_init("[rules]\nfolio.DEBUG >stderr\ndefault.DEBUG >stderr\n");
    }

    FolioConfig config = FolioConfig::defaults();
    if (opts.config_file && !config_load_file(opts.config_file, &config)) {
        printf("Error: invalid config file '%s'\n", opts.config_file);
        return 1;
    }

    int rc;
    if (strcmp(opts.command, "paginate") == 0) {
        rc = exec_paginate(opts, config);
    } else if (strcmp(opts.command, "measure") == 0) {
        rc = exec_measure(opts, config);
    } else {
        printf("Error: Unknown command '%s'\n", opts.command);
        print_help(argv[0]);
        rc = 1;
    }

    log_fini();
    return rc;
}
