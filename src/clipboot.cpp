/*
 * Crypto Clipboard bootstrapper/launcher program
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "config.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "bootstrap.hpp"
#include "clipbootconfig.hpp"
#include "log.hpp"
#include "macros.hpp"
#include "result.hpp"
#include "util.hpp"

#include "fmt/core.h"
#include "fmt/printf.h"

static void print_usage() {
    fmt::print(R"_(Usage: {2} [args_for_application...]
Checks the environment, installs the dependencies from {3}, creates {4}/ and
then runs the Crypto Clipboard entry point with all arguments passed through unchanged.
Run it from the project root (the directory containing {5}).

Environment variables:
  CLIPBOOT_VERBS      Semicolon-separated list of verbs to control {0} behavior:
                      - 'version'   Just print the version of {0} and exit
                      - 'help'      Display this help and exit
                      - 'entry=cli' Run the command-line entry point
                      - 'entry=gui' Run the interactive entry point
                      The default entry point is '{1}'. Invoking {0} through a name ending in
                      '-cli' or '-gui' (e.g. a {0}-gui symlink) selects that entry point too.

            Examples:
                CLIPBOOT_VERBS="entry=gui" {2}
                {2} --verbose

  CLIPBOOT_LOG_LEVEL  Control the verbosity of the logging output. Valid values are:
                      - 'none'     Turn off all logging
                      - 'error'    Show only critical errors that prevent proper operation
                      - 'warn'     Show warnings and errors
                      - 'info'     Show normal operational information and all of the above (default)
                      - 'debug'    Show detailed debugging information and all of the above

  CLIPBOOT_LOG_FILE   Also append log messages to this file (off by default)

Exit status:
  The exit status of the application, or
    2  Python 3 was not found
    3  not started from the project root
    4  {3} is missing
    5  {4}/ could not be created
    6  the application could not be started
)_",
               PROG_NAME, DEFAULT_ENTRY, program_invocation_short_name, config::MANIFEST_FILE, config::WORKSPACE_DIR,
               config::MARKER_FILE);
}

struct options {
    char *entry;          /* Entry point requested with entry= (nullptr = pick automatically) */
    unsigned version : 1; /* 1 = return a version string and exit */
    unsigned help : 1;    /* 1 = show help and exit */
};

/* Parse a single option string and update the options structure */
static RESULT parse_option(nonnull_charp option, struct options *opts) {
    if (!opts || !option[0])
        return RESULT_OK; /* Skip empty options, not an error */

    if (LCSTRING_EQUALS(option, "version")) {
        opts->version = 1;
    } else if (LCSTRING_EQUALS(option, "help")) {
        opts->help = 1;
    } else if (LCSTRING_PREFIX(option, "entry=")) {
        config::Entry entry;
        const char *name = STRING_AFTER_PREFIX(option, "entry=");
        if (FAILED(config::parse_entry(name, &entry))) {
            LOG_ERROR("Invalid entry point '%s', expected 'cli' or 'gui'", name);
            return MAKE_RESULT(SEV_ERROR, CAT_CONFIG, E_INVALID_ARG);
        }
        free(opts->entry);
        opts->entry = strdup(name);
    } else {
        return MAKE_RESULT(SEV_WARNING, CAT_CONFIG, E_UNKNOWN); /* Unknown option */
    }

    return RESULT_OK;
}

static RESULT parse_env_options(struct options *opts) {
    const char *verbs = getenv("CLIPBOOT_VERBS");
    if (!verbs)
        return RESULT_OK;

    autofree char *verbs_copy = strdup(verbs);
    if (!verbs_copy)
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);

    char *token, *saveptr;
    token = strtok_r(verbs_copy, ";", &saveptr);

    while (token) {
        RESULT result = parse_option(token, opts);
        if (FAILED(result)) {
            if (RESULT_SEVERITY(result) > SEV_WARNING)
                return result;
            LOG_INFO("Unknown CLIPBOOT_VERBS token: %s", token);
        } else if (opts->help) {
            LOG_DEBUG("Returning early, got help token");
            break;
        }
        token = strtok_r(nullptr, ";", &saveptr);
    }

    return RESULT_OK;
}

/* Note that we don't *really* care about freeing things from main(), since that's handled
   when the process exits. */
int main(int argc, char *argv[]) {
    RESULT result;

    result = log_init();
    if (FAILED(result) && (RESULT_CODE(result) != E_CANCELED))
        fmt::fprintf(stderr, "Warning: Failed to initialize logging to file: %s\n", result_to_string(result));

    struct options opts = {};
    result = parse_env_options(&opts);
    if (FAILED(result)) {
        LOG_RESULT(Level::Error, result, "Failed to parse CLIPBOOT_VERBS");
        log_cleanup();
        return EXIT_CONFIG_ERROR;
    }

    if (opts.help) {
        print_usage();
        log_cleanup();
        return 0;
    }

    if (opts.version) {
        fmt::printf(VERSION "\n");
        log_cleanup();
        return 0;
    }

    /* pip would install into the system interpreter */
    if (geteuid() == 0)
        LOG_WARNING("Running as root, dependencies will be installed system-wide.");

    if (FAILED(config::setup_project_root())) {
        log_cleanup();
        return EXIT_CONFIG_ERROR;
    }

    const config::platform_config *platform = nullptr;
    result = config::select_platform(argv[0], opts.entry, &platform);
    if (FAILED(result)) {
        log_cleanup();
        return EXIT_CONFIG_ERROR;
    }

    config::bootstrap_env env = {};
    result = config::environment_from_process(&env);
    if (FAILED(result)) {
        LOG_RESULT(Level::Error, result, "Failed to read the process environment");
        log_cleanup();
        return EXIT_CONFIG_ERROR;
    }

    LOG_INFO("Starting Crypto Clipboard (%s entry point)", platform->name);
    LOG_DEBUG(PROG_NAME " " VERSION " project root: %s", config::project_root);

    int status = run_bootstrap(&env, platform, argc, (const char *const *)argv);

    log_cleanup();
    return status;
}
