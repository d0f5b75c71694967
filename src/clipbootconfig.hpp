/*
 * Runtime configuration
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <cstdint>

#include "result.hpp"

namespace config {
    /* Paths relative to the project root */
    extern const char *const MARKER_FILE;
    extern const char *const MANIFEST_FILE;
    extern const char *const WORKSPACE_DIR;

    /* Set by an activated virtual environment */
    extern const char *const ISOLATION_ENV;

    enum class Entry : uint8_t {
        Cli = 0, /* command-line entry, run from the project root */
        Gui = 1, /* interactive entry, run from its own directory */
    };

    /* What differs between the command-line and the interactive launch */
    struct platform_config {
        Entry variant;
        const char *name;         /* "cli" or "gui" */
        const char *entry_script; /* script handed to the runtime */
        const char *entry_dir;    /* directory of the script relative to the project root ("" = the root) */
        const char *runtime_name; /* interpreter looked up on PATH */
    };

    /* The process environment the bootstrap stages see. Filled from the real process by
     * environment_from_process(), or by hand in tests */
    struct bootstrap_env {
        const char *search_path;    /* PATH value (nullptr = unset) */
        const char *isolation_hint; /* ISOLATION_ENV value (nullptr = unset) */
        const char *project_root;   /* directory expected to hold MARKER_FILE */
    };

    const platform_config *platform_for(Entry entry);

    /* Parse "cli"/"gui" (case insensitive) */
    RESULT parse_entry(const char *name, Entry *entry);

    /* Pick the platform: an explicit `requested` name wins, then a "-cli"/"-gui" suffix on
     * `invocation_name`, then the build default */
    RESULT select_platform(const char *invocation_name, const char *requested, const platform_config **platform);

    /* Record the current directory as the project root */
    RESULT setup_project_root(void);

    RESULT environment_from_process(bootstrap_env *env);

    /* The project root, set at startup in main() */
    extern const char *project_root;
};
