/*
 * Entry point handoff
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <cstdlib>

#include "launch.hpp"
#include "log.hpp"
#include "macros.hpp"
#include "util.hpp"

RESULT launch_entry(const config::platform_config *platform, const char *project_root, const char *runtime_path,
                    const char *const args[], int nargs, int *exit_code) {
    autofree char *entry_dir = nullptr;
    autofree const char **new_argv = nullptr;
    RESULT result;

    /* The entry point resolves its resources relative to its own directory */
    join_paths(entry_dir, project_root, platform->entry_dir);
    if (!entry_dir)
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);

    if (!is_dir(entry_dir)) {
        LOG_STATUS_ERROR("Entry point directory not found: %s", entry_dir);
        return MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_SPAWN_FAILED);
    }

    new_argv = (const char **)calloc(nargs + 3, sizeof(char *));
    if (!new_argv)
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);

    new_argv[0] = runtime_path;
    new_argv[1] = platform->entry_script;
    for (int i = 0; i < nargs; i++)
        new_argv[i + 2] = args[i];

    if (platform->variant == config::Entry::Cli) {
        LOG_INFO("Starting the command-line version...");
        LOG_INFO("Press Ctrl+C or type 'quit' in interactive mode to exit");
    } else {
        LOG_INFO("Starting the application...");
    }
    LOG_DEBUG("Running %s %s from %s with %d forwarded argument(s)", runtime_path, platform->entry_script, entry_dir,
              nargs);

    result = execute_program(new_argv, entry_dir, nullptr, nullptr, EXEC_SHIELD_INTERRUPTS, exit_code);
    if (FAILED(result)) {
        result = MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_SPAWN_FAILED);
        LOG_STATUS_ERROR("Failed to start %s with %s", platform->entry_script, runtime_path);
        return result;
    }

    LOG_DEBUG("%s exited with status %d", platform->entry_script, *exit_code);
    return RESULT_OK;
}
