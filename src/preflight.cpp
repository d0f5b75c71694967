/*
 * Preflight checks run before anything is installed or launched
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <cstdlib>

#include "log.hpp"
#include "macros.hpp"
#include "preflight.hpp"
#include "util.hpp"

void runtime_probe_free(struct runtime_probe *probe) {
    if (!probe)
        return;
    free(probe->path);
    free(probe->version);
    *probe = {};
}

RESULT probe_runtime(const config::bootstrap_env *env, const config::platform_config *platform,
                     struct runtime_probe *probe) {
    runtime_probe_free(probe);

    /* The project root is the bootstrapper's working directory, resolving relative PATH elements
     * against it keeps the path valid for the entry that runs from src/ */
    probe->path = find_in_path(platform->runtime_name, env->search_path, env->project_root);
    if (!probe->path)
        return MAKE_RESULT(SEV_ERROR, CAT_PREFLIGHT, E_RUNTIME_MISSING);
    probe->found = true;

    /* The version is informational, a runtime that can't report it is still usable */
    const char *argv[] = {probe->path, "--version", nullptr};
    RESULT result = capture_program_output(argv, &probe->version);
    if (FAILED(result))
        LOG_DEBUG_RESULT(result, "Could not query the runtime version");

    return RESULT_OK;
}

bool is_project_root(const config::bootstrap_env *env) {
    autofree char *marker = nullptr;

    if (!env->project_root)
        return false;

    join_paths(marker, env->project_root, config::MARKER_FILE);
    return marker && is_regular_file(marker);
}

bool is_isolated(const config::bootstrap_env *env) { return env->isolation_hint && env->isolation_hint[0]; }

RESULT preflight_check(const config::bootstrap_env *env, const config::platform_config *platform,
                       struct runtime_probe *probe) {
    RESULT result = probe_runtime(env, platform, probe);
    if (FAILED(result)) {
        LOG_STATUS_ERROR("%s was not found on PATH. Install Python 3 and try again.", platform->runtime_name);
        return result;
    }
    LOG_STATUS_INFO("Runtime: %s (%s)", probe->path, probe->version ? probe->version : "unknown version");

    if (!is_project_root(env)) {
        LOG_STATUS_ERROR("%s not found in %s. Run " PROG_NAME " from the project root directory.",
                         config::MARKER_FILE, env->project_root ? env->project_root : "(unknown directory)");
        return MAKE_RESULT(SEV_ERROR, CAT_PREFLIGHT, E_WRONG_DIRECTORY);
    }
    LOG_STATUS_INFO("Project root: %s", env->project_root);

    if (!is_isolated(env)) {
        LOG_STATUS_WARNING("No virtual environment is active, creating one is recommended:");
        LOG_STATUS_WARNING("   %s -m venv venv", platform->runtime_name);
        LOG_STATUS_WARNING("   source venv/bin/activate  # macOS/Linux");
        LOG_STATUS_WARNING("   venv\\Scripts\\activate     # Windows");
    } else {
        LOG_STATUS_INFO("Virtual environment: %s", env->isolation_hint);
    }

    return RESULT_OK;
}
