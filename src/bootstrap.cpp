/*
 * The bootstrap sequence: preflight, dependencies, workspace, launch
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "bootstrap.hpp"
#include "launch.hpp"
#include "log.hpp"
#include "macros.hpp"
#include "preflight.hpp"
#include "provision.hpp"
#include "util.hpp"
#include "workspace.hpp"

int exit_code_from_result(RESULT result) {
    switch (RESULT_CATEGORY(result)) {
    case CAT_PREFLIGHT:
        return RESULT_CODE(result) == E_WRONG_DIRECTORY ? EXIT_WRONG_DIRECTORY : EXIT_RUNTIME_MISSING;
    case CAT_DEPENDENCY:
        return EXIT_MANIFEST_MISSING;
    case CAT_WORKSPACE:
        return EXIT_WORKSPACE_ERROR;
    case CAT_LAUNCH:
        return EXIT_LAUNCH_FAILED;
    default:
        return EXIT_CONFIG_ERROR;
    }
}

static int fail(RESULT result, const char *what) {
    LOG_SYSTEM("%s: %s", what, result_to_string(result));
    return exit_code_from_result(result);
}

int run_bootstrap(const config::bootstrap_env *env, const config::platform_config *platform, int argc,
                  const char *const argv[]) {
    struct runtime_probe probe = {};
    autofree char *workspace = nullptr;
    int exit_code = 0;
    RESULT result;

    result = preflight_check(env, platform, &probe);
    if (FAILED(result)) {
        runtime_probe_free(&probe);
        return fail(result, "Preflight check failed");
    }

    result = provision_dependencies(env->project_root, probe.path);
    if (FAILED(result)) {
        runtime_probe_free(&probe);
        return fail(result, "Dependency check failed");
    }

    join_paths(workspace, env->project_root, config::WORKSPACE_DIR);
    result = prepare_workspace(workspace);
    if (FAILED(result)) {
        runtime_probe_free(&probe);
        return fail(result, "Workspace preparation failed");
    }

    result = launch_entry(platform, env->project_root, probe.path, argc > 1 ? argv + 1 : nullptr,
                          argc > 1 ? argc - 1 : 0, &exit_code);
    runtime_probe_free(&probe);
    if (FAILED(result))
        return fail(result, "Launch failed");

    return exit_code;
}
