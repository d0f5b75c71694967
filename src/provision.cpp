/*
 * Dependency installation from the project's requirements manifest
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "clipbootconfig.hpp"
#include "log.hpp"
#include "macros.hpp"
#include "provision.hpp"
#include "util.hpp"

RESULT provision_dependencies(const char *project_root, const char *runtime_path) {
    autofree char *manifest = nullptr;
    int status = 0;

    LOG_STATUS_INFO("Checking dependencies...");

    join_paths(manifest, project_root, config::MANIFEST_FILE);
    if (!manifest)
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);

    if (!is_regular_file(manifest)) {
        LOG_STATUS_ERROR("%s not found in %s", config::MANIFEST_FILE, project_root);
        return MAKE_RESULT(SEV_ERROR, CAT_DEPENDENCY, E_MANIFEST_MISSING);
    }

    LOG_STATUS_INFO("Installing/updating dependencies from %s...", config::MANIFEST_FILE);

    /* pip's complaints about already-satisfied or unavailable packages aren't useful here,
     * a failure is reported below as a single warning */
    const char *argv[] = {runtime_path, "-m", "pip", "install", "-r", manifest, nullptr};
    RESULT result = execute_program(argv, project_root, nullptr, "/dev/null", EXEC_DEFAULT, &status);

    if (FAILED(result)) {
        LOG_DEBUG_RESULT(result, "Could not run the dependency installer");
    } else if (status != 0) {
        LOG_DEBUG("Dependency installer exited with status %d", status);
    } else {
        LOG_STATUS_INFO("Dependencies are up to date.");
        return RESULT_OK;
    }

    LOG_STATUS_WARNING("Some dependencies may not have installed, continuing anyway.");
    return MAKE_RESULT(SEV_INFO, CAT_DEPENDENCY, E_PARTIAL);
}
