/*
 * Workspace directory preparation
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "log.hpp"
#include "util.hpp"
#include "workspace.hpp"

RESULT prepare_workspace(const char *path) {
    if (!path || !path[0])
        return MAKE_RESULT(SEV_ERROR, CAT_WORKSPACE, E_INVALID_ARG);

    /* An existing workspace is used as it is, whatever its permissions */
    if (is_dir(path)) {
        LOG_DEBUG("Workspace already exists: %s", path);
        return RESULT_OK;
    }

    LOG_STATUS_INFO("Creating workspace directory %s...", path);

    RESULT result = ensure_dir(path);
    if (FAILED(result)) {
        result = RESULT_WITH_CATEGORY(result, CAT_WORKSPACE);
        LOG_STATUS_ERROR("Could not prepare workspace %s: %s", path, result_to_string(result));
        return result;
    }

    return RESULT_OK;
}
