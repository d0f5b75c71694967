/*
 * Dependency installation from the project's requirements manifest
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include "result.hpp"

/* Install everything listed in `project_root`/config::MANIFEST_FILE with `runtime_path -m pip`.
 * Returns:
 *  - CAT_DEPENDENCY/E_MANIFEST_MISSING (failure) if the manifest doesn't exist
 *  - RESULT_OK if the installer succeeded
 *  - MAKE_RESULT(SEV_INFO, CAT_DEPENDENCY, E_PARTIAL) (still a success) if it failed in any way
 */
RESULT provision_dependencies(const char *project_root, const char *runtime_path);
