/*
 * Workspace directory preparation
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include "result.hpp"

/* Create `path` (and its parents) if it doesn't exist yet. An existing directory is left alone.
 * Any other filesystem problem is returned as a CAT_WORKSPACE failure */
RESULT prepare_workspace(const char *path);
