/*
 * Preflight checks run before anything is installed or launched
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include "clipbootconfig.hpp"
#include "result.hpp"

/* What the runtime lookup found. Zero-initialize before first use. `path` and `version` are owned and must be
 * released with runtime_probe_free() */
struct runtime_probe {
    bool found;
    char *path;    /* executable found on PATH */
    char *version; /* first line of `<runtime> --version`, nullptr if unknown */
};

void runtime_probe_free(struct runtime_probe *probe);

/* Look for the platform's runtime on env->search_path and ask it for its version */
RESULT probe_runtime(const config::bootstrap_env *env, const config::platform_config *platform,
                     struct runtime_probe *probe);

/* Is env->project_root the project root (does it contain config::MARKER_FILE)? */
bool is_project_root(const config::bootstrap_env *env);

/* Is an isolated environment (virtualenv) active? */
bool is_isolated(const config::bootstrap_env *env);

/* Run every preflight check in order, filling `probe` on the way.
 * Returns CAT_PREFLIGHT/E_RUNTIME_MISSING or CAT_PREFLIGHT/E_WRONG_DIRECTORY on a fatal
 * condition; the isolation advisory never fails */
RESULT preflight_check(const config::bootstrap_env *env, const config::platform_config *platform,
                       struct runtime_probe *probe);
