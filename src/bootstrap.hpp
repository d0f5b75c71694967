/*
 * The bootstrap sequence: preflight, dependencies, workspace, launch
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include "clipbootconfig.hpp"
#include "result.hpp"

/* Process exit codes for conditions that stop the sequence */
#define EXIT_CONFIG_ERROR 1
#define EXIT_RUNTIME_MISSING 2
#define EXIT_WRONG_DIRECTORY 3
#define EXIT_MANIFEST_MISSING 4
#define EXIT_WORKSPACE_ERROR 5
#define EXIT_LAUNCH_FAILED 6

/* Map a failed RESULT from one of the stages to its process exit code */
int exit_code_from_result(RESULT result);

/* Run every stage in order and hand `argv[1..argc)` to the selected entry point.
 * Returns the entry point's exit status, or one of the EXIT_* codes if a stage failed */
int run_bootstrap(const config::bootstrap_env *env, const config::platform_config *platform, int argc,
                  const char *const argv[]);
