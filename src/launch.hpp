/*
 * Entry point handoff
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include "clipbootconfig.hpp"
#include "result.hpp"

/* Run `runtime_path <entry script> args...` from the entry's directory under `project_root`,
 * with the standard streams inherited, and wait for it.
 * SIGINT/SIGQUIT are left to the entry point while it runs.
 * exit_code receives the entry point's exit status (128 + signal if it was killed).
 * Returns CAT_LAUNCH/E_SPAWN_FAILED if it could not be started */
RESULT launch_entry(const config::platform_config *platform, const char *project_root, const char *runtime_path,
                    const char *const args[], int nargs, int *exit_code);
