/*
 * Runtime configuration
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include "config.h"

#include <cerrno>
#include <cstdlib>
#include <string>

#include "clipbootconfig.hpp"
#include "log.hpp"
#include "util.hpp"

#include "fmt/printf.h"

namespace config {
const char *const MARKER_FILE = "src/main.py";
const char *const MANIFEST_FILE = "requirements.txt";
const char *const WORKSPACE_DIR = "assets";
const char *const ISOLATION_ENV = "VIRTUAL_ENV";

static const platform_config platforms[] = {
    {Entry::Cli, "cli", "cli_main.py", "", "python3"},
    {Entry::Gui, "gui", "main.py", "src", "python3"},
};

static std::string s_project_root;
const char *project_root = nullptr;

const platform_config *platform_for(Entry entry) { return &platforms[static_cast<size_t>(entry)]; }

RESULT parse_entry(const char *name, Entry *entry) {
    if (!name)
        return MAKE_RESULT(SEV_ERROR, CAT_CONFIG, E_INVALID_ARG);

    for (const auto &platform : platforms) {
        if (LCSTRING_EQUALS(name, platform.name)) {
            *entry = platform.variant;
            return RESULT_OK;
        }
    }

    return MAKE_RESULT(SEV_ERROR, CAT_CONFIG, E_INVALID_ARG);
}

/* "clipboot-gui" -> "gui", "clipboot" -> nullptr */
static const char *invocation_suffix(const char *invocation_name) {
    if (!invocation_name)
        return nullptr;

    const char *base = strrchr(invocation_name, '/');
    base = base ? base + 1 : invocation_name;

    const char *dash = strrchr(base, '-');
    return dash ? dash + 1 : nullptr;
}

RESULT select_platform(const char *invocation_name, const char *requested, const platform_config **platform) {
    Entry entry = Entry::Cli;

    if (requested) {
        RESULT result = parse_entry(requested, &entry);
        if (FAILED(result)) {
            LOG_ERROR("Unknown entry point '%s', expected 'cli' or 'gui'", requested);
            return result;
        }
        LOG_DEBUG("Entry point '%s' requested explicitly", requested);
    } else if (SUCCEEDED(parse_entry(invocation_suffix(invocation_name), &entry))) {
        LOG_DEBUG("Entry point selected by invocation name: %s", invocation_name);
    } else if (FAILED(parse_entry(DEFAULT_ENTRY, &entry))) {
        /* Only reachable with a broken build configuration */
        LOG_ERROR("Invalid built-in default entry point '%s'", DEFAULT_ENTRY);
        return MAKE_RESULT(SEV_ERROR, CAT_CONFIG, E_INVALID_ARG);
    }

    *platform = platform_for(entry);
    return RESULT_OK;
}

RESULT setup_project_root(void) {
    char *cwd = getcwd(nullptr, 0);
    if (!cwd) {
        RESULT result = result_from_errno();
        fmt::fprintf(stderr, "Error: Failed to determine the current directory: %s\n", result_to_string(result));
        return result;
    }

    s_project_root = cwd;
    free(cwd);
    project_root = s_project_root.c_str();

    return RESULT_OK;
}

RESULT environment_from_process(bootstrap_env *env) {
    if (!project_root)
        return MAKE_RESULT(SEV_ERROR, CAT_CONFIG, E_NOT_READY);

    env->search_path = getenv("PATH");
    env->isolation_hint = getenv(ISOLATION_ENV);
    env->project_root = project_root;

    return RESULT_OK;
}
}; // namespace config
