/*
 * Shared header for helper functions
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <cstring>
#include <strings.h>
#include <sys/stat.h>
#include <tuple>
#include <unistd.h>

#include "config.h"
#include "result.hpp"

#define BUFFER_SIZE 8192

/* case sensitive */
#define STRING_EQUALS(string1, string2) (strcmp(string1, string2) == 0)
/* case sensitive */
#define STRING_PREFIX(string, prefix) (strncmp(string, prefix, sizeof(prefix) - 1UL) == 0)
/* lowercase string equals (case insensitive) */
#define LCSTRING_EQUALS(string1, string2) (strcasecmp(string1, string2) == 0)
/* lowercase string prefix (case insensitive) */
#define LCSTRING_PREFIX(string, prefix) (strncasecmp(string, prefix, sizeof(prefix) - 1UL) == 0)

#define STRING_AFTER_PREFIX(string, prefix) (string + (sizeof(prefix) - 1UL))

void _append_sep_impl(char *result_ptr[], const char *separator, int num_strings, ...);

#define COUNT_JOIN_ARGS(...) ((int)std::tuple_size<decltype(std::make_tuple(__VA_ARGS__))>::value)

/* Join strings with a `sep` separator into the first argument (`result`) */
#define append_sep(result, sep, ...)                                                                                   \
    _append_sep_impl(&(result), sep, COUNT_JOIN_ARGS(__VA_ARGS__) __VA_OPT__(, ) __VA_ARGS__)

/* Join paths with a `/` separator into the first argument (`result`) */
#define join_paths(result, ...) append_sep(result, "/", __VA_ARGS__)

/* Ensure a directory exists and is writable, creating it if necessary
 * Will create parent directories as needed (like mkdir -p)
 * Returns RESULT_OK on success, error RESULT on failure */
RESULT ensure_dir(const char *path);

/* Search a colon-separated `search_path` (a PATH value) for an executable called `name`
 * An empty element means the current directory, like execvp(3)
 * Relative elements are resolved against `base_dir` when it is given (normally the current directory),
 * which makes the result absolute whenever `base_dir` is
 * Returns a newly allocated path that must be freed by the caller
 * Returns nullptr if nothing was found */
char *find_in_path(const char *name, const char *search_path, const char *base_dir = nullptr);

/* Flags for execute_program() */
#define EXEC_DEFAULT 0
/* Ignore SIGINT/SIGQUIT in this process while the child runs, so only the child reacts to them */
#define EXEC_SHIELD_INTERRUPTS (1 << 0)

/* Run argv[0] (a path, PATH is not searched) with the remaining arguments and wait for it
 * cwd: directory for the child (nullptr = inherit)
 * stdout_path/stderr_path: files to redirect the child's output to (nullptr = inherit)
 * exit_status: receives the exit code, or 128 + signal number if the child was killed
 * Returns RESULT_OK if the child ran, error RESULT if it could not be started */
RESULT execute_program(const char *const argv[], const char *cwd, const char *stdout_path, const char *stderr_path,
                       int flags, int *exit_status);

/* Run argv[0] and return the first line it prints (stdout and stderr combined) in `output`,
 * which must be freed by the caller. Returns error RESULT if it could not be started or
 * exited with a non-zero status. Output past the first few KiB is not read; a child killed by
 * SIGPIPE for that reason still counts as successful once its first line is in */
RESULT capture_program_output(const char *const argv[], char *output[]);

/* Is the file a real executable file? */
static inline bool is_exec_file(const char *path) {
    struct stat file_stat;
    if (stat(path, &file_stat) != 0 || !S_ISREG(file_stat.st_mode) || access(path, X_OK) != 0)
        return false;
    return true;
}

static inline bool is_regular_file(const char *path) {
    struct stat file_stat;
    return stat(path, &file_stat) == 0 && S_ISREG(file_stat.st_mode);
}

static inline bool is_dir(const char *path) {
    struct stat file_stat;
    return stat(path, &file_stat) == 0 && S_ISDIR(file_stat.st_mode);
}
