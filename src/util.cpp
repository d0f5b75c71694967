/*
 * Helper functions
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#include <cerrno>
#include <csignal>
#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>

#include "log.hpp"
#include "macros.hpp"
#include "util.hpp"

void _append_sep_impl(char *result_ptr[], const char *separator, int num_strings, ...) {
    va_list args;
    size_t sep_len = strlen(separator);
    size_t total_len = *result_ptr ? strlen(*result_ptr) : 0;
    int have_content = total_len > 0;

    /* First pass: measure */
    va_start(args, num_strings);
    for (int i = 0; i < num_strings; i++) {
        const char *str = va_arg(args, const char *);
        if (!str || !str[0])
            continue;
        total_len += strlen(str) + (have_content ? sep_len : 0);
        have_content = 1;
    }
    va_end(args);

    char *result = (char *)realloc(*result_ptr, total_len + 1);
    if (!result)
        return; /* leave the original string alone */
    if (!*result_ptr)
        result[0] = '\0';

    /* Second pass: copy */
    char *pos = result + strlen(result);
    have_content = pos != result;

    va_start(args, num_strings);
    for (int i = 0; i < num_strings; i++) {
        const char *str = va_arg(args, const char *);
        if (!str || !str[0])
            continue;
        if (have_content) {
            memcpy(pos, separator, sep_len);
            pos += sep_len;
        }
        size_t len = strlen(str);
        memcpy(pos, str, len);
        pos += len;
        have_content = 1;
    }
    va_end(args);

    *pos = '\0';
    *result_ptr = result;
}

static RESULT check_writable_dir(const char *path) {
    struct stat st;

    if (stat(path, &st) != 0)
        return result_from_errno();
    if (!S_ISDIR(st.st_mode))
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_NOT_DIR);
    if (access(path, W_OK | X_OK) != 0)
        return result_from_errno();

    return RESULT_OK;
}

RESULT ensure_dir(const char *path) {
    if (!path || !path[0])
        return MAKE_RESULT(SEV_ERROR, CAT_FILESYSTEM, E_INVALID_ARG);

    if (is_dir(path))
        return check_writable_dir(path);

    autofree char *tmp = strdup(path);
    if (!tmp)
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);

    size_t len = strlen(tmp);
    while (len > 1 && tmp[len - 1] == '/')
        tmp[--len] = '\0';

    /* Create every missing component, leading slash excluded */
    for (char *p = tmp + 1; *p; p++) {
        if (*p != '/')
            continue;
        *p = '\0';
        if (mkdir(tmp, 0755) != 0 && errno != EEXIST) {
            RESULT result = result_from_errno();
            LOG_DEBUG("mkdir %s failed: %s", tmp, strerror(errno));
            return result;
        }
        *p = '/';
    }

    if (mkdir(tmp, 0755) != 0 && errno != EEXIST) {
        RESULT result = result_from_errno();
        LOG_DEBUG("mkdir %s failed: %s", tmp, strerror(errno));
        return result;
    }

    /* EEXIST above can also mean a non-directory is in the way */
    return check_writable_dir(tmp);
}

char *find_in_path(const char *name, const char *search_path, const char *base_dir) {
    if (!name || !name[0])
        return nullptr;

    /* A name with a slash is a path already */
    if (strchr(name, '/'))
        return is_exec_file(name) ? strdup(name) : nullptr;

    if (!search_path || !search_path[0])
        return nullptr;

    autofree char *path_copy = strdup(search_path);
    if (!path_copy)
        return nullptr;

    char *cursor = path_copy;
    while (cursor) {
        char *element = cursor;
        char *colon = strchr(cursor, ':');
        if (colon) {
            *colon = '\0';
            cursor = colon + 1;
        } else {
            cursor = nullptr;
        }

        /* Relative elements (and the empty one) are taken from base_dir, so the result
         * stays usable after a chdir */
        char *candidate = nullptr;
        if (element[0] == '/' || !base_dir)
            join_paths(candidate, element[0] ? element : ".", name);
        else
            join_paths(candidate, base_dir, element, name);
        if (!candidate)
            return nullptr;

        if (is_exec_file(candidate))
            return candidate;

        free(candidate);
    }

    return nullptr;
}

static int open_redirect(const char *path) { return open(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644); }

/* Child side of execute_program; never returns. Reports a setup failure to the parent
 * by writing errno into `report_fd` (close-on-exec, so a successful exec closes it silently) */
[[noreturn]] static void exec_child(const char *const argv[], const char *cwd, int stdout_fd, int stderr_fd,
                                    const struct sigaction *old_int, const struct sigaction *old_quit, int report_fd) {
    int err = 0;

    if (old_int)
        sigaction(SIGINT, old_int, nullptr);
    if (old_quit)
        sigaction(SIGQUIT, old_quit, nullptr);

    if ((stdout_fd >= 0 && dup2(stdout_fd, STDOUT_FILENO) < 0) ||
        (stderr_fd >= 0 && dup2(stderr_fd, STDERR_FILENO) < 0) || (cwd && chdir(cwd) != 0)) {
        err = errno;
    } else {
        execv(argv[0], (char *const *)argv);
        err = errno;
    }

    if (write(report_fd, &err, sizeof(err)) < 0) {
    } /* nothing left to tell anyone */
    _exit(127);
}

static int decode_wait_status(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return 1;
}

RESULT execute_program(const char *const argv[], const char *cwd, const char *stdout_path, const char *stderr_path,
                       int flags, int *exit_status) {
    autoclose_fd int stdout_fd = -1;
    autoclose_fd int stderr_fd = -1;
    autoclose_fd int report_read = -1;
    autoclose_fd int report_write = -1;
    struct sigaction ignore = {}, old_int = {}, old_quit = {};
    bool shield = (flags & EXEC_SHIELD_INTERRUPTS) != 0;
    RESULT result = RESULT_OK;
    int status = 0;
    pid_t pid;

    if (!argv || !argv[0])
        return MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_INVALID_ARG);

    if (stdout_path && (stdout_fd = open_redirect(stdout_path)) < 0) {
        result = result_from_errno();
        LOG_RESULT(Level::Debug, result, "Failed to open stdout redirect");
        return result;
    }
    if (stderr_path && (stderr_fd = open_redirect(stderr_path)) < 0) {
        result = result_from_errno();
        LOG_RESULT(Level::Debug, result, "Failed to open stderr redirect");
        return result;
    }

    int report_pipe[2];
    if (pipe2(report_pipe, O_CLOEXEC) != 0)
        return result_from_errno();
    report_read = report_pipe[0];
    report_write = report_pipe[1];

    if (shield) {
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        sigaction(SIGINT, &ignore, &old_int);
        sigaction(SIGQUIT, &ignore, &old_quit);
    }

    /* Make sure buffered output shows up before the child's */
    fflush(stdout);
    fflush(stderr);

    pid = fork();
    if (pid == 0)
        exec_child(argv, cwd, stdout_fd, stderr_fd, shield ? &old_int : nullptr, shield ? &old_quit : nullptr,
                   report_write);

    if (pid < 0) {
        result = result_from_errno();
    } else {
        close(report_write);
        report_write = -1;

        int child_errno = 0;
        ssize_t got;
        do {
            got = read(report_read, &child_errno, sizeof(child_errno));
        } while (got < 0 && errno == EINTR);

        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                result = result_from_errno();
                break;
            }
        }

        if (got == (ssize_t)sizeof(child_errno)) {
            LOG_DEBUG("Could not start %s: %s", argv[0], strerror(child_errno));
            result = MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_SPAWN_FAILED);
        }
    }

    if (shield) {
        sigaction(SIGINT, &old_int, nullptr);
        sigaction(SIGQUIT, &old_quit, nullptr);
    }

    if (SUCCEEDED(result) && exit_status)
        *exit_status = decode_wait_status(status);

    return result;
}

RESULT capture_program_output(const char *const argv[], char *output[]) {
    autoclose_fd int read_fd = -1;
    autoclose_fd int write_fd = -1;
    char buffer[BUFFER_SIZE] = {};
    size_t used = 0;
    int status = 0;
    pid_t pid;

    *output = nullptr;

    if (!argv || !argv[0])
        return MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, E_INVALID_ARG);

    int out_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0)
        return result_from_errno();
    read_fd = out_pipe[0];
    write_fd = out_pipe[1];

    fflush(stdout);
    fflush(stderr);

    pid = fork();
    if (pid < 0)
        return result_from_errno();

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0)
            dup2(devnull, STDIN_FILENO);
        dup2(write_fd, STDOUT_FILENO);
        dup2(write_fd, STDERR_FILENO);
        execv(argv[0], (char *const *)argv);
        _exit(127);
    }

    close(write_fd);
    write_fd = -1;

    bool truncated = false;
    for (;;) {
        ssize_t got = read(read_fd, buffer + used, sizeof(buffer) - 1 - used);
        if (got < 0 && errno == EINTR)
            continue;
        if (got <= 0)
            break;
        used += (size_t)got;
        if (used == sizeof(buffer) - 1) {
            truncated = true;
            break;
        }
    }

    /* Stop the child from blocking on a full pipe if it had more to say */
    close(read_fd);
    read_fd = -1;

    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            return result_from_errno();
    }

    buffer[used] = '\0';
    char *newline = strpbrk(buffer, "\r\n");
    if (newline)
        *newline = '\0';

    /* Closing the pipe early kills a chatty child with SIGPIPE, the first line is still complete then */
    bool cut_off = truncated && newline && WIFSIGNALED(status) && WTERMSIG(status) == SIGPIPE;

    int code = decode_wait_status(status);
    if (code != 0 && !cut_off) {
        LOG_DEBUG("%s exited with status %d", argv[0], code);
        return MAKE_RESULT(SEV_ERROR, CAT_LAUNCH, code == 127 ? E_SPAWN_FAILED : E_UNKNOWN);
    }

    *output = strdup(buffer);
    if (!*output)
        return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, E_OUT_OF_MEMORY);

    return RESULT_OK;
}
