/*
 * Logging subsystem
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <cstdint>
#include <unistd.h>

#include "result.hpp"

enum class Level : uint8_t {
    None = 0,
    System = 1,  /* Always shown on the console, also sent as a desktop notification */
    Error = 2,   /* Critical errors that prevent proper operation */
    Warning = 3, /* Non-critical issues that might affect behavior */
    Info = 4,    /* Normal operational information */
    Debug = 5,   /* Detailed information for troubleshooting */
};

/* Initialize the logging subsystem from CLIPBOOT_LOG_LEVEL and CLIPBOOT_LOG_FILE.
 * Console output stays off until this is called. */
RESULT log_init(void);

/* Cleanup logging resources */
void log_cleanup(void);

/* Set the maximum log level to display */
void log_set_level(Level level);

/* Get the current log level */
Level log_get_level(void);

/* Basically isatty() */
bool log_get_terminal_output(void);

/* Turn console output on or off without going through log_init() */
void log_set_console_output(bool enabled);

/* Core logging function (for internal use) */
void _log_message(Level level, const char *file, int line, const char *format, ...)
    __attribute__((format(printf, 4, 5)));

/* Same as _log_message(), but the console line always goes to stdout
 * Used for the bootstrap status lines (check passed, failed or advisory), which belong
 * on stdout at every level (for internal use) */
void _log_status(Level level, const char *file, int line, const char *format, ...)
    __attribute__((format(printf, 4, 5)));

/* Core function for logging RESULT values with context */
void _log_result(Level level, const char *file, int line, RESULT result, const char *context);

/* Convenience macros that include file and line information */
#define LOG_SYSTEM(...) _log_message(Level::System, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_ERROR(...) _log_message(Level::Error, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_WARNING(...) _log_message(Level::Warning, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_INFO(...) _log_message(Level::Info, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_DEBUG(...) _log_message(Level::Debug, __FILE__, __LINE__, __VA_ARGS__)

#define LOG_STATUS_ERROR(...) _log_status(Level::Error, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_STATUS_WARNING(...) _log_status(Level::Warning, __FILE__, __LINE__, __VA_ARGS__)
#define LOG_STATUS_INFO(...) _log_status(Level::Info, __FILE__, __LINE__, __VA_ARGS__)

#define LOG_RESULT(level, result, context) _log_result(level, __FILE__, __LINE__, result, context)
#define LOG_DEBUG_RESULT(result, context) _log_result(Level::Debug, __FILE__, __LINE__, result, context)
