/*
 * Common miscellaneous macros/routines
 *
 * Copyright (C) 2025 William Horvath
 *
 * SPDX-License-Identifier: GPL-2.0-only
 * See the full license text in the repository LICENSE file.
 */

#pragma once

#include <cstdio>
#include <cstdlib>
#include <unistd.h>

#define forceinline __attribute__((always_inline)) inline

#ifndef ARRAY_SIZE
#define ARRAY_SIZE(arr) (sizeof(arr) / sizeof((arr)[0]))
#endif

/* Cleanup function for pointers allocated with malloc/strdup/etc. */
static forceinline void cleanup_pointer(void *p) {
    void **pp = (void **)p;
    free(*pp);
    *pp = nullptr;
}

/* Cleanup function for FILE pointers */
static forceinline void cleanup_file(void *p) {
    FILE **fp = (FILE **)p;
    if (fp && *fp) {
        fclose(*fp);
        *fp = nullptr;
    }
}

/* Cleanup function for raw file descriptors (-1 = nothing to close) */
static forceinline void cleanup_fd(void *p) {
    int *fd = (int *)p;
    if (fd && *fd >= 0) {
        close(*fd);
        *fd = -1;
    }
}

#define autofree [[gnu::cleanup(cleanup_pointer)]]
#define autoclose [[gnu::cleanup(cleanup_file)]]
#define autoclose_fd [[gnu::cleanup(cleanup_fd)]]

#if defined(__clang__)
#define nonnull_charp [[gnu::nonnull]] const char *_Nonnull
#else
/* gcc has no _Nonnull qualifier */
#define nonnull_charp const char *
#endif
