/*
 * Error handling subsystem implementation
 *
 * Copyright (C) 2025 William Horvath
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA 02110-1301, USA
 */

#include <cerrno>

#include "result.hpp"

RESULT result_from_errno(void) {
    int code;

    switch (errno) {
    case 0:
        return RESULT_OK;
    case ENOENT:
        code = E_FILE_NOT_FOUND;
        break;
    case EACCES:
    case EPERM:
        code = E_ACCESS_DENIED;
        break;
    case EEXIST:
        code = E_ALREADY_EXISTS;
        break;
    case ENOMEM:
        code = E_OUT_OF_MEMORY;
        break;
    case EINVAL:
    case ENAMETOOLONG:
        code = E_INVALID_ARG;
        break;
    case ENOTDIR:
        code = E_NOT_DIR;
        break;
    case ENOSPC:
    case EDQUOT:
        code = E_NO_SPACE;
        break;
    case EROFS:
        code = E_READ_ONLY;
        break;
    case EBUSY:
        code = E_BUSY;
        break;
    case ETIMEDOUT:
        code = E_TIMEOUT;
        break;
    case ENOSYS:
    case EOPNOTSUPP:
        code = E_NOT_SUPPORTED;
        break;
    case EINTR:
        code = E_CANCELED;
        break;
    case EIO:
        code = E_IO_ERROR;
        break;
    default:
        code = E_UNKNOWN;
        break;
    }

    return MAKE_RESULT(SEV_ERROR, CAT_SYSTEM, code);
}

const char *result_to_string(RESULT result) {
    if (result == RESULT_OK)
        return "Success";

    switch (RESULT_CODE(result)) {
    case E_UNKNOWN:
        return "Unknown error";
    case E_INVALID_ARG:
        return "Invalid argument";
    case E_OUT_OF_MEMORY:
        return "Out of memory";
    case E_FILE_NOT_FOUND:
        return "File not found";
    case E_ACCESS_DENIED:
        return "Access denied";
    case E_ALREADY_EXISTS:
        return "Already exists";
    case E_NOT_SUPPORTED:
        return "Not supported";
    case E_IO_ERROR:
        return "I/O error";
    case E_TIMEOUT:
        return "Timed out";
    case E_NOT_READY:
        return "Not ready";
    case E_NOT_FOUND:
        return "Not found";
    case E_CANCELED:
        return "Canceled";
    case E_BUSY:
        return "Resource busy";
    case E_PARSE_ERROR:
        return "Parse error";
    case E_NOT_DIR:
        return "Not a directory";
    case E_NO_SPACE:
        return "No space left on device";
    case E_READ_ONLY:
        return "Read-only filesystem";
    case E_RUNTIME_MISSING:
        return "Runtime not found";
    case E_WRONG_DIRECTORY:
        return "Wrong working directory";
    case E_MANIFEST_MISSING:
        return "Dependency manifest missing";
    case E_PARTIAL:
        return "Completed with warnings";
    case E_SPAWN_FAILED:
        return "Could not start process";
    default:
        return "Unrecognized result";
    }
}
