/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Error-handling macros for the C API boundary.
 * These expect `tBOTP_CC cc`, `tBOTP_Error *pError`,
 * and an `exit:` label in the calling function.
 */

#ifndef BOTP_UTIL_UTIL_HPP
#define BOTP_UTIL_UTIL_HPP

#include "../../src/BOTP.h"
#include "Debug.hpp"
#include <string.h>

namespace botp {

#define BOTP_LOG_ERROR(code, err_string) \
    { \
        BOTP_DebugLog("Error: %s, code: %d, func: %s, source: %s, line: %d", err_string, code, __FUNCTION__, __FILE__, __LINE__); \
    }

#define BOTP_SET_ERR_CODE(err, set_code) \
    if (err != NULL) { \
        err->code = set_code; \
    }

#define BOTP_RET_ERROR(err, desc) \
    { \
        if (pError) \
        { \
            pError->code = err; \
            strncpy(pError->szDescription, desc, BOTP_MAX_STRING_LENGTH); \
            strncpy(pError->szSourceFunc, __FUNCTION__, BOTP_MAX_STRING_LENGTH); \
            strncpy(pError->szSourceFile, __FILE__, BOTP_MAX_STRING_LENGTH); \
            pError->szDescription[BOTP_MAX_STRING_LENGTH] = 0; \
            pError->szSourceFunc[BOTP_MAX_STRING_LENGTH] = 0; \
            pError->szSourceFile[BOTP_MAX_STRING_LENGTH] = 0; \
            pError->nSourceLine = __LINE__; \
        } \
        cc = err; \
        BOTP_LOG_ERROR(cc, desc); \
        goto exit; \
    }

#define BOTP_CHECK_ASSERT(assert, err, desc) \
    { \
        if (!(assert)) \
        { \
            BOTP_RET_ERROR(err, desc); \
        } \
    } \

#define BOTP_CHECK_NULL(arg) \
    { \
        BOTP_CHECK_ASSERT(arg != NULL, BOTP_CC_NULLPtr, "NULL pointer"); \
    } \

} // namespace botp

#endif
