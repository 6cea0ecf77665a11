/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * BOTP public API. Applications only call functions found in this file.
 */

#ifndef BOTP_h
#define BOTP_h

#include <stdbool.h>
#include <stdint.h>

/** The maximum buffer length for default strings in the system */
#define BOTP_MAX_STRING_LENGTH 256

/** Secret keys are always this many bytes long. */
#define BOTP_SECRET_LENGTH 32

/** Generated codes are always this many decimal digits long. */
#define BOTP_CODE_DIGITS 11

/** The default time step, in seconds. */
#define BOTP_DEFAULT_INTERVAL 30

#ifdef __cplusplus
extern "C" {
#endif

/**
 * BOTP Condition Codes
 *
 * All BOTP functions return this code.
 * BOTP_CC_Ok indicates that there was no issue.
 * All other values indicate some issue.
 */
typedef enum eBOTP_CC
{
    /** The function completed without an error */
    BOTP_CC_Ok = 0,
    /** An error occured */
    BOTP_CC_Error = 1,
    /** Unexpected NULL pointer */
    BOTP_CC_NULLPtr = 2,
    /** The current time lies before the configured epoch */
    BOTP_CC_TimeError = 3,
    /** The entropy source could not supply enough bytes */
    BOTP_CC_RandomBytesError = 4,
    /** The time step interval must be at least one second */
    BOTP_CC_InvalidInterval = 5,
    /** Could not parse the given text */
    BOTP_CC_ParseError = 6,
    /** A system function failed */
    BOTP_CC_SysError = 7,
    /** Could not open the file */
    BOTP_CC_FileOpenError = 8,
    /** Could not read from the file */
    BOTP_CC_FileReadError = 9,
    /** The library has not been initialized */
    BOTP_CC_NotInitialized = 10,
    /** The library has already been initialized */
    BOTP_CC_Reinitialization = 11
} tBOTP_CC;

/**
 * BOTP Error Structure
 *
 * This structure contains the detailed information associated
 * with an error.
 * Every BOTP function that can fail accepts a pointer to this
 * structure, which it fills out in the event of error.
 */
typedef struct sBOTP_Error
{
    /** The condition code code */
    tBOTP_CC code;
    /** String containing a description of the error */
    char szDescription[BOTP_MAX_STRING_LENGTH + 1];
    /** String containing the function in which the error occurred */
    char szSourceFunc[BOTP_MAX_STRING_LENGTH + 1];
    /** String containing the source file in which the error occurred */
    char szSourceFile[BOTP_MAX_STRING_LENGTH + 1];
    /** Line number in the source file in which the error occurred */
    int  nSourceLine;
} tBOTP_Error;

/* === Library lifetime: === */
tBOTP_CC BOTP_Initialize(const char     *szRootDir,
                         uint64_t       interval,
                         int64_t        epoch,
                         bool           bDiagnostics,
                         tBOTP_Error    *pError);

void BOTP_Terminate();

void BOTP_Log(const char *szMessage);

/* === Secrets: === */
tBOTP_CC BOTP_GenerateSecret(unsigned char *pSecret,
                             tBOTP_Error *pError);

/* === Codes: === */
tBOTP_CC BOTP_GetCounter(uint64_t interval,
                         int64_t epoch,
                         uint64_t *pCounter,
                         tBOTP_Error *pError);

tBOTP_CC BOTP_GenerateCode(uint64_t counter,
                           const unsigned char *pSecret,
                           uint64_t *pCode,
                           tBOTP_Error *pError);

tBOTP_CC BOTP_GenerateCodeString(uint64_t counter,
                                 const unsigned char *pSecret,
                                 char szCode[BOTP_CODE_DIGITS + 1],
                                 tBOTP_Error *pError);

tBOTP_CC BOTP_GenerateTotp(const unsigned char *pSecret,
                           char szCode[BOTP_CODE_DIGITS + 1],
                           tBOTP_Error *pError);

#ifdef __cplusplus
}
#endif

#endif
