/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "BOTP.h"
#include "../botp/Context.hpp"
#include "../botp/crypto/KeyedHash.hpp"
#include "../botp/crypto/Random.hpp"
#include "../botp/otp/Code.hpp"
#include "../botp/otp/Counter.hpp"
#include "../botp/util/Debug.hpp"
#include "../botp/util/Util.hpp"
#include <openssl/crypto.h>
#include <string.h>

using namespace botp;

#define BOTP_PROLOG() \
    tBOTP_CC cc = BOTP_CC_Ok; \
    BOTP_SET_ERR_CODE(pError, BOTP_CC_Ok);

#define BOTP_PROLOG_CONTEXT() \
    BOTP_PROLOG(); \
    BOTP_CHECK_ASSERT(gContext, BOTP_CC_NotInitialized, "The library has not been initialized")

static SecretKey
secretFromPtr(const unsigned char *pSecret)
{
    SecretKey out;
    memcpy(out.data(), pSecret, out.size());
    return out;
}

static TruncationSink
contextSink()
{
    if (gContext && gContext->diagnostics())
        return truncationLogSink();
    return TruncationSink();
}

/**
 * Initialize the BOTP library.
 *
 * This function must be called before BOTP_GenerateTotp,
 * and sets up the log file in the given directory.
 *
 * @param szRootDir     Directory for the log files
 * @param interval      Default time step, in seconds
 * @param epoch         Default reference time, in Unix seconds
 * @param bDiagnostics  Send intermediate truncation values to the log
 */
tBOTP_CC BOTP_Initialize(const char     *szRootDir,
                         uint64_t       interval,
                         int64_t        epoch,
                         bool           bDiagnostics,
                         tBOTP_Error    *pError)
{
    BOTP_PROLOG();
    BOTP_CHECK_ASSERT(!gContext, BOTP_CC_Reinitialization,
                      "The library has already been initialized");
    BOTP_CHECK_NULL(szRootDir);
    BOTP_CHECK_ASSERT(interval, BOTP_CC_InvalidInterval,
                      "The time step interval cannot be zero");

    {
        Clock::time_point epochTime;
        BOTP_CHECK_NEW(epochFromUnix(epochTime, epoch));

        TimeStep step(interval, epochTime);
        gContext.reset(new Context(szRootDir, step, bDiagnostics));

        // initialize logging
        Status status = debugInitialize();
        if (!status)
            gContext.reset();
        BOTP_CHECK_NEW(status);
        BOTP_DebugLog("%s called", __FUNCTION__);
    }

exit:
    return cc;
}

/**
 * Mark the end of use of the BOTP library.
 *
 * This function is the counter to BOTP_Initialize.
 */
void BOTP_Terminate()
{
    if (gContext)
    {
        gContext.reset();
        debugTerminate();
    }
}

void BOTP_Log(const char *szMessage)
{
    BOTP_DebugLog("%s", szMessage);
}

/**
 * Creates a fresh 32-byte secret.
 *
 * @param pSecret   Buffer of BOTP_SECRET_LENGTH bytes to receive the secret.
 *                  Left zeroed if generation fails.
 */
tBOTP_CC BOTP_GenerateSecret(unsigned char *pSecret,
                             tBOTP_Error *pError)
{
    BOTP_PROLOG();
    BOTP_CHECK_NULL(pSecret);

    {
        SecretKey key;
        Status status = randomSecret(key);
        if (status)
            memcpy(pSecret, key.data(), key.size());
        else
            memset(pSecret, 0, BOTP_SECRET_LENGTH);
        OPENSSL_cleanse(key.data(), key.size());
        BOTP_CHECK_NEW(status);
    }

exit:
    return cc;
}

/**
 * Computes the current step counter.
 *
 * @param interval  Step length, in seconds
 * @param epoch     Reference time, in Unix seconds
 */
tBOTP_CC BOTP_GetCounter(uint64_t interval,
                         int64_t epoch,
                         uint64_t *pCounter,
                         tBOTP_Error *pError)
{
    BOTP_PROLOG();
    BOTP_CHECK_NULL(pCounter);
    BOTP_CHECK_ASSERT(interval, BOTP_CC_InvalidInterval,
                      "The time step interval cannot be zero");

    {
        Clock::time_point epochTime;
        BOTP_CHECK_NEW(epochFromUnix(epochTime, epoch));
        BOTP_CHECK_NEW(otpCounter(*pCounter, interval, epochTime));
    }

exit:
    return cc;
}

tBOTP_CC BOTP_GenerateCode(uint64_t counter,
                           const unsigned char *pSecret,
                           uint64_t *pCode,
                           tBOTP_Error *pError)
{
    BOTP_PROLOG();
    BOTP_CHECK_NULL(pSecret);
    BOTP_CHECK_NULL(pCode);

    {
        SecretKey key = secretFromPtr(pSecret);
        *pCode = otpCode(counter, key, contextSink());
        OPENSSL_cleanse(key.data(), key.size());
    }

exit:
    return cc;
}

/**
 * Produces the zero-padded decimal form of a code.
 *
 * @param szCode    Buffer of BOTP_CODE_DIGITS + 1 characters.
 */
tBOTP_CC BOTP_GenerateCodeString(uint64_t counter,
                                 const unsigned char *pSecret,
                                 char szCode[BOTP_CODE_DIGITS + 1],
                                 tBOTP_Error *pError)
{
    BOTP_PROLOG();
    BOTP_CHECK_NULL(pSecret);
    BOTP_CHECK_NULL(szCode);

    {
        SecretKey key = secretFromPtr(pSecret);
        std::string code = otpCodeString(counter, key, contextSink());
        OPENSSL_cleanse(key.data(), key.size());
        memcpy(szCode, code.c_str(), BOTP_CODE_DIGITS + 1);
    }

exit:
    return cc;
}

/**
 * Produces the code for the current time,
 * using the time step given to BOTP_Initialize.
 */
tBOTP_CC BOTP_GenerateTotp(const unsigned char *pSecret,
                           char szCode[BOTP_CODE_DIGITS + 1],
                           tBOTP_Error *pError)
{
    BOTP_PROLOG_CONTEXT();
    BOTP_CHECK_NULL(pSecret);
    BOTP_CHECK_NULL(szCode);

    {
        uint64_t counter;
        BOTP_CHECK_NEW(otpCounter(counter, gContext->timeStep()));

        SecretKey key = secretFromPtr(pSecret);
        std::string code = otpCodeString(counter, key, contextSink());
        OPENSSL_cleanse(key.data(), key.size());
        memcpy(szCode, code.c_str(), BOTP_CODE_DIGITS + 1);
    }

exit:
    return cc;
}
