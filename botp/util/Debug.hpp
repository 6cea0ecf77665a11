/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef BOTP_UTIL_DEBUG_HPP
#define BOTP_UTIL_DEBUG_HPP

#include "Status.hpp"
#include "Data.hpp"

#define DEBUG_LEVEL 1

#define BOTP_DebugLevel(level, ...) \
{                                   \
    if (DEBUG_LEVEL >= level)       \
    {                               \
        BOTP_DebugLog(__VA_ARGS__); \
    }                               \
}

namespace botp {

/**
 * Opens the log file in the context's root directory,
 * moving any previous log out of the way.
 */
Status
debugInitialize();

void
debugTerminate();

/**
 * Returns the contents of the previous and current log files.
 */
DataChunk
debugLogLoad();

void BOTP_DebugLog(const char *format, ...);

} // namespace botp

#endif
