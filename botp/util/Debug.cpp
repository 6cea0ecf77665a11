/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Debug.hpp"
#include "FileIO.hpp"
#include "../Context.hpp"
#include <stdarg.h>
#include <stdio.h>
#include <time.h>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

namespace botp {

#define MAX_LOG_SIZE (1 << 19) // Max size 512 KiB

static std::mutex gDebugMutex;
static FILE *gLogFile = nullptr;
static std::string gLogDir;

static std::string
debugLogPath()
{
    return gLogDir + "botp.log";
}

static std::string
debugLogOldPath()
{
    return gLogDir + "botp-prev.log";
}

static Status
debugLogRotate()
{
    if (gLogFile)
    {
        fclose(gLogFile);
        gLogFile = nullptr;
    }

    auto path = debugLogPath();
    if (fileExists(path))
        rename(path.c_str(), debugLogOldPath().c_str());

    gLogFile = fopen(path.c_str(), "w");
    if (!gLogFile)
        return BOTP_ERROR(BOTP_CC_SysError, "Cannot open " + path);

    return Status();
}

Status
debugInitialize()
{
    if (!gContext)
        return BOTP_ERROR(BOTP_CC_NotInitialized, "No context for the log file");

    std::lock_guard<std::mutex> lock(gDebugMutex);
    gLogDir = gContext->rootDir();
    BOTP_CHECK(debugLogRotate());

    return Status();
}

void
debugTerminate()
{
    std::lock_guard<std::mutex> lock(gDebugMutex);
    if (gLogFile)
    {
        fclose(gLogFile);
        gLogFile = nullptr;
    }
}

DataChunk
debugLogLoad()
{
    std::string dir;
    {
        std::lock_guard<std::mutex> lock(gDebugMutex);
        if (gLogFile)
            fflush(gLogFile);
        dir = gLogDir;
    }

    // A missing previous log is normal, so don't report it:
    DataChunk out1;
    if (fileExists(dir + "botp-prev.log"))
        fileLoad(out1, dir + "botp-prev.log").log();

    DataChunk out2;
    fileLoad(out2, dir + "botp.log").log();

    return buildData({out1, out2});
}

void BOTP_DebugLog(const char *format, ...)
{
    time_t t = time(nullptr);
    struct tm utc;
    gmtime_r(&t, &utc);

    std::stringstream date;
    date << std::setfill('0');
    date << std::setw(4) << utc.tm_year + 1900 << '-';
    date << std::setw(2) << utc.tm_mon + 1 << '-';
    date << std::setw(2) << utc.tm_mday << ' ';
    date << std::setw(2) << utc.tm_hour << ':';
    date << std::setw(2) << utc.tm_min << ':';
    date << std::setw(2) << utc.tm_sec << " BOTP_Log: ";

    // Get the message length:
    va_list args;
    va_start(args, format);
    char temp[1];
    int size = vsnprintf(temp, sizeof(temp), format, args);
    va_end(args);
    if (size < 0)
        return;

    // Format the message:
    va_start(args, format);
    std::vector<char> message(size + 1);
    vsnprintf(message.data(), message.size(), format, args);
    va_end(args);

    // Put the pieces together:
    std::string out = date.str();
    out.append(message.begin(), message.end() - 1);
    if (out.back() != '\n')
        out.append(1, '\n');

#ifdef DEBUG
    printf("%s", out.c_str());
#endif

    std::lock_guard<std::mutex> lock(gDebugMutex);
    if (gLogFile && MAX_LOG_SIZE < ftell(gLogFile))
    {
        // Logging the failure would re-enter the mutex:
        if (!debugLogRotate())
            return;
    }

    if (gLogFile)
    {
        fwrite(out.c_str(), 1, out.size(), gLogFile);
        fflush(gLogFile);
    }
}

} // namespace botp
