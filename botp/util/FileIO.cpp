/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "FileIO.hpp"
#include <stdio.h>
#include <unistd.h>

namespace botp {

std::recursive_mutex gFileMutex;

std::string
fileSlashify(const std::string &path)
{
    std::string out = path;
    if (out.empty() || '/' != out.back())
        out += '/';
    return out;
}

bool
fileExists(const std::string &path)
{
    AutoFileLock lock(gFileMutex);

    return 0 == access(path.c_str(), F_OK);
}

Status
fileLoad(DataChunk &result, const std::string &path)
{
    AutoFileLock lock(gFileMutex);

    FILE *fp = fopen(path.c_str(), "rb");
    if (!fp)
        return BOTP_ERROR(BOTP_CC_FileOpenError, "Cannot open for reading: " + path);

    fseek(fp, 0, SEEK_END);
    long end = ftell(fp);
    fseek(fp, 0, SEEK_SET);
    if (end < 0)
    {
        fclose(fp);
        return BOTP_ERROR(BOTP_CC_FileReadError, "Cannot size file: " + path);
    }

    size_t size = end;
    result.resize(size);
    if (fread(result.data(), 1, size, fp) != size)
    {
        fclose(fp);
        return BOTP_ERROR(BOTP_CC_FileReadError, "Cannot read file: " + path);
    }

    fclose(fp);
    return Status();
}

} // namespace botp
