/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Filesystem access functions
 */

#ifndef BOTP_UTIL_FILEIO_HPP
#define BOTP_UTIL_FILEIO_HPP

#include "Data.hpp"
#include "Status.hpp"
#include <mutex>

namespace botp {

extern std::recursive_mutex gFileMutex;
typedef std::lock_guard<std::recursive_mutex> AutoFileLock;

/**
 * Puts a slash on the end of a filename (if necessary).
 */
std::string
fileSlashify(const std::string &path);

/**
 * Returns true if the path exists.
 */
bool
fileExists(const std::string &path);

/**
 * Reads a file from disk.
 */
Status
fileLoad(DataChunk &result, const std::string &path);

} // namespace botp

#endif
