/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#ifndef BOTP_UTIL_STATUS_HPP
#define BOTP_UTIL_STATUS_HPP

// We need tBOTP_CC and tBOTP_Error:
#include "../../src/BOTP.h"
#include <ostream>
#include <string>

namespace botp {

/**
 * Describes the results of calling a core function,
 * which can be either success or failure.
 */
class Status
{
public:
    /**
     * Constructs a success status.
     */
    Status();

    /**
     * Constructs an error status.
     */
    Status(tBOTP_CC value, std::string message,
        const char *file, const char *function, size_t line);

    // Read accessors:
    tBOTP_CC value()            const { return value_; }
    std::string message()       const { return message_; }
    std::string file()          const { return file_; }
    std::string function()      const { return function_; }
    size_t line()               const { return line_; }

    /**
     * Returns true if the status code represents success.
     */
    explicit operator bool() const { return value_ == BOTP_CC_Ok; }

    /**
     * Writes the status to the debug log if it represents an error.
     */
    const Status &log() const;

    /**
     * Unpacks this status into a tBOTP_Error structure.
     */
    void toError(tBOTP_Error &error) const;

private:
    // Error information:
    tBOTP_CC value_;
    std::string message_;

    // Error location:
    const char *file_;
    const char *function_;
    size_t line_;
};

std::ostream &operator<<(std::ostream &output, const Status &s);

/**
 * Constructs an error status using the current source location.
 */
#define BOTP_ERROR(value, message) \
    Status(value, message, __FILE__, __FUNCTION__, __LINE__)

/**
 * Checks a status code, and returns if it represents an error.
 */
#define BOTP_CHECK(f) \
    do { \
        Status s = (f); \
        if (!s) return s; \
    } while (false)

/**
 * Use when a C API function calls a botp::Status function.
 */
#define BOTP_CHECK_NEW(f) \
    do { \
        Status s = (f); \
        if (!s) { \
            if (pError) s.toError(*pError); \
            cc = s.value(); \
            goto exit; \
        } \
    } while (false)

} // namespace botp

#endif
