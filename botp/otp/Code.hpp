/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef BOTP_OTP_CODE_HPP
#define BOTP_OTP_CODE_HPP

#include "Truncate.hpp"
#include <string>

namespace botp {

/**
 * Serializes a counter as 8 bytes, most-significant first.
 */
DataArray<8>
counterBytes(uint64_t counter);

/**
 * Produces the code for a counter, in [0, 10^11).
 */
uint64_t
otpCode(uint64_t counter, const SecretKey &secret,
    const TruncationSink &sink=TruncationSink());

/**
 * Formats a code as a fixed-width, zero-padded decimal number.
 */
std::string
formatCode(uint64_t code);

std::string
otpCodeString(uint64_t counter, const SecretKey &secret,
    const TruncationSink &sink=TruncationSink());

} // namespace botp

#endif
