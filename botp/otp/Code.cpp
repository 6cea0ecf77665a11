/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Code.hpp"
#include <sstream>

namespace botp {

DataArray<8>
counterBytes(uint64_t counter)
{
    DataArray<8> out =
    {{
        static_cast<uint8_t>(counter >> 56),
        static_cast<uint8_t>(counter >> 48),
        static_cast<uint8_t>(counter >> 40),
        static_cast<uint8_t>(counter >> 32),
        static_cast<uint8_t>(counter >> 24),
        static_cast<uint8_t>(counter >> 16),
        static_cast<uint8_t>(counter >> 8),
        static_cast<uint8_t>(counter)
    }};
    return out;
}

uint64_t
otpCode(uint64_t counter, const SecretKey &secret,
    const TruncationSink &sink)
{
    return truncate(keyedHash(secret, counterBytes(counter)), sink);
}

std::string
formatCode(uint64_t code)
{
    std::stringstream ss;
    ss.width(BOTP_CODE_DIGITS);
    ss.fill('0');
    ss << code % CODE_MODULUS;
    return ss.str();
}

std::string
otpCodeString(uint64_t counter, const SecretKey &secret,
    const TruncationSink &sink)
{
    return formatCode(otpCode(counter, secret, sink));
}

} // namespace botp
