/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OtpKey.hpp"
#include "Encoding.hpp"
#include "Random.hpp"
#include "../otp/Code.hpp"
#include <openssl/crypto.h>
#include <algorithm>

namespace botp {

OtpKey::OtpKey()
{
    key_.fill(0);
}

OtpKey::OtpKey(const SecretKey &key):
    key_(key)
{
}

OtpKey::OtpKey(const OtpKey &copy):
    key_(copy.key_)
{
}

OtpKey &
OtpKey::operator=(const OtpKey &copy)
{
    key_ = copy.key_;
    return *this;
}

OtpKey::~OtpKey()
{
    OPENSSL_cleanse(key_.data(), key_.size());
}

Status
OtpKey::create()
{
    BOTP_CHECK(randomSecret(key_));
    return Status();
}

Status
OtpKey::decodeBase32(const std::string &key)
{
    DataChunk data;
    BOTP_CHECK(base32Decode(data, key));
    Status s = load(data);
    OPENSSL_cleanse(data.data(), data.size());
    return s;
}

Status
OtpKey::decodeBase16(const std::string &key)
{
    DataChunk data;
    BOTP_CHECK(base16Decode(data, key));
    Status s = load(data);
    OPENSSL_cleanse(data.data(), data.size());
    return s;
}

uint64_t
OtpKey::code(uint64_t counter, const TruncationSink &sink) const
{
    return otpCode(counter, key_, sink);
}

std::string
OtpKey::hotp(uint64_t counter) const
{
    return formatCode(code(counter));
}

Status
OtpKey::totp(std::string &result, const TimeStep &step) const
{
    uint64_t counter;
    BOTP_CHECK(otpCounter(counter, step));

    result = hotp(counter);
    return Status();
}

std::string
OtpKey::encodeBase32() const
{
    return base32Encode(key_);
}

std::string
OtpKey::encodeBase16() const
{
    return base16Encode(key_);
}

Status
OtpKey::load(const DataChunk &data)
{
    if (data.size() != key_.size())
        return BOTP_ERROR(BOTP_CC_ParseError, "Secret keys must be 32 bytes");

    std::copy(data.begin(), data.end(), key_.begin());
    return Status();
}

} // namespace botp
