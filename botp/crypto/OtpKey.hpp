/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef BOTP_CRYPTO_OTPKEY_HPP
#define BOTP_CRYPTO_OTPKEY_HPP

#include "KeyedHash.hpp"
#include "../otp/Counter.hpp"
#include "../otp/Truncate.hpp"
#include "../util/Status.hpp"

namespace botp {

/**
 * Holds a secret key and produces 11-digit BLAKE3 one-time codes.
 * The key is wiped when the object goes away.
 */
class OtpKey
{
public:
    OtpKey();
    OtpKey(const SecretKey &key);
    OtpKey(const OtpKey &copy);
    OtpKey &operator=(const OtpKey &copy);
    ~OtpKey();

    /**
     * Initializes the key with random data.
     */
    Status
    create();

    /**
     * Initializes the key with a base32-encoded string.
     */
    Status
    decodeBase32(const std::string &key);

    /**
     * Initializes the key with a hex string.
     */
    Status
    decodeBase16(const std::string &key);

    /**
     * Produces the numeric code for a counter.
     */
    uint64_t
    code(uint64_t counter, const TruncationSink &sink=TruncationSink()) const;

    /**
     * Produces a counter-based password.
     */
    std::string
    hotp(uint64_t counter) const;

    /**
     * Produces a time-based password.
     */
    Status
    totp(std::string &result, const TimeStep &step=TimeStep()) const;

    /**
     * Encodes the key as a base32 string.
     */
    std::string
    encodeBase32() const;

    std::string
    encodeBase16() const;

    /**
     * Obtains access to the underlying binary key.
     */
    const SecretKey &
    key() const { return key_; }

private:
    SecretKey key_;

    Status
    load(const DataChunk &data);
};

} // namespace botp

#endif
