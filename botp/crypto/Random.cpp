/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Random.hpp"
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <limits.h>

namespace botp {

Status
randomFill(uint8_t *data, size_t size)
{
    if (!size)
        return Status();
    if (INT_MAX < size)
        return BOTP_ERROR(BOTP_CC_RandomBytesError, "Random request too large");

    if (1 != RAND_bytes(data, static_cast<int>(size)))
    {
        OPENSSL_cleanse(data, size);
        ERR_clear_error();
        return BOTP_ERROR(BOTP_CC_RandomBytesError,
            "Random data generation failed");
    }

    return Status();
}

Status
randomData(DataChunk &result, size_t size)
{
    DataChunk out(size);
    BOTP_CHECK(randomFill(out.data(), out.size()));

    result = std::move(out);
    return Status();
}

Status
randomSecret(SecretKey &result)
{
    SecretKey out;
    Status s = randomFill(out.data(), out.size());
    if (s)
        result = out;

    OPENSSL_cleanse(out.data(), out.size());
    return s;
}

} // namespace botp
