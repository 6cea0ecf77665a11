/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "KeyedHash.hpp"
#include <blake3.h>
#include <openssl/crypto.h>

namespace botp {

static_assert(BLAKE3_KEY_LEN == BOTP_SECRET_LENGTH, "Key size mismatch");
static_assert(BLAKE3_OUT_LEN == HASH_DIGEST_LENGTH, "Digest size mismatch");

HashDigest
keyedHash(const SecretKey &key, DataSlice message)
{
    blake3_hasher hasher;
    blake3_hasher_init_keyed(&hasher, key.data());
    blake3_hasher_update(&hasher, message.data(), message.size());

    HashDigest out;
    blake3_hasher_finalize(&hasher, out.data(), out.size());

    // The hasher state holds the key words:
    OPENSSL_cleanse(&hasher, sizeof(hasher));
    return out;
}

} // namespace botp
