/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef BOTP_CRYPTO_KEYEDHASH_HPP
#define BOTP_CRYPTO_KEYEDHASH_HPP

#include "../util/Data.hpp"
#include "../../src/BOTP.h"

namespace botp {

#define HASH_DIGEST_LENGTH 32

typedef DataArray<BOTP_SECRET_LENGTH> SecretKey;
typedef DataArray<HASH_DIGEST_LENGTH> HashDigest;

/**
 * Computes the BLAKE3 keyed hash of the message.
 * Every code ever generated depends on this exact primitive,
 * so it must never change.
 */
HashDigest
keyedHash(const SecretKey &key, DataSlice message);

} // namespace botp

#endif
