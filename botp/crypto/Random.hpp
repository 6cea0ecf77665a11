/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef BOTP_CRYPTO_RANDOM_HPP
#define BOTP_CRYPTO_RANDOM_HPP

#include "KeyedHash.hpp"
#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace botp {

/**
 * Fills a buffer with bytes from the system CSPRNG.
 * On failure the buffer is wiped, never left partially filled.
 */
Status
randomFill(uint8_t *data, size_t size);

/**
 * Creates a buffer of random data.
 */
Status
randomData(DataChunk &result, size_t size);

/**
 * Creates a fresh secret key.
 */
Status
randomSecret(SecretKey &result);

} // namespace botp

#endif
