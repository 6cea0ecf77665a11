/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Reduces a keyed-hash digest to a bounded decimal code.
 *
 * The digest's last byte, modulo 28, picks where an 8-byte window starts.
 * The window wraps past the end of the digest back to byte 0, so offsets
 * above 24 read from both ends. The window's top bit is cleared, and the
 * resulting 63-bit value is reduced modulo 10^11.
 */

#ifndef BOTP_OTP_TRUNCATE_HPP
#define BOTP_OTP_TRUNCATE_HPP

#include "../crypto/KeyedHash.hpp"
#include <functional>

namespace botp {

#define TRUNCATE_OFFSET_MODULUS 28
#define TRUNCATE_WINDOW_SIZE 8
#define CODE_MODULUS UINT64_C(100000000000)

/**
 * The intermediate values from a single truncation.
 * These are derived from the secret, so they are only
 * ever handed to an explicitly-supplied sink.
 */
struct TruncationTrace
{
    unsigned offset;
    uint64_t binned;
    uint64_t code;
};

typedef std::function<void (const TruncationTrace &)> TruncationSink;

/**
 * Reads a byte, treating the buffer as circular.
 * An empty buffer reads as 0.
 */
uint8_t
circularIndex(DataSlice buffer, size_t index);

/**
 * Returns the window start, in [0, 28).
 */
unsigned
truncateOffset(const HashDigest &hash);

/**
 * Assembles the masked 8-byte window starting at `offset`,
 * most-significant byte first.
 */
uint64_t
truncateBinned(const HashDigest &hash, unsigned offset);

/**
 * Produces the final code, in [0, 10^11).
 */
uint64_t
truncate(const HashDigest &hash, const TruncationSink &sink=TruncationSink());

/**
 * A sink that writes each trace to the debug log.
 */
TruncationSink
truncationLogSink();

} // namespace botp

#endif
