/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Truncate.hpp"
#include "../util/Debug.hpp"
#include <inttypes.h>

namespace botp {

uint8_t
circularIndex(DataSlice buffer, size_t index)
{
    if (buffer.empty())
        return 0;
    return buffer[index % buffer.size()];
}

unsigned
truncateOffset(const HashDigest &hash)
{
    return hash[HASH_DIGEST_LENGTH - 1] % TRUNCATE_OFFSET_MODULUS;
}

uint64_t
truncateBinned(const HashDigest &hash, unsigned offset)
{
    uint64_t out = circularIndex(hash, offset) & 0x7f;
    for (unsigned k = 1; k < TRUNCATE_WINDOW_SIZE; ++k)
        out = out << 8 | (circularIndex(hash, offset + k) & 0xff);
    return out;
}

uint64_t
truncate(const HashDigest &hash, const TruncationSink &sink)
{
    unsigned offset = truncateOffset(hash);
    uint64_t binned = truncateBinned(hash, offset);
    uint64_t code = binned % CODE_MODULUS;

    if (sink)
        sink(TruncationTrace{offset, binned, code});
    return code;
}

TruncationSink
truncationLogSink()
{
    return [](const TruncationTrace &trace)
    {
        BOTP_DebugLevel(1, "Truncation offset: %u, binned: %" PRIu64
            ", code: %" PRIu64, trace.offset, trace.binned, trace.code);
    };
}

} // namespace botp
