/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

// Swapping the RAND_METHOD is the only way to make RAND_bytes fail:
#define OPENSSL_SUPPRESS_DEPRECATED

#include "../botp/crypto/Random.hpp"
#include "../src/BOTP.h"
#include <catch2/catch.hpp>
#include <openssl/rand.h>
#include <algorithm>
#include <string.h>

/**
 * Writes part of the request, then reports failure.
 */
static int
failingBytes(unsigned char *buf, int num)
{
    memset(buf, 0xaa, num / 2);
    return 0;
}

static int
failingStatus()
{
    return 0;
}

static const RAND_METHOD failingMethod =
{
    nullptr,
    failingBytes,
    nullptr,
    nullptr,
    failingBytes,
    failingStatus
};

/**
 * Makes RAND_bytes fail until the object goes away.
 */
class BrokenEntropy
{
public:
    BrokenEntropy():
        old_(RAND_get_rand_method())
    {
        RAND_set_rand_method(&failingMethod);
    }

    ~BrokenEntropy()
    {
        RAND_set_rand_method(old_);
    }

private:
    const RAND_METHOD *old_;
};

static bool
allEqual(const uint8_t *data, size_t size, uint8_t value)
{
    return std::all_of(data, data + size,
        [value](uint8_t c){ return c == value; });
}

TEST_CASE("Random data", "[crypto][random]")
{
    botp::DataChunk a, b;
    REQUIRE(botp::randomData(a, 32));
    REQUIRE(botp::randomData(b, 32));
    REQUIRE(a.size() == 32);
    REQUIRE(a != b);

    botp::DataChunk empty;
    REQUIRE(botp::randomData(empty, 0));
    REQUIRE(empty.empty());
}

TEST_CASE("Random secrets", "[crypto][random]")
{
    botp::SecretKey zero;
    zero.fill(0);

    botp::SecretKey a = zero, b = zero;
    REQUIRE(botp::randomSecret(a));
    REQUIRE(botp::randomSecret(b));
    REQUIRE(a != zero);
    REQUIRE(a != b);
}

TEST_CASE("Entropy failure wipes the buffer", "[crypto][random]")
{
    BrokenEntropy broken;

    uint8_t buffer[32];
    memset(buffer, 0x55, sizeof(buffer));
    auto s = botp::randomFill(buffer, sizeof(buffer));
    REQUIRE_FALSE(s);
    REQUIRE(s.value() == BOTP_CC_RandomBytesError);
    REQUIRE(allEqual(buffer, sizeof(buffer), 0));

    botp::DataChunk chunk(4, 0x55);
    REQUIRE(botp::randomData(chunk, 32).value() == BOTP_CC_RandomBytesError);
    REQUIRE(chunk == botp::DataChunk(4, 0x55));
}

TEST_CASE("Entropy failure leaves the secret alone", "[crypto][random]")
{
    BrokenEntropy broken;

    botp::SecretKey key;
    key.fill(0x55);
    auto s = botp::randomSecret(key);
    REQUIRE(s.value() == BOTP_CC_RandomBytesError);
    REQUIRE(allEqual(key.data(), key.size(), 0x55));

    unsigned char secret[BOTP_SECRET_LENGTH];
    memset(secret, 0x55, sizeof(secret));
    tBOTP_Error error;
    REQUIRE(BOTP_GenerateSecret(secret, &error) == BOTP_CC_RandomBytesError);
    REQUIRE(error.code == BOTP_CC_RandomBytesError);
    REQUIRE(allEqual(secret, sizeof(secret), 0));
}

TEST_CASE("Entropy works again once restored", "[crypto][random]")
{
    {
        BrokenEntropy broken;
        botp::DataChunk data;
        REQUIRE_FALSE(botp::randomData(data, 16));
    }

    botp::DataChunk data;
    REQUIRE(botp::randomData(data, 16));
    REQUIRE(data.size() == 16);
}
