/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../botp/crypto/Encoding.hpp"
#include <catch2/catch.hpp>

TEST_CASE("RFC 4648 base16 test vectors", "[crypto][base16]")
{
    struct TestCase
    {
        const char *data;
        const char *text;
    };
    TestCase cases[] =
    {
        {"", ""},
        {"f", "66"},
        {"fo", "666f"},
        {"foo", "666f6f"},
        {"foob", "666f6f62"},
        {"fooba", "666f6f6261"},
        {"foobar", "666f6f626172"}
    };

    // Encoding:
    for (auto &test: cases)
        REQUIRE(test.text == botp::base16Encode(std::string(test.data)));

    // Decoding:
    for (auto &test: cases)
    {
        botp::DataChunk result;
        REQUIRE(botp::base16Decode(result, test.text));
        REQUIRE(botp::toString(result) == test.data);
    }
}

TEST_CASE("Uppercase base16", "[crypto][base16]")
{
    botp::DataChunk result;
    REQUIRE(botp::base16Decode(result, "DEADbeef"));
    REQUIRE(botp::base16Encode(result) == "deadbeef");
}

TEST_CASE("Bad base16 strings", "[crypto][base16]")
{
    botp::DataChunk result;

    // Bad length:
    auto s = botp::base16Decode(result, "123");
    REQUIRE_FALSE(s);
    REQUIRE(s.value() == BOTP_CC_ParseError);

    // Bad padding:
    REQUIRE_FALSE(botp::base16Decode(result, "00=="));
    REQUIRE_FALSE(botp::base16Decode(result, "0="));
}

TEST_CASE("RFC 4648 base32 test vectors", "[crypto][base32]")
{
    struct TestCase
    {
        const char *data;
        const char *text;
    };
    TestCase cases[] =
    {
        {"", ""},
        {"f", "MY======"},
        {"fo", "MZXQ===="},
        {"foo", "MZXW6==="},
        {"foob", "MZXW6YQ="},
        {"fooba", "MZXW6YTB"},
        {"foobar", "MZXW6YTBOI======"}
    };

    // Encoding:
    for (auto &test: cases)
        REQUIRE(test.text == botp::base32Encode(std::string(test.data)));

    // Decoding:
    for (auto &test: cases)
    {
        botp::DataChunk result;
        REQUIRE(botp::base32Decode(result, test.text));
        REQUIRE(botp::toString(result) == test.data);
    }
}

TEST_CASE("Bad base32 strings", "[crypto][base32]")
{
    botp::DataChunk result;

    // Bad length:
    REQUIRE_FALSE(botp::base32Decode(result, "12345"));

    // Bad padding:
    REQUIRE_FALSE(botp::base32Decode(result, "AAAAAAAA========"));
    REQUIRE_FALSE(botp::base32Decode(result, "A======="));
    REQUIRE_FALSE(botp::base32Decode(result, "AAA====="));
    REQUIRE_FALSE(botp::base32Decode(result, "AAAAAA=="));

    // Illegal characters:
    REQUIRE_FALSE(botp::base32Decode(result, "A1======"));
    REQUIRE_FALSE(botp::base32Decode(result, "Aa======"));
}
