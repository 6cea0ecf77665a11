/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../botp/otp/Counter.hpp"
#include <catch2/catch.hpp>

using std::chrono::seconds;
using std::chrono::milliseconds;

TEST_CASE("Counter within one interval", "[otp][counter]")
{
    auto epoch = botp::Clock::from_time_t(1000000);
    auto first = epoch + seconds(3000);

    uint64_t a, b, c;
    REQUIRE(botp::otpCounterAt(a, 30, epoch, first));
    REQUIRE(botp::otpCounterAt(b, 30, epoch, first + seconds(10)));
    REQUIRE(botp::otpCounterAt(c, 30, epoch, first + seconds(31)));

    REQUIRE(a == 100);
    REQUIRE(b == a);
    REQUIRE(c == a + 1);
}

TEST_CASE("Counter rounds down", "[otp][counter]")
{
    auto epoch = botp::Clock::time_point();
    uint64_t counter;

    REQUIRE(botp::otpCounterAt(counter, 30, epoch, epoch));
    REQUIRE(counter == 0);

    REQUIRE(botp::otpCounterAt(counter, 30, epoch, epoch + milliseconds(29999)));
    REQUIRE(counter == 0);

    REQUIRE(botp::otpCounterAt(counter, 30, epoch, epoch + seconds(30)));
    REQUIRE(counter == 1);

    REQUIRE(botp::otpCounterAt(counter, 1, epoch, epoch + seconds(59)));
    REQUIRE(counter == 59);
}

TEST_CASE("Counter never decreases", "[otp][counter]")
{
    auto epoch = botp::Clock::from_time_t(0);
    uint64_t last = 0;
    for (int t = 0; t < 1000; t += 7)
    {
        uint64_t counter;
        REQUIRE(botp::otpCounterAt(counter, 30, epoch, epoch + seconds(t)));
        REQUIRE(last <= counter);
        last = counter;
    }
}

TEST_CASE("Now before the epoch", "[otp][counter]")
{
    auto epoch = botp::Clock::from_time_t(1000000);
    uint64_t counter = 42;

    auto s = botp::otpCounterAt(counter, 30, epoch, epoch - seconds(1));
    REQUIRE_FALSE(s);
    REQUIRE(s.value() == BOTP_CC_TimeError);
    REQUIRE(counter == 42);

    // The real clock is well past 1970, so a future epoch must fail:
    auto future = botp::Clock::now() + std::chrono::hours(24);
    REQUIRE(botp::otpCounter(counter, 30, future).value() == BOTP_CC_TimeError);
}

TEST_CASE("Zero interval is rejected", "[otp][counter]")
{
    uint64_t counter = 42;
    auto s = botp::otpCounterAt(counter, 0, botp::Clock::time_point(),
        botp::Clock::now());
    REQUIRE_FALSE(s);
    REQUIRE(s.value() == BOTP_CC_InvalidInterval);
    REQUIRE(counter == 42);

    // Checked before the epoch:
    auto future = botp::Clock::now() + std::chrono::hours(24);
    REQUIRE(botp::otpCounter(counter, 0, future).value() ==
        BOTP_CC_InvalidInterval);
}

TEST_CASE("Default time step", "[otp][counter]")
{
    botp::TimeStep step;
    REQUIRE(step.interval == 30);

    auto now = botp::Clock::from_time_t(59);
    uint64_t counter;
    REQUIRE(botp::otpCounterAt(counter, step, now));
    REQUIRE(counter == 1);

    REQUIRE(botp::otpCounter(counter, step));
    REQUIRE(0 < counter);
}

TEST_CASE("Counter at the edges of the clock range", "[otp][counter]")
{
    auto least = botp::Clock::time_point::min();
    auto most = botp::Clock::time_point::max();
    uint64_t counter = 0;

    // The whole span is 18446744073.709551615 seconds:
    REQUIRE(botp::otpCounterAt(counter, 1, least, most));
    REQUIRE(counter == UINT64_C(18446744073));

    REQUIRE(botp::otpCounterAt(counter, 30, least, botp::Clock::from_time_t(0)));
    REQUIRE(0 < counter);

    REQUIRE(botp::otpCounterAt(counter, 30, most, botp::Clock::now()).value() ==
        BOTP_CC_TimeError);
}

TEST_CASE("Counter carries sub-second parts before 1970", "[otp][counter]")
{
    auto epoch = botp::Clock::from_time_t(0) - milliseconds(1500);
    uint64_t counter;

    REQUIRE(botp::otpCounterAt(counter, 1, epoch, epoch + milliseconds(999)));
    REQUIRE(counter == 0);

    REQUIRE(botp::otpCounterAt(counter, 1, epoch, epoch + milliseconds(2000)));
    REQUIRE(counter == 2);
}

TEST_CASE("Unix epochs outside the clock range", "[otp][counter]")
{
    botp::Clock::time_point epoch;
    REQUIRE(botp::epochFromUnix(epoch, 86400));
    REQUIRE(epoch == botp::Clock::from_time_t(86400));

    REQUIRE(botp::epochFromUnix(epoch, INT64_C(10000000000)).value() ==
        BOTP_CC_TimeError);
    REQUIRE(botp::epochFromUnix(epoch, INT64_MAX).value() == BOTP_CC_TimeError);
    REQUIRE(botp::epochFromUnix(epoch, INT64_C(-20000000000)).value() ==
        BOTP_CC_TimeError);
    REQUIRE(botp::epochFromUnix(epoch, INT64_MIN).value() == BOTP_CC_TimeError);

    // Failures leave the output alone:
    REQUIRE(epoch == botp::Clock::from_time_t(86400));
}
