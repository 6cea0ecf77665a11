/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef BOTP_OTP_COUNTER_HPP
#define BOTP_OTP_COUNTER_HPP

#include "../util/Status.hpp"
#include <stdint.h>
#include <chrono>

namespace botp {

typedef std::chrono::system_clock Clock;

/**
 * The interval length and reference point used to turn
 * wall-clock time into a step counter.
 */
struct TimeStep
{
    TimeStep():
        interval(BOTP_DEFAULT_INTERVAL), epoch()
    {}

    TimeStep(uint64_t interval, Clock::time_point epoch):
        interval(interval), epoch(epoch)
    {}

    uint64_t interval; // Seconds
    Clock::time_point epoch;
};

/**
 * Converts Unix seconds to a clock time point.
 * Fails with BOTP_CC_TimeError if the clock cannot represent the time.
 */
Status
epochFromUnix(Clock::time_point &result, int64_t unixSeconds);

/**
 * Counts the whole intervals between the epoch and `now`.
 * Fails with BOTP_CC_InvalidInterval if the interval is zero,
 * or BOTP_CC_TimeError if `now` lies before the epoch.
 */
Status
otpCounterAt(uint64_t &result, uint64_t interval,
    Clock::time_point epoch, Clock::time_point now);

/**
 * Counts the whole intervals between the epoch and the current time.
 */
Status
otpCounter(uint64_t &result, uint64_t interval, Clock::time_point epoch);

Status
otpCounterAt(uint64_t &result, const TimeStep &step, Clock::time_point now);

Status
otpCounter(uint64_t &result, const TimeStep &step);

} // namespace botp

#endif
