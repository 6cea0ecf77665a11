/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Counter.hpp"

namespace botp {

using std::chrono::seconds;

Status
epochFromUnix(Clock::time_point &result, int64_t unixSeconds)
{
    const auto most = std::chrono::duration_cast<seconds>(Clock::duration::max());
    const auto least = std::chrono::duration_cast<seconds>(Clock::duration::min());

    // Anything past the clock's range is necessarily after now:
    if (most.count() < unixSeconds)
        return BOTP_ERROR(BOTP_CC_TimeError,
            "The epoch is beyond the range of the system clock");
    if (unixSeconds < least.count())
        return BOTP_ERROR(BOTP_CC_TimeError,
            "The epoch is before the range of the system clock");

    result = Clock::time_point(seconds(unixSeconds));
    return Status();
}

Status
otpCounterAt(uint64_t &result, uint64_t interval,
    Clock::time_point epoch, Clock::time_point now)
{
    if (!interval)
        return BOTP_ERROR(BOTP_CC_InvalidInterval,
            "The time step interval cannot be zero");
    if (now < epoch)
        return BOTP_ERROR(BOTP_CC_TimeError,
            "The current time is before the epoch");

    // Subtract whole seconds so extreme time points cannot overflow,
    // then carry the sub-second parts:
    auto nowSeconds = std::chrono::time_point_cast<seconds>(now);
    auto epochSeconds = std::chrono::time_point_cast<seconds>(epoch);
    auto elapsed = nowSeconds - epochSeconds;
    auto fraction = (now - nowSeconds) - (epoch - epochSeconds);
    while (fraction < Clock::duration::zero())
    {
        fraction += seconds(1);
        elapsed -= seconds(1);
    }
    while (seconds(1) <= fraction)
    {
        fraction -= seconds(1);
        elapsed += seconds(1);
    }

    result = static_cast<uint64_t>(elapsed.count()) / interval;
    return Status();
}

Status
otpCounter(uint64_t &result, uint64_t interval, Clock::time_point epoch)
{
    return otpCounterAt(result, interval, epoch, Clock::now());
}

Status
otpCounterAt(uint64_t &result, const TimeStep &step, Clock::time_point now)
{
    return otpCounterAt(result, step.interval, step.epoch, now);
}

Status
otpCounter(uint64_t &result, const TimeStep &step)
{
    return otpCounterAt(result, step.interval, step.epoch, Clock::now());
}

} // namespace botp
