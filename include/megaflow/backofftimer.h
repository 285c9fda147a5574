/**
 * @file megaflow/backofftimer.h
 * @brief Exponential backoff between retries
 *
 * (c) 2013-2014 by Mega Limited, Auckland, New Zealand
 *
 * This file is part of the MEGA SDK - Client Access Engine.
 *
 * Applications using the MEGA API must present a valid application key
 * and comply with the the rules set forth in the Terms of Service.
 *
 * The MEGA SDK is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 *
 * @copyright Simplified (2-clause) BSD License.
 *
 * You should have received a copy of the license along with this
 * program.
 */

#ifndef MEGAFLOW_BACKOFF_TIMER_H
#define MEGAFLOW_BACKOFF_TIMER_H 1

#include <chrono>

#include "types.h"

namespace megaflow {

// retry delay facility with exponential backoff: min * 2^attempt, clamped to [min, max]
class MEGAFLOW_API BackoffTimer
{
    std::chrono::milliseconds mMin;
    std::chrono::milliseconds mMax;
    unsigned mAttempts = 0;

public:
    BackoffTimer(std::chrono::milliseconds minDelay, std::chrono::milliseconds maxDelay);

    // delay to wait before retry number `attempt` (0-based)
    static std::chrono::milliseconds delay(unsigned attempt,
                                           std::chrono::milliseconds minDelay,
                                           std::chrono::milliseconds maxDelay);

    // trigger exponential backoff, returns the delay to wait
    std::chrono::milliseconds backoff();

    // forget previous failures
    void reset();

    // number of backoffs since the last reset
    unsigned attempts() const { return mAttempts; }
};

} // namespace

#endif
