/**
 * @file backofftimer.cpp
 * @brief Exponential backoff between retries
 *
 * (c) 2013-2014 by Mega Limited, Auckland, New Zealand
 *
 * This file is part of the MEGA SDK - Client Access Engine.
 *
 * Applications using the MEGA API must present a valid application key
 * and comply with the rules set forth in the Terms of Service.
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

#include <algorithm>

#include "megaflow/backofftimer.h"

namespace megaflow {

BackoffTimer::BackoffTimer(std::chrono::milliseconds minDelay, std::chrono::milliseconds maxDelay)
    : mMin(minDelay)
    , mMax(std::max(minDelay, maxDelay))
{
}

std::chrono::milliseconds BackoffTimer::delay(unsigned attempt,
                                              std::chrono::milliseconds minDelay,
                                              std::chrono::milliseconds maxDelay)
{
    if (maxDelay < minDelay)
    {
        maxDelay = minDelay;
    }

    auto d = minDelay;

    // doubling stops as soon as the cap is reached, so no overflow
    for (unsigned i = 0; i < attempt && d < maxDelay; i++)
    {
        d *= 2;
    }

    return std::min(std::max(d, minDelay), maxDelay);
}

std::chrono::milliseconds BackoffTimer::backoff()
{
    return delay(mAttempts++, mMin, mMax);
}

void BackoffTimer::reset()
{
    mAttempts = 0;
}

} // namespace
