/**
 * @file concurrency_budget.cpp
 * @brief Weighted admission limit for concurrent transfers
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

#include "megaflow/concurrency_budget.h"
#include "megaflow/logging.h"

namespace megaflow {

ConcurrencyBudget::ConcurrencyBudget(unsigned capacity)
    : mCapacity(capacity ? capacity : 1)
{
}

bool ConcurrencyBudget::tryAcquire(unsigned weight)
{
    weight = clamp(weight);

    std::lock_guard<std::mutex> g(mMutex);

    if (mInUse + weight > mCapacity)
    {
        return false;
    }

    mInUse += weight;
    return true;
}

void ConcurrencyBudget::release(unsigned weight)
{
    weight = clamp(weight);

    std::lock_guard<std::mutex> g(mMutex);

    if (weight > mInUse)
    {
        LOG_err << "Releasing " << weight << " from a budget holding " << mInUse;
        mInUse = 0;
        return;
    }

    mInUse -= weight;
}

unsigned ConcurrencyBudget::inUse() const
{
    std::lock_guard<std::mutex> g(mMutex);
    return mInUse;
}

} // namespace
