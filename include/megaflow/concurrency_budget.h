/**
 * @file megaflow/concurrency_budget.h
 * @brief Weighted admission limit for concurrent transfers
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

#ifndef MEGAFLOW_CONCURRENCY_BUDGET_H
#define MEGAFLOW_CONCURRENCY_BUDGET_H 1

#include <mutex>

#include "types.h"

namespace megaflow {

// total weight of the jobs allowed to run at once
class MEGAFLOW_API ConcurrencyBudget
{
public:
    // a capacity of zero is raised to one
    explicit ConcurrencyBudget(unsigned capacity);

    // takes `weight` if it fits; weights above the capacity count as the capacity
    bool tryAcquire(unsigned weight);

    void release(unsigned weight);

    unsigned inUse() const;
    unsigned capacity() const { return mCapacity; }

    unsigned clamp(unsigned weight) const { return weight > mCapacity ? mCapacity : weight; }

private:
    mutable std::mutex mMutex;
    const unsigned mCapacity;
    unsigned mInUse = 0;
};

} // namespace

#endif
