/**
 * @file chunkmac.cpp
 * @brief Chunk boundaries and the chunked CBC-MAC over file content
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

#include "megaflow/chunkmac.h"
#include "megaflow/logging.h"

namespace megaflow {

using common::ErrorOr;
using common::unexpected;

// start of chunk
m_off_t ChunkedHash::chunkfloor(m_off_t p)
{
    m_off_t cp, np;

    cp = 0;

    for (unsigned i = 1; i <= 8; i++)
    {
        np = cp + i * SEGSIZE;

        if ((p >= cp) && (p < np))
        {
            return cp;
        }

        cp = np;
    }

    return ((p - cp) & - (8 * SEGSIZE)) + cp;
}

// end of chunk (== start of next chunk)
m_off_t ChunkedHash::chunkceil(m_off_t p, m_off_t limit)
{
    m_off_t cp, np;

    cp = 0;

    for (unsigned i = 1; i <= 8; i++)
    {
        np = cp + i * SEGSIZE;

        if ((p >= cp) && (p < np))
        {
            return (limit < 0 || np < limit) ? np : limit;
        }

        cp = np;
    }

    np = ((p - cp) & - (8 * SEGSIZE)) + cp + 8 * SEGSIZE;
    return (limit < 0 || np < limit) ? np : limit;
}

vector<ChunkRange> chunkPlan(m_off_t size)
{
    vector<ChunkRange> plan;

    for (m_off_t pos = 0; pos < size; )
    {
        m_off_t end = ChunkedHash::chunkceil(pos, size);
        plan.push_back(ChunkRange{pos, end});
        pos = end;
    }

    return plan;
}

ChunkMacState::ChunkMacState(SymmCipher& cipher, SymmCipher::ctr_iv nonce)
    : mCipher(cipher)
{
    MemAccess::set<SymmCipher::ctr_iv>(mMac, nonce);
    MemAccess::set<SymmCipher::ctr_iv>(mMac + sizeof nonce, nonce);
}

void ChunkMacState::update(const byte* data, size_t len)
{
    if (mPendingLen)
    {
        size_t take = std::min(len, SymmCipher::BLOCKSIZE - mPendingLen);
        memcpy(mPending + mPendingLen, data, take);
        mPendingLen += take;
        data += take;
        len -= take;

        if (mPendingLen < size_t(SymmCipher::BLOCKSIZE))
        {
            return;
        }

        SymmCipher::xorblock(mPending, mMac);
        mCipher.ecb_encrypt(mMac);
        mPendingLen = 0;
    }

    while (len >= size_t(SymmCipher::BLOCKSIZE))
    {
        SymmCipher::xorblock(data, mMac);
        mCipher.ecb_encrypt(mMac);
        data += SymmCipher::BLOCKSIZE;
        len -= SymmCipher::BLOCKSIZE;
    }

    if (len)
    {
        memcpy(mPending, data, len);
        mPendingLen = len;
    }
}

void ChunkMacState::finish(byte* mac)
{
    if (mPendingLen)
    {
        memset(mPending + mPendingLen, 0, SymmCipher::BLOCKSIZE - mPendingLen);
        SymmCipher::xorblock(mPending, mMac);
        mCipher.ecb_encrypt(mMac);
        mPendingLen = 0;
    }

    memcpy(mac, mMac, sizeof mMac);
}

void chunkMac(SymmCipher& cipher, SymmCipher::ctr_iv nonce, const byte* data, size_t len, byte* mac)
{
    ChunkMacState state(cipher, nonce);
    state.update(data, len);
    state.finish(mac);
}

MacAccumulator::MacAccumulator(SymmCipher& cipher, m_off_t size, size_t maxPending)
    : mCipher(cipher)
    , mSize(size)
    , mMaxPending(maxPending)
{
}

void MacAccumulator::fold(const byte* mac)
{
    SymmCipher::xorblock(mac, mAcc);
    mCipher.ecb_encrypt(mAcc);
}

Error MacAccumulator::add(m_off_t start, m_off_t end, const byte* mac)
{
    if (start < mWatermark
            || end > mSize
            || start != ChunkedHash::chunkfloor(start)
            || end != ChunkedHash::chunkceil(start, mSize)
            || mPending.count(start))
    {
        LOG_err << "Unexpected chunk MAC for " << start << "-" << end
                << " (watermark " << mWatermark << ")";
        return API_EARGS;
    }

    if (start != mWatermark)
    {
        if (mPending.size() >= mMaxPending)
        {
            return API_ETOOMANY;
        }

        PendingChunk& pc = mPending[start];
        pc.end = end;
        memcpy(pc.mac, mac, sizeof pc.mac);
        return API_OK;
    }

    fold(mac);
    mWatermark = end;

    // drain whatever has become contiguous
    for (auto it = mPending.begin(); it != mPending.end() && it->first == mWatermark; )
    {
        fold(it->second.mac);
        mWatermark = it->second.end;
        it = mPending.erase(it);
    }

    return API_OK;
}

ErrorOr<string> MacAccumulator::finalize() const
{
    if (!complete())
    {
        return unexpected(Error(API_EINCOMPLETE));
    }

    byte mac[SymmCipher::BLOCKSIZE];
    memcpy(mac, mAcc, sizeof mac);

    uint32_t m[4];
    memcpy(m, mac, sizeof m);

    m[0] ^= m[1];
    m[1] = m[2] ^ m[3];

    memcpy(mac, m, 2 * sizeof(uint32_t));

    return string((const char*)mac, 8);
}

} // namespace
