/**
 * @file megaflow/chunkmac.h
 * @brief Chunk boundaries and the chunked CBC-MAC over file content
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

#ifndef MEGAFLOW_CHUNKMAC_H
#define MEGAFLOW_CHUNKMAC_H 1

#include "common/error_or.h"
#include "crypto/cryptopp.h"
#include "error.h"
#include "types.h"

namespace megaflow {

struct MEGAFLOW_API ChunkedHash
{
    static const int SEGSIZE = 131072;

    static m_off_t chunkfloor(m_off_t);
    static m_off_t chunkceil(m_off_t, m_off_t limit = -1);
};

// [start, end) of one chunk
struct MEGAFLOW_API ChunkRange
{
    m_off_t start;
    m_off_t end;

    m_off_t size() const { return end - start; }
};

// chunk ranges covering [0, size), in offset order
vector<ChunkRange> chunkPlan(m_off_t size);

// CBC-MAC of one chunk's plaintext, fed in pieces of any size
class MEGAFLOW_API ChunkMacState
{
public:
    ChunkMacState(SymmCipher& cipher, SymmCipher::ctr_iv nonce);

    void update(const byte* data, size_t len);

    // pads a buffered partial block with zeros; the state is spent afterwards
    void finish(byte* mac);

private:
    SymmCipher& mCipher;
    byte mMac[SymmCipher::BLOCKSIZE];
    byte mPending[SymmCipher::BLOCKSIZE];
    size_t mPendingLen = 0;
};

/**
 * @brief Folds chunk MACs into the file's meta-MAC.
 *
 * Chunk MACs must be folded in offset order. Chunks that complete ahead of
 * the contiguous watermark are held back until the gap before them closes.
 */
class MEGAFLOW_API MacAccumulator
{
public:
    static const size_t DEFAULT_MAXPENDING = 256;

    MacAccumulator(SymmCipher& cipher, m_off_t size, size_t maxPending = DEFAULT_MAXPENDING);

    /**
     * @brief Adds the MAC of chunk [start, end).
     *
     * @return API_EARGS if the range is not a chunk or was already added,
     *     API_ETOOMANY if too many chunks are waiting ahead of the watermark.
     */
    Error add(m_off_t start, m_off_t end, const byte* mac);

    // all bytes below the watermark have been folded
    m_off_t watermark() const { return mWatermark; }

    size_t pending() const { return mPending.size(); }

    bool complete() const { return mWatermark >= mSize; }

    // the condensed 8-byte meta-MAC, API_EINCOMPLETE before the watermark reaches the size
    common::ErrorOr<string> finalize() const;

private:
    void fold(const byte* mac);

    struct PendingChunk
    {
        m_off_t end;
        byte mac[SymmCipher::BLOCKSIZE];
    };

    SymmCipher& mCipher;
    m_off_t mSize;
    size_t mMaxPending;
    m_off_t mWatermark = 0;
    byte mAcc[SymmCipher::BLOCKSIZE] = {};
    map<m_off_t, PendingChunk> mPending;
};

// chunk MAC of a whole plaintext chunk in one call
void chunkMac(SymmCipher& cipher, SymmCipher::ctr_iv nonce, const byte* data, size_t len, byte* mac);

} // namespace

#endif
