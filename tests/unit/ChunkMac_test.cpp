/**
 * (c) 2019 by Mega Limited, Wellsford, New Zealand
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

#include <gtest/gtest.h>

#include <megaflow/chunkmac.h>
#include <megaflow/filecrypto.h>

#include "TestAccount.h"

using namespace megaflow;

namespace {

FileKey randomFileKey()
{
    FileKey fk;
    std::string k = mt::randomKey(SymmCipher::KEYLENGTH + sizeof fk.nonce);
    memcpy(fk.key, k.data(), sizeof fk.key);
    fk.nonce = MemAccess::get<SymmCipher::ctr_iv>(k.data() + SymmCipher::KEYLENGTH);
    return fk;
}

const m_off_t KB = 1024;

} // namespace

TEST(ChunkMac, ChunkPlanGrowsTo1MB)
{
    EXPECT_TRUE(chunkPlan(0).empty());

    auto plan = chunkPlan(100);
    ASSERT_EQ(1u, plan.size());
    EXPECT_EQ(0, plan[0].start);
    EXPECT_EQ(100, plan[0].end);

    m_off_t size = 5 * 1024 * KB + 7;
    plan = chunkPlan(size);

    EXPECT_EQ(128 * KB, plan[0].size());
    EXPECT_EQ(256 * KB, plan[1].size());
    EXPECT_EQ(384 * KB, plan[2].size());

    m_off_t pos = 0;
    for (size_t i = 0; i < plan.size(); i++)
    {
        EXPECT_EQ(pos, plan[i].start);
        EXPECT_LE(plan[i].size(), 1024 * KB);
        pos = plan[i].end;
    }
    EXPECT_EQ(size, pos);
    EXPECT_EQ(7, plan.back().size());
}

TEST(ChunkMac, IncrementalMacMatchesOneShot)
{
    FileKey fk = randomFileKey();
    SymmCipher cipher(fk.key);
    std::string data = mt::randomKey(100);

    byte whole[SymmCipher::BLOCKSIZE];
    chunkMac(cipher, fk.nonce, (const byte*)data.data(), 100, whole);

    byte pieces[SymmCipher::BLOCKSIZE];
    ChunkMacState state(cipher, fk.nonce);
    state.update((const byte*)data.data(), 40);
    state.update((const byte*)data.data() + 40, 60);
    state.finish(pieces);

    EXPECT_EQ(0, memcmp(whole, pieces, sizeof whole));

    byte other[SymmCipher::BLOCKSIZE];
    data[99] ^= 1;
    chunkMac(cipher, fk.nonce, (const byte*)data.data(), 100, other);
    EXPECT_NE(0, memcmp(whole, other, sizeof whole));
}

TEST(ChunkMac, AccumulatorOrderIndependent)
{
    FileKey fk = randomFileKey();
    m_off_t size = 700 * KB;
    std::string data = mt::randomKey(static_cast<size_t>(size));
    auto plan = chunkPlan(size);
    ASSERT_GE(plan.size(), 3u);

    std::vector<std::string> macs;
    SymmCipher cipher(fk.key);
    for (const auto& c : plan)
    {
        byte mac[SymmCipher::BLOCKSIZE];
        chunkMac(cipher, fk.nonce, (const byte*)data.data() + c.start, static_cast<size_t>(c.size()), mac);
        macs.emplace_back((const char*)mac, sizeof mac);
    }

    SymmCipher c1(fk.key);
    MacAccumulator inOrder(c1, size);
    for (size_t i = 0; i < plan.size(); i++)
    {
        ASSERT_EQ(API_OK, inOrder.add(plan[i].start, plan[i].end, (const byte*)macs[i].data()));
    }

    SymmCipher c2(fk.key);
    MacAccumulator reversed(c2, size);
    for (size_t i = plan.size(); i--; )
    {
        ASSERT_EQ(API_OK, reversed.add(plan[i].start, plan[i].end, (const byte*)macs[i].data()));
        EXPECT_EQ(i ? 0 : size, reversed.watermark());
    }

    EXPECT_EQ(0u, reversed.pending());
    ASSERT_TRUE(inOrder.finalize());
    ASSERT_TRUE(reversed.finalize());
    EXPECT_EQ(*inOrder.finalize(), *reversed.finalize());
    EXPECT_EQ(8u, inOrder.finalize()->size());
}

TEST(ChunkMac, AccumulatorRejectsBadChunks)
{
    FileKey fk = randomFileKey();
    SymmCipher cipher(fk.key);
    byte mac[SymmCipher::BLOCKSIZE] = {};

    m_off_t size = 1024 * KB;
    auto plan = chunkPlan(size);

    MacAccumulator acc(cipher, size, 1);

    EXPECT_FALSE(acc.finalize());
    EXPECT_EQ(API_EINCOMPLETE, acc.finalize().error());

    // not a chunk boundary
    EXPECT_EQ(API_EARGS, acc.add(1, plan[0].end, mac));
    EXPECT_EQ(API_EARGS, acc.add(0, 1000, mac));

    // one chunk may wait ahead of the watermark, not two
    EXPECT_EQ(API_OK, acc.add(plan[1].start, plan[1].end, mac));
    EXPECT_EQ(API_ETOOMANY, acc.add(plan[2].start, plan[2].end, mac));

    // already added
    EXPECT_EQ(API_EARGS, acc.add(plan[1].start, plan[1].end, mac));

    EXPECT_EQ(API_OK, acc.add(plan[0].start, plan[0].end, mac));
    EXPECT_EQ(plan[1].end, acc.watermark());
    EXPECT_EQ(API_EARGS, acc.add(plan[0].start, plan[0].end, mac));
}

TEST(ChunkMac, EmptyFileHasMac)
{
    SymmCipher cipher(randomFileKey().key);
    MacAccumulator acc(cipher, 0);

    EXPECT_TRUE(acc.complete());
    ASSERT_TRUE(acc.finalize());
    EXPECT_EQ(8u, acc.finalize()->size());
}

// every chunk shape decrypts back and verifies, the short final one included
TEST(ChunkMac, RoundTripForEveryChunkSize)
{
    for (m_off_t size : { m_off_t(1), m_off_t(15), m_off_t(16), m_off_t(17),
                          128 * KB, 128 * KB + 1, 384 * KB + 5, 1024 * KB * 3 + 33 })
    {
        FileKey fk = randomFileKey();
        std::string plain = mt::randomKey(static_cast<size_t>(size));
        std::string encrypted = mt::encryptContent(plain, fk);

        FileCipher cipher(fk);
        SymmCipher maccipher(fk.key);
        MacAccumulator acc(maccipher, size);
        std::string decrypted = encrypted;

        for (const auto& c : chunkPlan(size))
        {
            byte* data = (byte*)&decrypted[static_cast<size_t>(c.start)];
            byte mac[SymmCipher::BLOCKSIZE];

            cipher.crypt(data, static_cast<size_t>(c.size()), c.start);
            chunkMac(cipher.cipher(), cipher.nonce(), data, static_cast<size_t>(c.size()), mac);
            ASSERT_EQ(API_OK, acc.add(c.start, c.end, mac));
        }

        EXPECT_EQ(plain, decrypted) << "size " << size;

        auto metamac = acc.finalize();
        ASSERT_TRUE(metamac);
        EXPECT_EQ(0, memcmp(metamac->data(), fk.metamac, sizeof fk.metamac)) << "size " << size;
    }
}
