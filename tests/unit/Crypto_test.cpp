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

#include <megaflow/base64.h>
#include <megaflow/filecrypto.h>

#include "TestAccount.h"

using namespace megaflow;

namespace {

std::string testBuffer(size_t size)
{
    std::string buffer(size, '\0');
    for (size_t i = 0; i < size; i++)
    {
        buffer[i] = static_cast<char>(i % 255);
    }
    return buffer;
}

std::string hex(const byte* data, size_t len)
{
    static const char digits[] = "0123456789abcdef";
    std::string out;
    for (size_t i = 0; i < len; i++)
    {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 15];
    }
    return out;
}

std::string prepared(size_t passwordLength)
{
    byte key[SymmCipher::KEYLENGTH];
    prepareKeyV1(testBuffer(passwordLength), key);
    return hex(key, sizeof key);
}

} // namespace

TEST(Crypto, PrepareKeyV1_ShortPassword)
{
    EXPECT_EQ("c4589a459956887caf0b408635c3c03b", prepared(8));
    EXPECT_EQ("59930b1c55d783ac77df4c4ff261b0f1", prepared(10));
}

TEST(Crypto, PrepareKeyV1_MultiBlockPassword)
{
    EXPECT_EQ("83bd84689f057f9ed9834b3ecb81d80e", prepared(64));
}

TEST(Crypto, LoginHashIgnoresEmailCase)
{
    byte key[SymmCipher::KEYLENGTH];
    prepareKeyV1("correct horse", key);

    std::string uh = loginHashV1("Someone@Example.COM", key);

    EXPECT_EQ(11u, uh.size());
    EXPECT_EQ(uh, loginHashV1("someone@example.com", key));
    EXPECT_NE(uh, loginHashV1("someone@example.org", key));
}

TEST(Crypto, DeriveLoginKeyNeedsSaltForV2)
{
    auto lk = deriveLoginKey(2, "a@b.c", "pw", "");
    ASSERT_FALSE(lk);
    EXPECT_EQ(API_EINTERNAL, lk.error());

    lk = deriveLoginKey(3, "a@b.c", "pw", "c2FsdA");
    ASSERT_FALSE(lk);
}

TEST(Crypto, DeriveLoginKeyV2SplitsPbkdf2Output)
{
    auto a = deriveLoginKey(2, "a@b.c", "pw", "c2FsdHNhbHRzYWx0");
    auto b = deriveLoginKey(2, "a@b.c", "pw", "c2FsdHNhbHRzYWx0");
    auto c = deriveLoginKey(2, "a@b.c", "pw2", "c2FsdHNhbHRzYWx0");

    ASSERT_TRUE(a && b && c);
    EXPECT_EQ(0, memcmp(a->key, b->key, sizeof a->key));
    EXPECT_EQ(22u, a->uh.size());
    EXPECT_EQ(a->uh, b->uh);
    EXPECT_NE(a->uh, c->uh);
}

TEST(Crypto, WrapAndUnwrapKey)
{
    SymmCipher kek((const byte*)mt::randomKey(16).data());
    std::string key = mt::randomKey(32);

    auto wrapped = wrapKey(key, kek);
    ASSERT_TRUE(wrapped);
    EXPECT_NE(key, *wrapped);

    auto unwrapped = unwrapKey(*wrapped, kek);
    ASSERT_TRUE(unwrapped);
    EXPECT_EQ(key, *unwrapped);

    auto odd = unwrapKey(wrapped->substr(0, 20), kek);
    ASSERT_FALSE(odd);
    EXPECT_EQ(CRYPTO_EINVALIDKEY, odd.error());
}

TEST(Crypto, AttributesRoundTrip)
{
    NodeAttributes attrs;
    attrs.name = "r\xc3\xa9sum\xc3\xa9 \"final\".pdf";

    for (size_t keylen : { FOLDERNODEKEYLENGTH, FILENODEKEYLENGTH })
    {
        std::string key = mt::randomKey(static_cast<size_t>(keylen));

        auto blob = encryptAttributes(attrs, key);
        ASSERT_TRUE(blob);
        EXPECT_EQ(0u, blob->size() % SymmCipher::BLOCKSIZE);

        auto decrypted = decryptAttributes(*blob, key);
        ASSERT_TRUE(decrypted);
        EXPECT_EQ(attrs.name, decrypted->name);
    }
}

TEST(Crypto, AttributesWithWrongKeyAreMalformed)
{
    NodeAttributes attrs;
    attrs.name = "notes.txt";

    auto blob = encryptAttributes(attrs, mt::randomKey(FILENODEKEYLENGTH));
    ASSERT_TRUE(blob);

    auto decrypted = decryptAttributes(*blob, mt::randomKey(FILENODEKEYLENGTH));
    ASSERT_FALSE(decrypted);
    EXPECT_EQ(CRYPTO_EMALFORMED, decrypted.error());

    decrypted = decryptAttributes(*blob, mt::randomKey(7));
    ASSERT_FALSE(decrypted);
    EXPECT_EQ(CRYPTO_EINVALIDKEY, decrypted.error());

    decrypted = decryptAttributes(blob->substr(0, blob->size() - 1), mt::randomKey(FILENODEKEYLENGTH));
    ASSERT_FALSE(decrypted);
    EXPECT_EQ(CRYPTO_EMALFORMED, decrypted.error());
}

TEST(Crypto, FileKeySplitsNodeKey)
{
    std::string nodekey = mt::randomKey(FILENODEKEYLENGTH);

    auto fk = FileKey::fromNodeKey(nodekey);
    ASSERT_TRUE(fk);
    EXPECT_EQ(nodekey, fk->nodeKey());

    // the last 8 bytes are the meta-MAC, the 8 before them the nonce
    EXPECT_EQ(0, memcmp(fk->metamac, nodekey.data() + 24, 8));
    EXPECT_EQ(MemAccess::get<SymmCipher::ctr_iv>(nodekey.data() + 16), fk->nonce);

    EXPECT_FALSE(FileKey::fromNodeKey(nodekey.substr(0, 16)));
}

TEST(Crypto, FileCipherAtAnyChunkOffset)
{
    FileKey fk;
    std::string k = mt::randomKey(16);
    memcpy(fk.key, k.data(), sizeof fk.key);
    fk.nonce = 0x0123456789abcdefull;

    std::string plain = mt::randomKey(100);
    std::string whole = plain;
    std::string pieces = plain;

    FileCipher(fk).crypt((byte*)&whole[0], whole.size(), 0);

    FileCipher cipher(fk);
    cipher.crypt((byte*)&pieces[0], 32, 0);
    cipher.crypt((byte*)&pieces[32], pieces.size() - 32, 32);

    EXPECT_EQ(whole, pieces);
    EXPECT_NE(plain, whole);

    cipher.crypt((byte*)&whole[0], whole.size(), 0);
    EXPECT_EQ(plain, whole);
}

TEST(Crypto, FileCipherCounterIsNonceThenBlockIndex)
{
    FileKey fk;
    std::string k = mt::randomKey(16);
    memcpy(fk.key, k.data(), sizeof fk.key);
    fk.nonce = 0x1122334455667788ull;

    // keystream over zeroes, starting at block 0x1ff
    const m_off_t pos = 0x1ff * SymmCipher::BLOCKSIZE;
    std::string stream(2 * SymmCipher::BLOCKSIZE, '\0');
    FileCipher(fk).crypt((byte*)&stream[0], stream.size(), pos);

    SymmCipher aes(fk.key);
    for (int block = 0; block < 2; block++)
    {
        byte counter[SymmCipher::BLOCKSIZE] = {};
        memcpy(counter, &fk.nonce, sizeof fk.nonce);
        counter[14] = static_cast<byte>((0x1ff + block) >> 8);
        counter[15] = static_cast<byte>(0x1ff + block);

        byte expected[SymmCipher::BLOCKSIZE];
        aes.ecb_encrypt(counter, expected);

        EXPECT_EQ(std::string((const char*)expected, sizeof expected),
                  stream.substr(block * SymmCipher::BLOCKSIZE, SymmCipher::BLOCKSIZE)) << block;
    }
}

TEST(Crypto, FileCipherAtUnalignedOffset)
{
    FileKey fk;
    std::string k = mt::randomKey(16);
    memcpy(fk.key, k.data(), sizeof fk.key);
    fk.nonce = 42;

    std::string whole = mt::randomKey(80);
    std::string middle = whole.substr(5, 37);

    FileCipher cipher(fk);
    cipher.crypt((byte*)&whole[0], whole.size(), 0);
    cipher.crypt((byte*)&middle[0], middle.size(), 5);

    EXPECT_EQ(whole.substr(5, 37), middle);
}

TEST(Crypto, ParseFileAttributes)
{
    std::string thumbnail, preview;
    parseFileAttributes("924:0*VT7d8rGb9Ms/924:1*l9AqVoDm7Ns", thumbnail, preview);

    EXPECT_EQ("VT7d8rGb9Ms", thumbnail);
    EXPECT_EQ("l9AqVoDm7Ns", preview);
}
