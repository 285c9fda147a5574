/**
 * @file cryptopp.cpp
 * @brief Crypto layer using Crypto++
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
#include <cstdint>
#include <cstring>

#include "megaflow/crypto/cryptopp.h"
#include "megaflow/logging.h"

namespace megaflow {

using CryptoPP::Integer;

void PrnGen::genblock(byte* buf, size_t len)
{
    GenerateBlock(buf, len);
}

uint32_t PrnGen::genuint32(uint64_t max)
{
    if (!max)
    {
        return 0;
    }

    uint64_t top = std::min<uint64_t>(max - 1, UINT32_MAX);
    return static_cast<uint32_t>(GenerateWord32(0, static_cast<CryptoPP::word32>(top)));
}

SymmCipher::SymmCipher(const byte* newkey)
{
    setkey(newkey);
}

SymmCipher::SymmCipher(const SymmCipher& other)
{
    setkey(other.key);
}

SymmCipher& SymmCipher::operator=(const SymmCipher& other)
{
    if (this != &other)
    {
        setkey(other.key);
    }
    return *this;
}

void SymmCipher::setkey(const byte* newkey, int type)
{
    memcpy(key, newkey, KEYLENGTH);

    if (type == FILENODE)
    {
        xorblock(newkey + KEYLENGTH, key);
    }

    mEcbEnc.SetKey(key, KEYLENGTH);
    mEcbDec.SetKey(key, KEYLENGTH);
}

bool SymmCipher::setkey(const string* nodekey)
{
    switch (nodekey->size())
    {
        case FOLDERNODEKEYLENGTH:
            setkey((const byte*)nodekey->data(), FOLDERNODE);
            return true;

        case FILENODEKEYLENGTH:
            setkey((const byte*)nodekey->data(), FILENODE);
            return true;

        default:
            return false;
    }
}

void SymmCipher::ecb_encrypt(byte* data, byte* dst, size_t len)
{
    mEcbEnc.ProcessData(dst ? dst : data, data, len);
}

void SymmCipher::ecb_decrypt(byte* data, size_t len)
{
    mEcbDec.ProcessData(data, data, len);
}

bool SymmCipher::cbc_encrypt(byte* data, size_t len, const byte* iv)
{
    static const byte zero[BLOCKSIZE] = {};

    try
    {
        CryptoPP::CBC_Mode<CryptoPP::AES>::Encryption cbc(key, KEYLENGTH, iv ? iv : zero);
        cbc.ProcessData(data, data, len);
    }
    catch (const CryptoPP::Exception& e)
    {
        LOG_err << "AES-CBC encryption failed: " << e.what();
        return false;
    }
    return true;
}

bool SymmCipher::cbc_decrypt(byte* data, size_t len, const byte* iv)
{
    static const byte zero[BLOCKSIZE] = {};

    try
    {
        CryptoPP::CBC_Mode<CryptoPP::AES>::Decryption cbc(key, KEYLENGTH, iv ? iv : zero);
        cbc.ProcessData(data, data, len);
    }
    catch (const CryptoPP::Exception& e)
    {
        LOG_err << "AES-CBC decryption failed: " << e.what();
        return false;
    }
    return true;
}

void SymmCipher::ctr_crypt(byte* data, size_t len, m_off_t pos, ctr_iv nonce)
{
    byte counter[BLOCKSIZE];
    uint64_t block = static_cast<uint64_t>(pos) / BLOCKSIZE;

    memcpy(counter, &nonce, sizeof nonce);
    for (int i = BLOCKSIZE; i-- > int(sizeof nonce); block >>= 8)
    {
        counter[i] = static_cast<byte>(block);
    }

    CryptoPP::CTR_Mode<CryptoPP::AES>::Encryption ctr(key, KEYLENGTH, counter);

    // start mid-block when pos is not aligned
    ctr.Seek(static_cast<CryptoPP::lword>(pos % BLOCKSIZE));
    ctr.ProcessData(data, data, len);
}

void SymmCipher::xorblock(const byte* src, byte* dst, int len)
{
    for (int i = 0; i < len; i++)
    {
        dst[i] ^= src[i];
    }
}

// reads one length-prefixed MPI at pos
static bool readmpi(const byte* data, size_t len, size_t& pos, Integer& value)
{
    if (len - pos < 2)
    {
        return false;
    }

    size_t bits = (size_t(data[pos]) << 8) | data[pos + 1];
    size_t bytes = (bits + 7) / 8;
    pos += 2;

    if (len - pos < bytes)
    {
        return false;
    }

    value = Integer(data + pos, bytes);
    pos += bytes;
    return true;
}

bool AsymmCipher::setkey(const byte* data, size_t len)
{
    size_t pos = 0;

    mValid = readmpi(data, len, pos, mP)
          && readmpi(data, len, pos, mQ)
          && readmpi(data, len, pos, mD);

    if (!mValid)
    {
        return false;
    }

    // u is optional; whatever follows must be block padding
    size_t afterd = pos;
    if (!readmpi(data, len, pos, mU) || len - pos >= 16)
    {
        pos = afterd;
        mU = mP.InverseMod(mQ);
    }

    // a wrong master key leaves random bytes here
    mValid = len - pos < 16
          && mD.BitCount() > 1000
          && mP.BitCount() > 500
          && mQ.BitCount() > 500
          && mU == mP.InverseMod(mQ);

    return mValid;
}

bool AsymmCipher::decrypt(const byte* cipher, size_t cipherlen, byte* out, size_t numbytes) const
{
    size_t pos = 0;
    Integer c;

    if (!mValid || !readmpi(cipher, cipherlen, pos, c))
    {
        return false;
    }

    // CRT: m = mp + p * (u * (mq - mp) mod q)
    Integer mp = a_exp_b_mod_c(c % mP, mD % (mP - Integer::One()), mP);
    Integer mq = a_exp_b_mod_c(c % mQ, mD % (mQ - Integer::One()), mQ);
    Integer h = (mU * (mq + mQ - mp % mQ)) % mQ;
    Integer m = mp + mP * h;

    size_t width = std::max<size_t>(mP.ByteCount() + mQ.ByteCount() - 2, m.ByteCount());

    if (width < numbytes)
    {
        return false;
    }

    for (size_t i = 0; i < numbytes; i++)
    {
        out[i] = m.GetByte(width - 1 - i);
    }

    return true;
}

bool PBKDF2_HMAC_SHA512::deriveKey(byte* derivedkey, size_t derivedkeyLen,
                                   const byte* pwd, size_t pwdLen,
                                   const byte* salt, size_t saltLen,
                                   unsigned int iterations) const
{
    try
    {
        mKdf.DeriveKey(derivedkey, derivedkeyLen, 0, pwd, pwdLen, salt, saltLen, iterations);
    }
    catch (const CryptoPP::Exception& e)
    {
        LOG_err << "PBKDF2-HMAC-SHA512 failed: " << e.what();
        return false;
    }
    return true;
}

} // namespace
