/**
 * @file megaflow/crypto/cryptopp.h
 * @brief Crypto layer using Crypto++
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

#ifndef MEGAFLOW_CRYPTOCRYPTOPP_H
#define MEGAFLOW_CRYPTOCRYPTOPP_H 1

#include <cryptopp/cryptlib.h>
#include <cryptopp/modes.h>
#include <cryptopp/integer.h>
#include <cryptopp/aes.h>
#include <cryptopp/osrng.h>
#include <cryptopp/sha.h>
#include <cryptopp/nbtheory.h>
#include <cryptopp/hmac.h>
#include <cryptopp/pwdbased.h>

#include "megaflow/types.h"

namespace megaflow {

// process-wide source of key material, nonces and request ids
class MEGAFLOW_API PrnGen : public CryptoPP::AutoSeededRandomPool
{
public:
    void genblock(byte* buf, size_t len);

    // uniformly distributed in [0, max), 0 if max is 0
    uint32_t genuint32(uint64_t max);
};

/**
 * @brief AES-128 with one key, in the modes the MEGA protocol uses.
 *
 * ECB wraps keys, CBC protects attribute blobs, CTR carries file content.
 */
class MEGAFLOW_API SymmCipher
{
    CryptoPP::ECB_Mode<CryptoPP::AES>::Encryption mEcbEnc;
    CryptoPP::ECB_Mode<CryptoPP::AES>::Decryption mEcbDec;

public:
    static const int BLOCKSIZE = CryptoPP::AES::BLOCKSIZE;
    static const int KEYLENGTH = CryptoPP::AES::DEFAULT_KEYLENGTH;

    byte key[KEYLENGTH] = {};

    typedef uint64_t ctr_iv;

    // a 32-byte file node key folds its upper half into the AES key
    void setkey(const byte* newkey, int type = FOLDERNODE);

    // accepts 16-byte folder keys and 32-byte file keys
    bool setkey(const string* nodekey);

    // whole blocks only; in place unless dst is given
    void ecb_encrypt(byte* data, byte* dst = nullptr, size_t len = BLOCKSIZE);
    void ecb_decrypt(byte* data, size_t len = BLOCKSIZE);

    /**
     * @brief CBC over whole blocks, in place.
     *
     * @param iv Initialisation vector, all zeroes if null.
     * @return false if Crypto++ rejected the input
     */
    bool cbc_encrypt(byte* data, size_t len, const byte* iv = nullptr);
    bool cbc_decrypt(byte* data, size_t len, const byte* iv = nullptr);

    /**
     * @brief CTR keystream applied in place; encryption and decryption are
     * the same operation.
     *
     * The counter block of content offset `pos` is the nonce followed by
     * the big-endian block index pos / BLOCKSIZE, so any byte range can be
     * processed independently of the others.
     */
    void ctr_crypt(byte* data, size_t len, m_off_t pos, ctr_iv nonce);

    static void xorblock(const byte* src, byte* dst, int len = BLOCKSIZE);

    SymmCipher() = default;
    explicit SymmCipher(const byte* newkey);
    SymmCipher(const SymmCipher& other);
    SymmCipher& operator=(const SymmCipher& other);
};

/**
 * @brief RSA private key, decryption only.
 *
 * The key arrives as consecutive MPIs (p, q, d and optionally u = p^-1 mod q),
 * each prefixed by its length in bits as a 16-bit big-endian value.
 */
class MEGAFLOW_API AsymmCipher
{
    CryptoPP::Integer mP;
    CryptoPP::Integer mQ;
    CryptoPP::Integer mD;
    CryptoPP::Integer mU;

    bool mValid = false;

public:
    // false if the blob is malformed or does not hold a plausible key
    bool setkey(const byte* data, size_t len);

    /**
     * @brief Decrypts one MPI and copies the leading `numbytes` bytes of the
     * modulus-sized plaintext.
     */
    bool decrypt(const byte* cipher, size_t cipherlen, byte* out, size_t numbytes) const;
};

class MEGAFLOW_API PBKDF2_HMAC_SHA512
{
    CryptoPP::PKCS5_PBKDF2_HMAC<CryptoPP::SHA512> mKdf;

public:
    bool deriveKey(byte* derivedkey, size_t derivedkeyLen,
                   const byte* pwd, size_t pwdLen,
                   const byte* salt, size_t saltLen,
                   unsigned int iterations) const;
};

} // namespace

#endif
