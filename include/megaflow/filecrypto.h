/**
 * @file megaflow/filecrypto.h
 * @brief Login key derivation, node key wrapping and attribute encryption
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

#ifndef MEGAFLOW_FILECRYPTO_H
#define MEGAFLOW_FILECRYPTO_H 1

#include "common/error_or.h"
#include "crypto/cryptopp.h"
#include "error.h"
#include "types.h"

namespace megaflow {

// password key plus the login hash sent as `uh`
struct MEGAFLOW_API LoginKey
{
    byte key[SymmCipher::KEYLENGTH] = {};
    string uh;
};

// v1 accounts: 65536 AES rounds keyed by the password's 16-byte slices
void prepareKeyV1(const string& password, byte* key);

// v1 login hash: the lower-cased e-mail folded into one block and encrypted
// 16384 times under the password key
string loginHashV1(const string& email, const byte* key);

// v2 accounts: PBKDF2-HMAC-SHA512 over the base64 salt
common::ErrorOr<LoginKey> prepareKeyV2(const string& password, const string& salt);

// account version 1 or 2 (v2 requires a salt)
common::ErrorOr<LoginKey> deriveLoginKey(int version, const string& email,
                                         const string& password, const string& salt);

// AES-ECB over a 16 or 32 byte key
common::ErrorOr<string> unwrapKey(const string& wrapped, SymmCipher& kek);
common::ErrorOr<string> wrapKey(const string& key, SymmCipher& kek);

// decrypted file key, split into its parts
struct MEGAFLOW_API FileKey
{
    byte key[SymmCipher::KEYLENGTH] = {};
    SymmCipher::ctr_iv nonce = 0;
    byte metamac[8] = {};

    // from the 32-byte node key
    static common::ErrorOr<FileKey> fromNodeKey(const string& nodekey);

    // 32-byte node key: (key ^ (nonce || metamac)) || nonce || metamac
    string nodeKey() const;
};

struct MEGAFLOW_API NodeAttributes
{
    string name;
    string fingerprint;
    m_time_t mtime = 0;
    bool hasMtime = false;
};

/**
 * @brief Decrypts a node attribute blob.
 *
 * The blob is AES-CBC (zero IV) over "MEGA{...}" padded with NULs.
 *
 * @param nodekey 16-byte folder key or 32-byte file key.
 * @return CRYPTO_EINVALIDKEY for a key of the wrong size, CRYPTO_EMALFORMED
 *     when the blob is not block aligned or the plaintext is not an
 *     attribute object (which is what a wrong key produces).
 */
common::ErrorOr<NodeAttributes> decryptAttributes(const string& blob, const string& nodekey);

common::ErrorOr<string> encryptAttributes(const NodeAttributes& attrs, const string& nodekey);

// CTR cipher for file content at any offset
class MEGAFLOW_API FileCipher
{
public:
    explicit FileCipher(const FileKey& fk);

    // in place; encrypts plaintext and decrypts ciphertext alike
    void crypt(byte* data, size_t len, m_off_t pos);

    SymmCipher& cipher() { return mCipher; }
    SymmCipher::ctr_iv nonce() const { return mNonce; }

private:
    SymmCipher mCipher;
    SymmCipher::ctr_iv mNonce;
};

// parses "123:0*handle/123:1*handle" into thumbnail and preview handles
void parseFileAttributes(const string& fa, string& thumbnail, string& preview);

} // namespace

#endif
