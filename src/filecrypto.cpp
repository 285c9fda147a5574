/**
 * @file filecrypto.cpp
 * @brief Login key derivation, node key wrapping and attribute encryption
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
#include <cctype>

#include "megaflow/base64.h"
#include "megaflow/common/error_or.h"
#include "megaflow/filecrypto.h"
#include "megaflow/json.h"
#include "megaflow/logging.h"

namespace megaflow {

using common::ErrorOr;
using common::unexpected;

void prepareKeyV1(const string& password, byte* key)
{
    size_t t = password.size();
    size_t n = (t + 15) / 16;
    vector<SymmCipher> keys(n);

    for (size_t i = 0; i < n; i++)
    {
        size_t valid = (i != (n - 1)) ? SymmCipher::BLOCKSIZE : (t - SymmCipher::BLOCKSIZE * i);
        memcpy(key, password.data() + i * SymmCipher::BLOCKSIZE, valid);
        memset(key + valid, 0, SymmCipher::BLOCKSIZE - valid);
        keys[i].setkey(key);
    }

    memcpy(key, "\x93\xC4\x67\xE3\x7D\xB0\xC7\xA4\xD1\xBE\x3F\x81\x01\x52\xCB\x56", SymmCipher::BLOCKSIZE);

    for (int r = 65536; r--; )
    {
        for (size_t i = 0; i < n; i++)
        {
            keys[i].ecb_encrypt(key);
        }
    }
}

string loginHashV1(const string& email, const byte* key)
{
    string s = email;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(tolower(c)); });

    byte hash[SymmCipher::BLOCKSIZE] = {};

    for (size_t i = 0; i < s.size(); i++)
    {
        hash[i % SymmCipher::BLOCKSIZE] ^= static_cast<byte>(s[i]);
    }

    SymmCipher cipher(key);

    for (int t = 16384; t--; )
    {
        cipher.ecb_encrypt(hash);
    }

    memcpy(hash + 4, hash + 8, 4);

    return Base64::handleToB64(MemAccess::get<handle>((const char*)hash), USERHANDLE);
}

ErrorOr<LoginKey> prepareKeyV2(const string& password, const string& salt)
{
    string bsalt;

    if (!Base64::atobStrict(salt, bsalt) || bsalt.empty())
    {
        LOG_err << "Invalid login salt";
        return unexpected(Error(CRYPTO_EMALFORMED));
    }

    byte derived[2 * SymmCipher::KEYLENGTH];

    PBKDF2_HMAC_SHA512 pbkdf2;
    if (!pbkdf2.deriveKey(derived, sizeof derived,
                          (const byte*)password.data(), password.size(),
                          (const byte*)bsalt.data(), bsalt.size(),
                          100000))
    {
        return unexpected(Error(CRYPTO_EINVALIDKEY));
    }

    LoginKey lk;
    memcpy(lk.key, derived, SymmCipher::KEYLENGTH);

    string hash((const char*)derived + SymmCipher::KEYLENGTH, SymmCipher::KEYLENGTH);
    lk.uh = Base64::btoa(hash);

    return lk;
}

ErrorOr<LoginKey> deriveLoginKey(int version, const string& email,
                                 const string& password, const string& salt)
{
    if (version == 1)
    {
        LoginKey lk;
        prepareKeyV1(password, lk.key);
        lk.uh = loginHashV1(email, lk.key);
        return lk;
    }

    if (version == 2)
    {
        if (salt.empty())
        {
            LOG_err << "Account version 2 without a salt";
            return unexpected(Error(API_EINTERNAL));
        }
        return prepareKeyV2(password, salt);
    }

    LOG_err << "Unknown account version " << version;
    return unexpected(Error(API_EINTERNAL));
}

ErrorOr<string> unwrapKey(const string& wrapped, SymmCipher& kek)
{
    if (wrapped.size() != FILENODEKEYLENGTH && wrapped.size() != FOLDERNODEKEYLENGTH)
    {
        return unexpected(Error(CRYPTO_EINVALIDKEY));
    }

    string key = wrapped;
    kek.ecb_decrypt((byte*)&key[0], key.size());
    return key;
}

ErrorOr<string> wrapKey(const string& key, SymmCipher& kek)
{
    if (key.size() != FILENODEKEYLENGTH && key.size() != FOLDERNODEKEYLENGTH)
    {
        return unexpected(Error(CRYPTO_EINVALIDKEY));
    }

    string wrapped = key;
    kek.ecb_encrypt((byte*)&wrapped[0], nullptr, wrapped.size());
    return wrapped;
}

ErrorOr<FileKey> FileKey::fromNodeKey(const string& nodekey)
{
    if (nodekey.size() != FILENODEKEYLENGTH)
    {
        return unexpected(Error(CRYPTO_EINVALIDKEY));
    }

    const byte* k = (const byte*)nodekey.data();

    FileKey fk;
    memcpy(fk.key, k, SymmCipher::KEYLENGTH);
    SymmCipher::xorblock(k + SymmCipher::KEYLENGTH, fk.key);
    fk.nonce = MemAccess::get<SymmCipher::ctr_iv>((const char*)k + SymmCipher::KEYLENGTH);
    memcpy(fk.metamac, k + SymmCipher::KEYLENGTH + sizeof(SymmCipher::ctr_iv), sizeof fk.metamac);

    return fk;
}

string FileKey::nodeKey() const
{
    byte filekey[FILENODEKEYLENGTH];

    memcpy(filekey, key, SymmCipher::KEYLENGTH);
    MemAccess::set<SymmCipher::ctr_iv>(filekey + SymmCipher::KEYLENGTH, nonce);
    memcpy(filekey + SymmCipher::KEYLENGTH + sizeof nonce, metamac, sizeof metamac);
    SymmCipher::xorblock(filekey + SymmCipher::KEYLENGTH, filekey);

    return string((const char*)filekey, sizeof filekey);
}

ErrorOr<NodeAttributes> decryptAttributes(const string& blob, const string& nodekey)
{
    SymmCipher cipher;

    if (!cipher.setkey(&nodekey))
    {
        return unexpected(Error(CRYPTO_EINVALIDKEY));
    }

    if (blob.empty() || blob.size() % SymmCipher::BLOCKSIZE)
    {
        return unexpected(Error(CRYPTO_EMALFORMED));
    }

    string plain = blob;
    if (!cipher.cbc_decrypt((byte*)&plain[0], plain.size()))
    {
        return unexpected(Error(CRYPTO_EMALFORMED));
    }

    if (plain.compare(0, 5, "MEGA{"))
    {
        return unexpected(Error(CRYPTO_EMALFORMED));
    }

    // strip the NUL padding
    plain.resize(strnlen(plain.data(), plain.size()));

    NodeAttributes attrs;
    JSON json(plain.c_str() + 4);

    if (!json.enterobject())
    {
        return unexpected(Error(CRYPTO_EMALFORMED));
    }

    for (;;)
    {
        switch (json.getnameid())
        {
            case makeNameid("n"):
                json.storestring(&attrs.name);
                break;

            case makeNameid("c"):
                json.storestring(&attrs.fingerprint);
                break;

            case makeNameid("t"):
                if (json.isnumeric())
                {
                    attrs.mtime = json.getint();
                    attrs.hasMtime = true;
                }
                else
                {
                    json.storeobject();
                }
                break;

            case EOO:
                if (*json.pos != '}')
                {
                    return unexpected(Error(CRYPTO_EMALFORMED));
                }
                return attrs;

            default:
                if (!json.storeobject())
                {
                    return unexpected(Error(CRYPTO_EMALFORMED));
                }
        }
    }
}

ErrorOr<string> encryptAttributes(const NodeAttributes& attrs, const string& nodekey)
{
    SymmCipher cipher;

    if (!cipher.setkey(&nodekey))
    {
        return unexpected(Error(CRYPTO_EINVALIDKEY));
    }

    JSONWriter jw;
    jw.beginobject();
    jw.arg_stringWithEscapes("n", attrs.name);
    if (!attrs.fingerprint.empty())
    {
        jw.arg_stringWithEscapes("c", attrs.fingerprint);
    }
    if (attrs.hasMtime)
    {
        jw.arg("t", attrs.mtime);
    }
    jw.endobject();

    string plain = "MEGA" + jw.getstring();
    plain.resize((plain.size() + SymmCipher::BLOCKSIZE - 1) & -SymmCipher::BLOCKSIZE, '\0');

    if (!cipher.cbc_encrypt((byte*)&plain[0], plain.size()))
    {
        return unexpected(Error(CRYPTO_EINVALIDKEY));
    }

    return plain;
}

FileCipher::FileCipher(const FileKey& fk)
    : mCipher(fk.key)
    , mNonce(fk.nonce)
{
}

void FileCipher::crypt(byte* data, size_t len, m_off_t pos)
{
    mCipher.ctr_crypt(data, len, pos, mNonce);
}

void parseFileAttributes(const string& fa, string& thumbnail, string& preview)
{
    size_t p = 0;

    while (p <= fa.size())
    {
        size_t e = fa.find('/', p);
        if (e == string::npos)
        {
            e = fa.size();
        }

        string item = fa.substr(p, e - p);
        size_t colon = item.find(':');
        size_t star = item.find('*');

        if (colon != string::npos && star != string::npos && star > colon)
        {
            string type = item.substr(colon + 1, star - colon - 1);
            if (type == "0")
            {
                thumbnail = item.substr(star + 1);
            }
            else if (type == "1")
            {
                preview = item.substr(star + 1);
            }
        }

        p = e + 1;
    }
}

} // namespace
