/**
 * @file base64.cpp
 * @brief modified base64 encoding/decoding
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

#include <cstring>

#include "megaflow/base64.h"

namespace megaflow {

namespace {

const char ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

} // namespace

// modified base64 conversion (no trailing '=' and '-_' instead of '+/')
byte Base64::to64(byte c)
{
    return static_cast<byte>(ALPHABET[c & 63]);
}

// standard '+/' are accepted on input as well
byte Base64::from64(byte c)
{
    if (c == '+')
    {
        return 62;
    }

    if (c == '/')
    {
        return 63;
    }

    const char* hit = c ? strchr(ALPHABET, c) : nullptr;
    return hit ? static_cast<byte>(hit - ALPHABET) : 255;
}

// decodes up to the first character outside the alphabet
int Base64::atob(const char* a, byte* b, int blen)
{
    unsigned acc = 0;
    int bits = 0;
    int p = 0;

    for (; p < blen; a++)
    {
        byte v = from64(static_cast<byte>(*a));
        if (v == 255)
        {
            break;
        }

        acc = (acc << 6) | v;
        bits += 6;

        if (bits >= 8)
        {
            bits -= 8;
            b[p++] = static_cast<byte>(acc >> bits);
        }
    }

    return p;
}

int Base64::atob(const string& in, string& out)
{
    out.resize(in.size() * 3 / 4 + 3);
    out.resize(static_cast<size_t>(atob(in.c_str(), reinterpret_cast<byte*>(&out[0]), int(out.size()))));
    return int(out.size());
}

string Base64::atob(const string& in)
{
    string out;
    atob(in, out);
    return out;
}

bool Base64::atobStrict(const string& in, string& out)
{
    // a single leftover character cannot carry a whole byte
    if (in.size() % 4 == 1)
    {
        return false;
    }

    for (char c : in)
    {
        if (!c || !strchr(ALPHABET, c))
        {
            return false;
        }
    }

    atob(in, out);
    return out.size() == in.size() * 3 / 4;
}

// a receives 4 chars per 3 bytes plus a terminating NUL
int Base64::btoa(const byte* b, int blen, char* a)
{
    unsigned acc = 0;
    int bits = 0;
    int p = 0;

    for (int i = 0; i < blen; i++)
    {
        acc = (acc << 8) | b[i];
        bits += 8;

        while (bits >= 6)
        {
            bits -= 6;
            a[p++] = static_cast<char>(to64(static_cast<byte>(acc >> bits)));
        }
    }

    if (bits)
    {
        a[p++] = static_cast<char>(to64(static_cast<byte>(acc << (6 - bits))));
    }

    a[p] = 0;
    return p;
}

int Base64::btoa(const string& in, string& out)
{
    out.resize(in.size() * 4 / 3 + 4);
    out.resize(static_cast<size_t>(btoa(reinterpret_cast<const byte*>(in.data()), int(in.size()), &out[0])));
    return int(out.size());
}

string Base64::btoa(const string& in)
{
    string out;
    btoa(in, out);
    return out;
}

string Base64::handleToB64(handle h, int len)
{
    char buf[16];
    int n = btoa(reinterpret_cast<const byte*>(&h), len, buf);
    return string(buf, static_cast<size_t>(n));
}

handle Base64::b64ToHandle(const string& b64, int len)
{
    byte buf[sizeof(handle) + 1] = { 0 };

    if (atob(b64.c_str(), buf, sizeof buf) != len)
    {
        return UNDEF;
    }

    handle h = 0;
    memcpy(&h, buf, static_cast<size_t>(len));
    return h;
}

} // namespace
