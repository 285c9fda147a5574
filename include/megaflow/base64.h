/**
 * @file megaflow/base64.h
 * @brief modified base64 encoding/decoding
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

#ifndef MEGAFLOW_BASE64_H
#define MEGAFLOW_BASE64_H 1

#include "types.h"

namespace megaflow {
// modified base64 encoding/decoding (unpadded, -_ instead of +/)
class MEGAFLOW_API Base64
{
    static byte to64(byte);
    static byte from64(byte);

public:
    static int btoa(const string&, string&);
    static string btoa(const string &in);
    static int btoa(const byte*, int, char*);
    static int atob(const string&, string&);
    static string atob(const string&);
    static int atob(const char*, byte*, int);

    // decodes only if every character belongs to the alphabet (no padding)
    static bool atobStrict(const string& in, string& out);

    // node (6 byte) and user (8 byte) handles
    static string handleToB64(handle h, int len);
    static handle b64ToHandle(const string& b64, int len);
};

} // namespace

#endif
