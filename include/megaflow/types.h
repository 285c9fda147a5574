/**
 * @file megaflow/types.h
 * @brief Basic types and constants
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

#ifndef MEGAFLOW_TYPES_H
#define MEGAFLOW_TYPES_H 1

#ifdef _MSC_VER
#if MEGAFLOW_LINKED_AS_SHARED_LIBRARY
 #define MEGAFLOW_API __declspec(dllimport)
#elif MEGAFLOW_CREATE_SHARED_LIBRARY
 #define MEGAFLOW_API __declspec(dllexport)
#endif
#endif

#ifndef MEGAFLOW_API
 #define MEGAFLOW_API
#endif

#include <cstdint>
#include <cstring>
#include <map>
#include <memory>
#include <string>
#include <vector>

// signed 64-bit generic offset
typedef int64_t m_off_t;

// unix timestamp
typedef int64_t m_time_t;

namespace megaflow {

// within ::megaflow namespace, byte is unsigned char (avoids ambiguity with std::byte)
using byte = unsigned char;

using std::string;
using std::map;
using std::vector;
using std::pair;
using std::unique_ptr;
using std::shared_ptr;

// node/user handles are 8-11 base64 characters, case sensitive, and thus fit
// in a 64-bit int
typedef uint64_t handle;

#define ISUNDEF(h) (!(~(h)))
#define UNDEF (~(handle)0)

// node handles are 6 bytes, user handles 8
static const int NODEHANDLE = 6;
static const int USERHANDLE = 8;

// length of the session id derived from the login challenge
static const int SIDLEN = 43;

// wrapped key sizes
static const int FILENODEKEYLENGTH = 32;
static const int FOLDERNODEKEYLENGTH = 16;

// node kinds, as sent by the server
typedef enum { TYPE_UNKNOWN = -1, FILENODE = 0, FOLDERNODE, ROOTNODE, INBOXNODE, RUBBISHNODE } nodetype_t;

const char* nodeTypeName(nodetype_t type);

// unaligned memory access helpers
class MemAccess
{
public:
    template<typename T>
    static T get(const char* ptr)
    {
        T val;
        memcpy(&val, ptr, sizeof(T));
        return val;
    }

    template<typename T>
    static void set(byte* ptr, T val)
    {
        memcpy(ptr, &val, sizeof val);
    }
};

} // namespace

#endif
