/**
 * @file megaflow/json.h
 * @brief Linear non-strict JSON scanner
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

#ifndef MEGAFLOW_JSON_H
#define MEGAFLOW_JSON_H 1

#include <string_view>

#include "error.h"
#include "types.h"

namespace megaflow {

// numeric representation of a JSON member name (up to 8 chars)
using nameid = uint64_t;

// end of object
static const nameid EOO = 0;

constexpr nameid makeNameid(std::string_view name)
{
    nameid id = 0;
    for (size_t n = 0; n < name.size() && n < 8; ++n)
    {
        id = (id << 8) + static_cast<nameid>(name[n]);
    }
    return id;
}

// linear non-strict JSON scanner
struct MEGAFLOW_API JSON
{
    explicit JSON(const string& data)
      : pos(data.c_str())
    {
    }

    explicit JSON(const char* data)
      : pos(data)
    {
    }

    const char* pos;

    bool isnumeric();

    m_off_t getint();
    inline int getint32() { return int(getint()); }

    // pos points to [,]"name":... returns the nameid and repositions after :
    nameid getnameid();
    string getname();

    // node handles are 6 bytes, user handles 8
    handle gethandle(int = NODEHANDLE);

    bool enterarray();
    bool leavearray();

    bool enterobject();
    bool leaveobject();

    // stores the next value verbatim (strings without their quotes) and skips it
    bool storeobject(string* = NULL);

    // stores the next string value with escapes resolved
    bool storestring(string*);

    static void unescape(string*);

    // Only advance the pointer if it's an error (0, -1, -2, -3, ...)
    bool isNumericError(error& e);

    // true at the end of the input
    bool atend() const;
};

// builds the body of a request object; the enclosing braces are the caller's
class MEGAFLOW_API JSONWriter
{
public:
    void cmd(const char*);

    void arg(const char*, const string&, int = 1);
    void arg(const char*, const char*, int = 1);
    void arg(const char*, handle, int);
    void arg(const char*, const byte*, int);
    void arg(const char*, m_off_t);

    // quotes and backslashes escaped, for free-form text such as file names
    void arg_stringWithEscapes(const char*, const string&, int = 1);

    void beginarray(const char*);
    void endarray();
    void beginobject();
    void endobject();

    // string member of the enclosing array
    void element(const string&);

    const string& getstring() const;

    static string escape(const char* data, size_t length);

private:
    // separator unless the last thing written opened a container
    void addcomma();

    string mJson;
};

} // namespace

#endif
