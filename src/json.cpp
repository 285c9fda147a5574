/**
 * @file json.cpp
 * @brief Linear non-strict JSON scanner
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

#include <cinttypes>
#include <cstdio>
#include <cstdlib>

#include "megaflow/base64.h"
#include "megaflow/json.h"
#include "megaflow/logging.h"

namespace megaflow {

namespace {

int hexval(const int c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void appendUtf8(string& out, uint32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// four hex digits at s[i], or -1
long hex4(const string& s, size_t i)
{
    if (i + 4 > s.size())
    {
        return -1;
    }

    long v = 0;
    for (size_t k = 0; k < 4; k++)
    {
        int h = hexval(s[i + k]);
        if (h < 0)
        {
            return -1;
        }
        v = (v << 4) | h;
    }
    return v;
}

} // namespace

// store array or object in string s
// reposition after object
bool JSON::storeobject(string* s)
{
    int depth[2] = { 0 };
    const char* ptr;
    bool escaped = false;

    while (*(const signed char*)pos > 0 && *pos <= ' ')
    {
        pos++;
    }

    if (!*pos || *pos == ']' || *pos == '}')
    {
        return false;
    }

    if (*pos == ',' || *pos == ':')
    {
        pos++;
    }

    ptr = pos;

    for (;;)
    {
        if ((*ptr == '[') || (*ptr == '{'))
        {
            depth[*ptr == '[']++;
        }
        else if ((*ptr == ']') || (*ptr == '}'))
        {
            depth[*ptr == ']']--;
            if (depth[*ptr == ']'] < 0)
            {
                LOG_err << "Parse error (])";
                return false;
            }
        }
        else if (*ptr == '"')
        {
            ptr++;

            while (*ptr && (escaped || *ptr != '"'))
            {
                escaped = *ptr == '\\' && !escaped;
                ptr++;
            }

            if (!*ptr)
            {
                LOG_err << "Parse error (\")";
                return false;
            }
        }
        else if ((*ptr >= '0' && *ptr <= '9') || *ptr == '-' || *ptr == '.')
        {
            ptr++;

            while ((*ptr >= '0' && *ptr <= '9') || *ptr == '.' || *ptr == 'e' || *ptr == 'E'
                   || *ptr == '+' || *ptr == '-')
            {
                ptr++;
            }

            ptr--;
        }
        else if (*ptr >= 'a' && *ptr <= 'z')
        {
            // true, false, null
            while (ptr[1] >= 'a' && ptr[1] <= 'z')
            {
                ptr++;
            }
        }
        else if (*ptr != ':' && *ptr != ',' && !(*ptr > 0 && *ptr <= ' '))
        {
            LOG_err << "Parse error (unexpected " << (*ptr ? *ptr : '0') << ")";
            return false;
        }

        ptr++;

        if (!depth[0] && !depth[1])
        {
            if (s)
            {
                if (*pos == '"')
                {
                    s->assign(pos + 1, static_cast<size_t>(ptr - pos - 2));
                }
                else
                {
                    s->assign(pos, static_cast<size_t>(ptr - pos));
                }
            }

            pos = ptr;
            return true;
        }
    }
}

bool JSON::storestring(string* s)
{
    if (*pos == ',' || *pos == ':')
    {
        pos++;
    }

    if (*pos != '"')
    {
        // not a string: consume it anyway
        if (s)
        {
            s->clear();
        }
        storeobject();
        return false;
    }

    if (!storeobject(s))
    {
        return false;
    }

    if (s)
    {
        unescape(s);
    }
    return true;
}

bool JSON::isnumeric()
{
    if (*pos == ',' || *pos == ':')
    {
        pos++;
    }

    const char* ptr = pos;

    if (*ptr == '-')
    {
        ptr++;
    }

    return *ptr >= '0' && *ptr <= '9';
}

// pos points to [,]"name":...
// returns nameid and repositons pos after :
// no unescaping supported
nameid JSON::getnameid()
{
    const char* ptr = pos;
    nameid id = 0;

    if (*ptr == ',' || *ptr == ':')
    {
        ptr++;
    }

    if (*ptr++ == '"')
    {
        while (*ptr && *ptr != '"')
        {
            id = (id << 8) + static_cast<nameid>(*ptr++);
        }

        if (!*ptr)
        {
            LOG_err << "Parse error (getnameid)";
            pos = ptr;
            return EOO;
        }

        pos = ptr + 1;

        if (*pos == ':' || *pos == ',')
        {
            pos++;
        }
    }

    return id;
}

string JSON::getname()
{
    const char* ptr = pos;
    string name;

    if (*ptr == ',' || *ptr == ':')
    {
        ptr++;
    }

    if (*ptr++ == '"')
    {
        while (*ptr && *ptr != '"')
        {
            name += *ptr;
            ptr++;
        }

        pos = *ptr ? ptr + 1 : ptr;

        if (*pos == ':')
        {
            pos++;
        }
    }

    return name;
}

// base64 handle of exactly size bytes, UNDEF otherwise
handle JSON::gethandle(int size)
{
    if (*pos == ',' || *pos == ':')
    {
        pos++;
    }

    if (*pos != '"')
    {
        storeobject();
        return UNDEF;
    }

    // handles are opaque byte strings, never compared numerically
    byte buf[9] = { 0 };
    int len = Base64::atob(pos + 1, buf, sizeof buf);
    storeobject();

    return len == size ? MemAccess::get<handle>((const char*)buf) : UNDEF;
}

// decode integer
m_off_t JSON::getint()
{
    const char* ptr;

    if (*pos == ':' || *pos == ',')
    {
        pos++;
    }

    ptr = pos;

    if (*ptr == '"')
    {
        ptr++;
    }

    if ((*ptr < '0' || *ptr > '9') && *ptr != '-')
    {
        LOG_err << "Parse error (getint)";
        storeobject();
        return -1;
    }

    m_off_t r = static_cast<m_off_t>(atoll(ptr));
    storeobject();

    return r;
}

// try to to enter array
bool JSON::enterarray()
{
    if (*pos == ',' || *pos == ':')
    {
        pos++;
    }

    if (*pos == '[')
    {
        pos++;
        return true;
    }

    return false;
}

// leave array (must be at end of array)
bool JSON::leavearray()
{
    if (*pos == ']')
    {
        pos++;
        return true;
    }

    LOG_err << "Parse error (leavearray)";
    return false;
}

// try to enter object
bool JSON::enterobject()
{
    if (*pos == ',' || *pos == ':')
    {
        pos++;
    }

    if (*pos == '{')
    {
        pos++;
        return true;
    }

    return false;
}

// leave object (skip remainder)
bool JSON::leaveobject()
{
    for (; ;)
    {
        if (*pos == ':' || *pos == ',' || *pos == ' ')
        {
            pos++;
        }
        else if (*pos == '"'
                || (*pos >= '0' && *pos <= '9')
                || (*pos >= 'a' && *pos <= 'z')
                || *pos == '-'
                || *pos == '['
                || *pos == '{')
        {
            if (!storeobject())
            {
                break;
            }
        }
        else
        {
            break;
        }
    }

    if (*pos == '}')
    {
        pos++;
        return true;
    }

    LOG_err << "Parse error (leaveobject)";
    return false;
}

// unescape JSON string (non-strict); \uXXXX sequences become UTF-8
void JSON::unescape(string* s)
{
    string out;
    out.reserve(s->size());

    for (size_t i = 0; i < s->size(); i++)
    {
        char c = (*s)[i];

        if (c != '\\' || i + 1 >= s->size())
        {
            out.push_back(c);
            continue;
        }

        char e = (*s)[++i];
        switch (e)
        {
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 't': out.push_back('\t'); break;
            case 'u':
            {
                long cp = hex4(*s, i + 1);
                if (cp < 0)
                {
                    out.push_back(e);
                    break;
                }
                i += 4;

                // surrogate pair
                if (cp >= 0xD800 && cp <= 0xDBFF
                        && i + 2 < s->size() && (*s)[i + 1] == '\\' && (*s)[i + 2] == 'u')
                {
                    long lo = hex4(*s, i + 3);
                    if (lo >= 0xDC00 && lo <= 0xDFFF)
                    {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        i += 6;
                    }
                }

                appendUtf8(out, static_cast<uint32_t>(cp));
                break;
            }
            default:
                out.push_back(e);
        }
    }

    s->swap(out);
}

bool JSON::isNumericError(error &e)
{
    const char* ptr = pos;
    if (*ptr == ',')
    {
        ptr++;
    }

    const char* auxPtr = ptr;
    if (*auxPtr != '-' && *auxPtr != '0')
    {
        e = API_OK;
        return false;
    }

    if (*auxPtr == '-')
    {
        auxPtr++;
        if (!(*auxPtr >= '1' && *auxPtr <= '9'))
        {
            e = API_OK;
            return false;
        }
    }

    e = static_cast<error>(atoll(ptr));
    pos = ptr;
    storeobject();

    return true;
}

bool JSON::atend() const
{
    const char* ptr = pos;
    while (*ptr && (*ptr == ' ' || *ptr == '\n' || *ptr == '\r' || *ptr == '\t'))
    {
        ptr++;
    }
    return !*ptr;
}

void JSONWriter::addcomma()
{
    if (!mJson.empty() && mJson.back() != '[' && mJson.back() != '{')
    {
        mJson.push_back(',');
    }
}

void JSONWriter::cmd(const char* cmd)
{
    addcomma();
    mJson.append("\"a\":\"").append(cmd).append("\"");
}

void JSONWriter::arg(const char* name, const string& value, int quotes)
{
    arg(name, value.c_str(), quotes);
}

void JSONWriter::arg(const char* name, const char* value, int quotes)
{
    addcomma();
    mJson.append("\"").append(name).append(quotes ? "\":\"" : "\":").append(value);

    if (quotes)
    {
        mJson.push_back('"');
    }
}

void JSONWriter::arg(const char* name, handle h, int len)
{
    arg(name, reinterpret_cast<const byte*>(&h), len);
}

void JSONWriter::arg(const char* name, const byte* value, int len)
{
    string b64(static_cast<size_t>(len * 4 / 3 + 4), '\0');
    b64.resize(static_cast<size_t>(Base64::btoa(value, len, &b64[0])));
    arg(name, b64);
}

void JSONWriter::arg(const char* name, m_off_t n)
{
    char buf[32];
    snprintf(buf, sizeof buf, "%" PRId64, n);
    arg(name, buf, 0);
}

void JSONWriter::arg_stringWithEscapes(const char* name, const string& value, int quotes)
{
    arg(name, escape(value.data(), value.size()), quotes);
}

void JSONWriter::beginarray(const char* name)
{
    addcomma();
    mJson.append("\"").append(name).append("\":[");
}

void JSONWriter::endarray()
{
    mJson.push_back(']');
}

void JSONWriter::beginobject()
{
    addcomma();
    mJson.push_back('{');
}

void JSONWriter::endobject()
{
    mJson.push_back('}');
}

void JSONWriter::element(const string& data)
{
    addcomma();
    mJson.append("\"").append(data).append("\"");
}

const string& JSONWriter::getstring() const
{
    return mJson;
}

string JSONWriter::escape(const char* data, size_t length)
{
    string result;
    result.reserve(length);

    for (size_t i = 0; i < length; i++)
    {
        unsigned char c = static_cast<unsigned char>(data[i]);

        switch (c)
        {
        case '"':
            result.append("\\\"");
            break;
        case '\\':
            result.append("\\\\");
            break;
        case '\n':
            result.append("\\n");
            break;
        case '\r':
            result.append("\\r");
            break;
        case '\t':
            result.append("\\t");
            break;
        default:
            if (c < 0x20)
            {
                char buf[8];
                snprintf(buf, sizeof buf, "\\u%04x", c);
                result.append(buf);
            }
            else
            {
                // multibyte UTF-8 passes through unchanged
                result.push_back(static_cast<char>(c));
            }
            break;
        }
    }

    return result;
}

} // namespace
