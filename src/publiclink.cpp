/**
 * @file publiclink.cpp
 * @brief Public file and folder links
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

#include "megaflow/base64.h"
#include "megaflow/logging.h"
#include "megaflow/publiclink.h"

namespace megaflow {

using common::unexpected;

static bool stripPrefix(string& s, const char* prefix)
{
    size_t len = strlen(prefix);

    if (s.compare(0, len, prefix))
    {
        return false;
    }

    s.erase(0, len);
    return true;
}

common::ErrorOr<PublicLink> parsePublicLink(const string& url)
{
    string rest = url;

    if (!stripPrefix(rest, "https://mega.nz/") && !stripPrefix(rest, "https://mega.co.nz/"))
    {
        LOG_warn << "Unsupported link host";
        return unexpected(Error(SESSION_EBADLINK));
    }

    PublicLink link;
    string keystr;

    if (stripPrefix(rest, "file/") || (link.folder = stripPrefix(rest, "folder/")))
    {
        size_t hash = rest.find('#');
        if (hash == string::npos)
        {
            return unexpected(Error(SESSION_EBADLINK));
        }

        link.id = rest.substr(0, hash);
        keystr = rest.substr(hash + 1);

        // a folder link may carry a path to a subnode after the key
        size_t slash = keystr.find('/');
        if (slash != string::npos)
        {
            keystr.erase(slash);
        }
    }
    else if (stripPrefix(rest, "#!") || (link.folder = stripPrefix(rest, "#F!")))
    {
        size_t sep = rest.find('!');
        if (sep == string::npos)
        {
            return unexpected(Error(SESSION_EBADLINK));
        }

        link.id = rest.substr(0, sep);
        keystr = rest.substr(sep + 1);

        size_t bang = keystr.find('!');
        if (bang != string::npos)
        {
            keystr.erase(bang);
        }
    }
    else
    {
        return unexpected(Error(SESSION_EBADLINK));
    }

    link.ph = Base64::b64ToHandle(link.id, NODEHANDLE);

    if (ISUNDEF(link.ph) || !Base64::atobStrict(keystr, link.key))
    {
        LOG_warn << "Malformed link handle or key";
        return unexpected(Error(SESSION_EBADLINK));
    }

    size_t expected = link.folder ? FOLDERNODEKEYLENGTH : FILENODEKEYLENGTH;
    if (link.key.size() != expected)
    {
        LOG_warn << "Link key has " << link.key.size() << " bytes, expected " << expected;
        return unexpected(Error(SESSION_EBADLINK));
    }

    return link;
}

} // namespace
