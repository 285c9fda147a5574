/**
 * @file megaflow/publiclink.h
 * @brief Public file and folder links
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

#ifndef MEGAFLOW_PUBLICLINK_H
#define MEGAFLOW_PUBLICLINK_H 1

#include "common/error_or.h"
#include "error.h"
#include "types.h"

namespace megaflow {

struct MEGAFLOW_API PublicLink
{
    bool folder = false;

    // public handle, as sent with `p` (files) or `n` (folders)
    handle ph = UNDEF;
    string id;

    // raw key: 32 bytes for files, 16 for folders
    string key;
};

/**
 * @brief Parses a public link.
 *
 * Accepted forms (host mega.nz or mega.co.nz):
 *  - https://mega.nz/file/<id>#<key>
 *  - https://mega.nz/folder/<id>#<key>[/...]
 *  - https://mega.nz/#!<id>!<key>
 *  - https://mega.nz/#F!<id>!<key>[!...]
 *
 * @return SESSION_EBADLINK for anything else, or when the key has the
 *     wrong size for the link type.
 */
common::ErrorOr<PublicLink> parsePublicLink(const string& url);

} // namespace

#endif
