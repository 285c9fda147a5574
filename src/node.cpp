/**
 * @file node.cpp
 * @brief Classes for accessing local and remote nodes
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
#include "megaflow/node.h"

namespace megaflow {

const char* nodeTypeName(nodetype_t type)
{
    switch (type)
    {
        case FILENODE: return "file";
        case FOLDERNODE: return "folder";
        case ROOTNODE: return "root";
        case INBOXNODE: return "inbox";
        case RUBBISHNODE: return "rubbish";
        case TYPE_UNKNOWN: break;
    }

    return "unknown";
}

const char* nodeAccessName(nodeaccess_t access)
{
    switch (access)
    {
        case ACCESS_OK: return "ok";
        case ACCESS_INVALIDKEY: return "invalid key";
        case ACCESS_ORPHAN: return "orphan";
    }

    return "unknown";
}

string Node::handleB64() const
{
    return Base64::handleToB64(nodehandle, NODEHANDLE);
}

common::ErrorOr<FileKey> Node::fileKey() const
{
    if (!isFile() || access != ACCESS_OK)
    {
        return common::unexpected(Error(TRANSFER_ENOKEY));
    }

    return FileKey::fromNodeKey(nodekey);
}

} // namespace
