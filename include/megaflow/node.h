/**
 * @file megaflow/node.h
 * @brief Classes for accessing local and remote nodes
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

#ifndef MEGAFLOW_NODE_H
#define MEGAFLOW_NODE_H 1

#include "common/error_or.h"
#include "filecrypto.h"
#include "types.h"

namespace megaflow {

typedef enum
{
    ACCESS_OK = 0,
    ACCESS_INVALIDKEY,      // key or attributes did not decrypt, or an ancestor's didn't
    ACCESS_ORPHAN           // parent chain never resolved
} nodeaccess_t;

const char* nodeAccessName(nodeaccess_t access);

// filesystem node
struct MEGAFLOW_API Node
{
    handle nodehandle = UNDEF;
    handle parenthandle = UNDEF;

    nodetype_t type = TYPE_UNKNOWN;

    string owner;
    m_time_t ctime = 0;

    // files only
    m_off_t size = -1;

    // as listed by the server
    string keystring;
    string attrstring;

    // decrypted node key: 32 bytes for files, 16 for folders
    string nodekey;

    NodeAttributes attrs;

    // file attribute handles, if any
    string thumbnail;
    string preview;

    nodeaccess_t access = ACCESS_OK;

    // top of an incoming share or of a public folder
    bool shareroot = false;

    // in listing order
    vector<handle> children;

    const string& name() const { return attrs.name; }

    bool isFile() const { return type == FILENODE; }

    // anything that may have children
    bool isContainer() const { return type > FILENODE; }

    string handleB64() const;

    // key, nonce and meta-MAC of a file node
    common::ErrorOr<FileKey> fileKey() const;
};

} // namespace

#endif
