/**
 * @file nodetree.cpp
 * @brief In-memory forest of remote nodes
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
#include <set>

#include "megaflow/base64.h"
#include "megaflow/logging.h"
#include "megaflow/nodetree.h"

namespace megaflow {

using common::ErrorOr;
using common::unexpected;

// base64 of a 16-byte AES-wrapped key; RSA-wrapped keys are longer
static const size_t MAX_SYMMETRIC_KEY_B64 = 43;

static const char* rootName(nodetype_t type)
{
    switch (type)
    {
        case ROOTNODE: return "Cloud Drive";
        case INBOXNODE: return "Inbox";
        case RUBBISHNODE: return "Rubbish Bin";
        default: return "";
    }
}

static Node fromRecord(const NodeRecord& r)
{
    Node n;

    n.nodehandle = r.nodehandle;
    n.parenthandle = r.parenthandle;
    n.type = r.type;
    n.owner = r.owner;
    n.ctime = r.ctime;
    n.size = r.type == FILENODE ? r.size : -1;
    n.keystring = r.keystring;
    n.attrstring = r.attrstring;

    if (!r.fileattrstring.empty())
    {
        parseFileAttributes(r.fileattrstring, n.thumbnail, n.preview);
    }

    return n;
}

Error NodeTree::fetch(Session& session)
{
    const PublicLink* link = session.publicLink();

    if (link && !link->folder)
    {
        // a file link lists nothing: its only node comes from `g`
        CommandGetFile cmd(link->ph, true);
        Error e = session.dispatch(cmd);

        if (!e.ok())
        {
            LOG_err << "Unable to fetch the linked file: " << e;
            return e;
        }

        Node n;
        n.nodehandle = link->ph;
        n.type = FILENODE;
        n.size = cmd.size;
        n.attrstring = cmd.attrstring;
        n.shareroot = true;

        string blob;
        auto attrs = Base64::atobStrict(cmd.attrstring, blob)
                   ? decryptAttributes(blob, link->key)
                   : ErrorOr<NodeAttributes>(unexpected(Error(CRYPTO_EMALFORMED)));

        if (attrs)
        {
            n.nodekey = link->key;
            n.attrs = std::move(*attrs);
        }
        else
        {
            LOG_warn << "Linked file attributes could not be decrypted: " << attrs.error();
            n.access = ACCESS_INVALIDKEY;
        }

        std::unique_lock<std::shared_mutex> lock(mMutex);
        mNodes.clear();
        mRoots.clear();
        mShareKeys.clear();
        mNodes[n.nodehandle] = std::move(n);
        mRoots.push_back(link->ph);
        return API_OK;
    }

    CommandFetchNodes cmd;
    Error e = session.dispatch(cmd);

    if (!e.ok())
    {
        LOG_err << "Unable to fetch nodes: " << e;
        return e;
    }

    load(session, cmd.nodes, cmd.sharekeys);
    return API_OK;
}

void NodeTree::load(Session& session, const vector<NodeRecord>& records, const vector<ShareKeyRecord>& sharekeys)
{
    const PublicLink* link = session.publicLink();
    bool publicFolder = link && link->folder;

    std::unique_lock<std::shared_mutex> lock(mMutex);

    mNodes.clear();
    mRoots.clear();
    mShareKeys.clear();

    for (const auto& sk : sharekeys)
    {
        string wrapped;
        if (!Base64::atobStrict(sk.key, wrapped) || wrapped.size() != FOLDERNODEKEYLENGTH)
        {
            LOG_debug << "Skipping share key for " << Base64::handleToB64(sk.h, NODEHANDLE);
            continue;
        }

        auto key = session.unwrapWithMasterKey(wrapped);
        if (key)
        {
            mShareKeys[sk.h] = *key;
        }
    }

    std::set<handle> listed;
    vector<const NodeRecord*> pending;

    for (const auto& r : records)
    {
        if (!listed.insert(r.nodehandle).second)
        {
            LOG_warn << "Duplicate node " << Base64::handleToB64(r.nodehandle, NODEHANDLE);
            continue;
        }

        mNodes[r.nodehandle] = fromRecord(r);
        pending.push_back(&r);
    }

    std::set<handle> processed;
    std::set<handle> roots;

    // parents first; nodes whose parent is not known yet wait for a later pass
    for (bool progress = true; progress && !pending.empty(); )
    {
        progress = false;
        vector<const NodeRecord*> deferred;

        for (const NodeRecord* r : pending)
        {
            Node& n = mNodes[r->nodehandle];

            bool unlisted = !listed.count(r->parenthandle);
            bool root = n.type >= ROOTNODE
                     || !r->shareuser.empty()
                     || (unlisted && (!r->sharekey.empty() || publicFolder));

            const Node* parent = nullptr;

            if (!root)
            {
                if (!processed.count(r->parenthandle))
                {
                    deferred.push_back(r);
                    continue;
                }

                parent = &mNodes[r->parenthandle];
            }

            if (!r->sharekey.empty() && r->sharekey.size() <= MAX_SYMMETRIC_KEY_B64)
            {
                string wrapped;
                if (Base64::atobStrict(r->sharekey, wrapped))
                {
                    auto key = session.unwrapWithMasterKey(wrapped);
                    if (key && key->size() == FOLDERNODEKEYLENGTH)
                    {
                        mShareKeys[r->nodehandle] = *key;
                    }
                }
            }

            n.shareroot = root && n.type < ROOTNODE;
            decrypt(session, n, parent);

            processed.insert(n.nodehandle);
            progress = true;

            if (root)
            {
                roots.insert(n.nodehandle);
            }
        }

        pending.swap(deferred);
    }

    for (const NodeRecord* r : pending)
    {
        LOG_warn << "Orphan node " << Base64::handleToB64(r->nodehandle, NODEHANDLE)
                 << " (parent " << Base64::handleToB64(r->parenthandle, NODEHANDLE) << ")";
        mNodes[r->nodehandle].access = ACCESS_ORPHAN;
    }

    // children and roots in listing order
    for (const auto& r : records)
    {
        Node& n = mNodes[r.nodehandle];

        if (roots.count(n.nodehandle))
        {
            if (std::find(mRoots.begin(), mRoots.end(), n.nodehandle) == mRoots.end())
            {
                mRoots.push_back(n.nodehandle);
            }
        }
        else if (processed.count(r.nodehandle))
        {
            vector<handle>& siblings = mNodes[n.parenthandle].children;
            if (std::find(siblings.begin(), siblings.end(), n.nodehandle) == siblings.end())
            {
                siblings.push_back(n.nodehandle);
            }
        }
    }

    LOG_info << "Loaded " << mNodes.size() << " nodes, " << mRoots.size() << " roots, "
             << pending.size() << " orphans";
}

void NodeTree::decrypt(Session& session, Node& n, const Node* parent)
{
    if (n.type >= ROOTNODE)
    {
        n.attrs.name = rootName(n.type);
        n.access = ACCESS_OK;
        return;
    }

    if (parent && parent->access != ACCESS_OK)
    {
        n.access = ACCESS_INVALIDKEY;
        return;
    }

    auto key = unwrapNodeKey(session, n);
    if (!key)
    {
        LOG_debug << "No usable key for " << n.handleB64();
        n.access = ACCESS_INVALIDKEY;
        return;
    }

    string blob;
    if (!Base64::atobStrict(n.attrstring, blob))
    {
        n.access = ACCESS_INVALIDKEY;
        return;
    }

    auto attrs = decryptAttributes(blob, *key);
    if (!attrs)
    {
        LOG_debug << "Attributes of " << n.handleB64() << " could not be decrypted: " << attrs.error();
        n.access = ACCESS_INVALIDKEY;
        return;
    }

    n.nodekey = std::move(*key);
    n.attrs = std::move(*attrs);
    n.access = ACCESS_OK;
}

ErrorOr<string> NodeTree::unwrapNodeKey(Session& session, const Node& n)
{
    const PublicLink* link = session.publicLink();
    size_t expected = n.isFile() ? FILENODEKEYLENGTH : FOLDERNODEKEYLENGTH;
    string first;

    // "owner:key/owner:key..."
    for (size_t start = 0; start < n.keystring.size(); )
    {
        size_t end = n.keystring.find('/', start);
        if (end == string::npos)
        {
            end = n.keystring.size();
        }

        string entry = n.keystring.substr(start, end - start);
        start = end + 1;

        size_t colon = entry.find(':');
        if (colon == string::npos)
        {
            continue;
        }

        string owner = entry.substr(0, colon);
        string keyb64 = entry.substr(colon + 1);
        string wrapped;

        if (keyb64.size() > MAX_SYMMETRIC_KEY_B64 || !Base64::atobStrict(keyb64, wrapped) || wrapped.size() != expected)
        {
            continue;
        }

        if (first.empty())
        {
            first = wrapped;
        }

        if (!session.userHandle().empty() && owner == session.userHandle())
        {
            auto key = session.unwrapWithMasterKey(wrapped);
            if (key)
            {
                return key;
            }
            continue;
        }

        handle sh = Base64::b64ToHandle(owner, NODEHANDLE);
        auto it = ISUNDEF(sh) ? mShareKeys.end() : mShareKeys.find(sh);

        if (it != mShareKeys.end())
        {
            SymmCipher sharekey((const byte*)it->second.data());
            return unwrapKey(wrapped, sharekey);
        }
    }

    if (link && link->folder && !first.empty())
    {
        SymmCipher linkkey((const byte*)link->key.data());
        return unwrapKey(first, linkkey);
    }

    return unexpected(Error(API_EKEY));
}

Node* NodeTree::lookup(handle h)
{
    auto it = mNodes.find(h);
    return it == mNodes.end() ? nullptr : &it->second;
}

const Node* NodeTree::lookup(handle h) const
{
    auto it = mNodes.find(h);
    return it == mNodes.end() ? nullptr : &it->second;
}

Error NodeTree::lookupError(handle h) const
{
    const Node* n = lookup(h);

    if (!n)
    {
        return TREE_ENOTFOUND;
    }

    return n->access == ACCESS_ORPHAN ? TREE_EORPHAN : API_OK;
}

ErrorOr<Node> NodeTree::node(handle h) const
{
    std::shared_lock<std::shared_mutex> lock(mMutex);

    Error e = lookupError(h);
    if (!e.ok())
    {
        return unexpected(e);
    }

    return *lookup(h);
}

ErrorOr<vector<Node>> NodeTree::children(handle h) const
{
    std::shared_lock<std::shared_mutex> lock(mMutex);

    Error e = lookupError(h);
    if (!e.ok())
    {
        return unexpected(e);
    }

    vector<Node> result;
    for (handle c : lookup(h)->children)
    {
        result.push_back(*lookup(c));
    }
    return result;
}

vector<Node> NodeTree::roots() const
{
    std::shared_lock<std::shared_mutex> lock(mMutex);

    vector<Node> result;
    for (handle h : mRoots)
    {
        result.push_back(*lookup(h));
    }
    return result;
}

ErrorOr<Node> NodeTree::resolvePath(handle root, const string& path) const
{
    std::shared_lock<std::shared_mutex> lock(mMutex);

    Error e = lookupError(root);
    if (!e.ok())
    {
        return unexpected(e);
    }

    const Node* n = lookup(root);

    for (size_t start = 0; start <= path.size(); )
    {
        size_t end = path.find('/', start);
        if (end == string::npos)
        {
            end = path.size();
        }

        string segment = path.substr(start, end - start);
        start = end + 1;

        if (segment.empty())
        {
            continue;
        }

        if (!n->isContainer())
        {
            return unexpected(Error(TREE_ENOTFOLDER));
        }

        const Node* next = nullptr;
        for (handle c : n->children)
        {
            const Node* child = lookup(c);
            if (child->access == ACCESS_OK && child->name() == segment)
            {
                next = child;
                break;
            }
        }

        if (!next)
        {
            return unexpected(Error(TREE_ENOTFOUND));
        }

        n = next;
    }

    return *n;
}

ErrorOr<string> NodeTree::pathOf(handle h) const
{
    std::shared_lock<std::shared_mutex> lock(mMutex);

    Error e = lookupError(h);
    if (!e.ok())
    {
        return unexpected(e);
    }

    vector<const string*> names;
    const Node* n = lookup(h);

    // bounded: a well-formed forest has no path longer than its node count
    for (size_t depth = 0; depth < mNodes.size(); depth++)
    {
        if (std::find(mRoots.begin(), mRoots.end(), n->nodehandle) != mRoots.end())
        {
            string path;
            for (auto it = names.rbegin(); it != names.rend(); ++it)
            {
                path.append("/").append(**it);
            }
            return path.empty() ? string("/") : path;
        }

        names.push_back(&n->name());

        n = lookup(n->parenthandle);
        if (!n)
        {
            break;
        }
    }

    return unexpected(Error(TREE_EORPHAN));
}

Error NodeTree::walk(handle root, const Visitor& visitor) const
{
    std::shared_lock<std::shared_mutex> lock(mMutex);

    Error e = lookupError(root);
    if (!e.ok())
    {
        return e;
    }

    walk(*lookup(root), string(), visitor);
    return API_OK;
}

void NodeTree::walk(const Node& n, const string& path, const Visitor& visitor) const
{
    visitor(n, path);

    for (handle c : n.children)
    {
        const Node* child = lookup(c);
        walk(*child, path.empty() ? child->name() : path + "/" + child->name(), visitor);
    }
}

bool NodeTree::isAncestor(handle ancestor, handle h) const
{
    const Node* n = lookup(h);

    for (size_t depth = 0; n && depth <= mNodes.size(); depth++)
    {
        if (n->parenthandle == ancestor)
        {
            return true;
        }

        n = lookup(n->parenthandle);
    }

    return false;
}

void NodeTree::detach(Node& n)
{
    if (Node* parent = lookup(n.parenthandle))
    {
        auto& siblings = parent->children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), n.nodehandle), siblings.end());
    }

    mRoots.erase(std::remove(mRoots.begin(), mRoots.end(), n.nodehandle), mRoots.end());
}

void NodeTree::erase(handle h)
{
    Node* n = lookup(h);
    if (!n)
    {
        return;
    }

    vector<handle> children = n->children;
    for (handle c : children)
    {
        erase(c);
    }

    mNodes.erase(h);
}

ErrorOr<handle> NodeTree::createFolder(Session& session, handle parent, const string& name)
{
    {
        std::shared_lock<std::shared_mutex> lock(mMutex);

        Error e = lookupError(parent);
        if (!e.ok())
        {
            return unexpected(e);
        }

        if (!lookup(parent)->isContainer())
        {
            return unexpected(Error(TREE_ENOTFOLDER));
        }
    }

    auto record = session.createFolder(parent, name);
    if (!record)
    {
        return unexpected(record.error());
    }

    Error e = add(session, *record);
    if (!e.ok())
    {
        return unexpected(e);
    }

    return record->nodehandle;
}

Error NodeTree::add(Session& session, const NodeRecord& record)
{
    std::unique_lock<std::shared_mutex> lock(mMutex);

    Node* parent = lookup(record.parenthandle);
    if (!parent || parent->access == ACCESS_ORPHAN)
    {
        LOG_warn << "New node " << Base64::handleToB64(record.nodehandle, NODEHANDLE) << " has no known parent";
        return TREE_ENOTFOUND;
    }

    Node n = fromRecord(record);
    decrypt(session, n, parent);

    parent->children.push_back(n.nodehandle);
    mNodes[n.nodehandle] = std::move(n);
    return API_OK;
}

Error NodeTree::rename(Session& session, handle h, const string& name)
{
    string nodekey;
    NodeAttributes attrs;

    {
        std::shared_lock<std::shared_mutex> lock(mMutex);

        Error e = lookupError(h);
        if (!e.ok())
        {
            return e;
        }

        const Node* n = lookup(h);
        if (n->access != ACCESS_OK || n->nodekey.empty())
        {
            return API_EKEY;
        }

        nodekey = n->nodekey;
        attrs = n->attrs;
    }

    Error e = session.rename(h, nodekey, attrs, name);
    if (!e.ok())
    {
        return e;
    }

    std::unique_lock<std::shared_mutex> lock(mMutex);
    if (Node* n = lookup(h))
    {
        n->attrs.name = name;
    }
    return API_OK;
}

Error NodeTree::move(Session& session, handle h, handle target)
{
    {
        std::shared_lock<std::shared_mutex> lock(mMutex);

        Error e = lookupError(h);
        if (!e.ok())
        {
            return e;
        }

        e = lookupError(target);
        if (!e.ok())
        {
            return e;
        }

        if (!lookup(target)->isContainer())
        {
            return TREE_ENOTFOLDER;
        }

        if (h == target || isAncestor(h, target))
        {
            LOG_warn << "Refusing to move " << Base64::handleToB64(h, NODEHANDLE) << " into its own subtree";
            return TREE_ECYCLIC;
        }
    }

    Error e = session.move(h, target);
    if (!e.ok())
    {
        return e;
    }

    std::unique_lock<std::shared_mutex> lock(mMutex);

    Node* n = lookup(h);
    Node* t = lookup(target);
    if (!n || !t)
    {
        return TREE_ENOTFOUND;
    }

    detach(*n);
    n->parenthandle = target;
    t->children.push_back(h);
    return API_OK;
}

Error NodeTree::remove(Session& session, handle h)
{
    {
        std::shared_lock<std::shared_mutex> lock(mMutex);

        Error e = lookupError(h);
        if (!e.ok())
        {
            return e;
        }
    }

    Error e = session.remove(h);
    if (!e.ok())
    {
        return e;
    }

    std::unique_lock<std::shared_mutex> lock(mMutex);

    if (Node* n = lookup(h))
    {
        detach(*n);
        erase(h);
    }
    return API_OK;
}

size_t NodeTree::size() const
{
    std::shared_lock<std::shared_mutex> lock(mMutex);
    return mNodes.size();
}

} // namespace
