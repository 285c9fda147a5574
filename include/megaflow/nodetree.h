/**
 * @file megaflow/nodetree.h
 * @brief In-memory forest of remote nodes
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

#ifndef MEGAFLOW_NODETREE_H
#define MEGAFLOW_NODETREE_H 1

#include <functional>
#include <shared_mutex>

#include "command.h"
#include "node.h"
#include "session.h"

namespace megaflow {

/**
 * @brief The account's (or a public link's) nodes, keyed by handle.
 *
 * Readers may run concurrently; mutations take the lock exclusively and
 * only touch the forest once the server has accepted them.
 */
class MEGAFLOW_API NodeTree
{
public:
    // callback for walk(): node and its path relative to the walk's root
    typedef std::function<void(const Node&, const string&)> Visitor;

    // replaces the forest with a fresh listing
    Error fetch(Session& session);

    /**
     * @brief Builds the forest from listing records.
     *
     * Nodes are decrypted parents first. Nodes whose parent never
     * resolves (including members of a parent cycle) are kept as orphans,
     * outside every child list.
     */
    void load(Session& session, const vector<NodeRecord>& records, const vector<ShareKeyRecord>& sharekeys);

    // TREE_ENOTFOUND or TREE_EORPHAN on failure
    common::ErrorOr<Node> node(handle h) const;
    common::ErrorOr<vector<Node>> children(handle h) const;
    vector<Node> roots() const;

    // first child by name per segment, starting at `root`
    common::ErrorOr<Node> resolvePath(handle root, const string& path) const;

    // "/a/b" relative to the node's top-level root, "/" for a root
    common::ErrorOr<string> pathOf(handle h) const;

    // depth-first, parents before children; the visitor must not mutate the tree
    Error walk(handle root, const Visitor& visitor) const;

    common::ErrorOr<handle> createFolder(Session& session, handle parent, const string& name);
    Error rename(Session& session, handle h, const string& name);
    Error move(Session& session, handle h, handle target);
    Error remove(Session& session, handle h);

    // adds a node created elsewhere (completed upload) under its parent
    Error add(Session& session, const NodeRecord& record);

    size_t size() const;

private:
    // all lookups below expect mMutex to be held

    Node* lookup(handle h);
    const Node* lookup(handle h) const;
    Error lookupError(handle h) const;

    // decrypts one node whose parent has been processed
    void decrypt(Session& session, Node& n, const Node* parent);

    common::ErrorOr<string> unwrapNodeKey(Session& session, const Node& n);

    bool isAncestor(handle ancestor, handle h) const;

    void detach(Node& n);
    void erase(handle h);

    void walk(const Node& n, const string& path, const Visitor& visitor) const;

    mutable std::shared_mutex mMutex;

    map<handle, Node> mNodes;
    vector<handle> mRoots;

    // decrypted share keys, by share root handle
    map<handle, string> mShareKeys;
};

} // namespace

#endif
