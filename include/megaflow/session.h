/**
 * @file megaflow/session.h
 * @brief Account and public-link sessions
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

#ifndef MEGAFLOW_SESSION_H
#define MEGAFLOW_SESSION_H 1

#include <mutex>

#include "command.h"
#include "common/error_or.h"
#include "filecrypto.h"
#include "publiclink.h"
#include "request.h"

namespace megaflow {

typedef enum
{
    STATE_UNAUTHENTICATED = 0,
    STATE_CHALLENGED,           // second factor pending
    STATE_AUTHENTICATED,
    STATE_CLOSED
} sessionstate_t;

const char* sessionStateName(sessionstate_t state);

struct MEGAFLOW_API Quota
{
    m_off_t storageUsed = 0;
    m_off_t storageMax = 0;

    // -1 if not reported
    m_off_t transferUsed = -1;
    m_off_t transferMax = -1;
};

struct MEGAFLOW_API UserInfo
{
    string userhandle;
    string email;
    string name;
};

/**
 * @brief Authentication state and key material of one account or public link.
 *
 * Login goes Unauthenticated -> (Challenged ->) Authenticated. Logout, or the
 * server rejecting the session id, moves to Closed, after which every
 * dispatch fails with SESSION_ECLOSED.
 *
 * Public-link sessions are Authenticated from the start, read-only, and
 * never talk to the server to get there.
 */
class MEGAFLOW_API Session
{
public:
    Session(HttpIO& http, const NetworkSettings& settings, const string& apiurl = APIURL);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // API_EMFAREQUIRED when a second factor is needed and `pin` is empty
    Error login(const string& email, const string& password, const string& pin = string());

    Error submitSecondFactor(const string& pin);

    // read-only session on a public file or folder link
    Error openPublicLink(const string& url);

    vector<Error> dispatch(const vector<Command*>& commands);
    Error dispatch(Command& command);

    common::ErrorOr<Quota> quota();
    common::ErrorOr<UserInfo> userData();

    // node mutations; each is sent at most once
    common::ErrorOr<NodeRecord> createFolder(handle parent, const string& name);
    common::ErrorOr<NodeRecord> putNode(handle parent, const NewNode& newnode);
    Error rename(handle h, const string& nodekey, const NodeAttributes& attrs, const string& newname);
    Error move(handle h, handle target);
    Error remove(handle h);

    Error logout();

    sessionstate_t state() const;

    bool readOnly() const { return mPublicLink != nullptr; }

    // link the session was opened on, null for account sessions
    const PublicLink* publicLink() const { return mPublicLink.get(); }

    // key material under the account's master key; CRYPTO_EINVALIDKEY
    // when there is no master key (not logged in, or a public session)
    common::ErrorOr<string> wrapWithMasterKey(const string& key);
    common::ErrorOr<string> unwrapWithMasterKey(const string& wrapped);
    bool hasMasterKey() const;

    // base64 user handle, empty for public sessions
    const string& userHandle() const { return mUserHandle; }

    string newRequestId();

    void randomBytes(byte* buf, size_t len);

    const NetworkSettings& settings() const { return mDispatcher.settings(); }

    RequestDispatcher& dispatcher() { return mDispatcher; }

private:
    Error sendLogin(const string& pin);
    Error finishLogin(const CommandLogin& cmd);
    Error checkWritable() const;
    void setState(sessionstate_t state);
    void close();

    RequestDispatcher mDispatcher;

    mutable std::mutex mMutex;
    sessionstate_t mState = STATE_UNAUTHENTICATED;

    string mEmail;
    LoginKey mLoginKey;

    mutable std::mutex mKeyMutex;
    SymmCipher mMasterKey;
    bool mHasMasterKey = false;

    string mUserHandle;
    string mSid;

    unique_ptr<PublicLink> mPublicLink;

    std::mutex mRngMutex;
    PrnGen mRng;
};

} // namespace

#endif
