/**
 * @file session.cpp
 * @brief Account and public-link sessions
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
#include <cctype>

#include "megaflow/base64.h"
#include "megaflow/logging.h"
#include "megaflow/session.h"

namespace megaflow {

using common::ErrorOr;
using common::unexpected;

const char* sessionStateName(sessionstate_t state)
{
    switch (state)
    {
        case STATE_UNAUTHENTICATED: return "Unauthenticated";
        case STATE_CHALLENGED: return "Challenged";
        case STATE_AUTHENTICATED: return "Authenticated";
        case STATE_CLOSED: return "Closed";
    }

    return "Unknown";
}

Session::Session(HttpIO& http, const NetworkSettings& settings, const string& apiurl)
    : mDispatcher(http, settings, apiurl)
{
}

Session::~Session()
{
    close();
}

sessionstate_t Session::state() const
{
    std::lock_guard<std::mutex> g(mMutex);
    return mState;
}

void Session::setState(sessionstate_t state)
{
    std::lock_guard<std::mutex> g(mMutex);

    if (mState != state)
    {
        LOG_info << "Session state " << sessionStateName(mState) << " -> " << sessionStateName(state);
        mState = state;
    }
}

// wipes key material; no further dispatch is possible
void Session::close()
{
    {
        std::lock_guard<std::mutex> g(mKeyMutex);

        byte zero[SymmCipher::KEYLENGTH] = {};
        mMasterKey.setkey(zero);
        mHasMasterKey = false;
    }

    memset(mLoginKey.key, 0, sizeof mLoginKey.key);
    mLoginKey.uh.clear();
    mSid.clear();
    mDispatcher.setSid(string());

    setState(STATE_CLOSED);
}

Error Session::login(const string& email, const string& password, const string& pin)
{
    switch (state())
    {
        case STATE_UNAUTHENTICATED:
            break;
        case STATE_CLOSED:
            return SESSION_ECLOSED;
        default:
            LOG_warn << "Login attempted on a session in state " << sessionStateName(state());
            return API_EACCESS;
    }

    mEmail = email;
    std::transform(mEmail.begin(), mEmail.end(), mEmail.begin(),
                   [](unsigned char c) { return static_cast<char>(tolower(c)); });

    CommandPrelogin prelogin(mEmail);
    Error e = mDispatcher.dispatch({ &prelogin }).front();

    if (!e.ok())
    {
        LOG_err << "Prelogin failed: " << e;
        return e;
    }

    auto lk = deriveLoginKey(prelogin.version, mEmail, password, prelogin.salt);
    if (!lk)
    {
        LOG_err << "Unable to derive the login key: " << lk.error();
        return SESSION_EAUTH;
    }

    mLoginKey = std::move(*lk);

    return sendLogin(pin);
}

Error Session::submitSecondFactor(const string& pin)
{
    sessionstate_t s = state();

    if (s == STATE_CLOSED)
    {
        return SESSION_ECLOSED;
    }

    if (s != STATE_CHALLENGED)
    {
        LOG_warn << "No second factor pending";
        return SESSION_ENOTAUTH;
    }

    if (pin.empty())
    {
        return API_EARGS;
    }

    return sendLogin(pin);
}

Error Session::sendLogin(const string& pin)
{
    CommandLogin cmd(mEmail, mLoginKey.uh, pin);
    Error e = mDispatcher.dispatch({ &cmd }).front();

    if (e == API_EMFAREQUIRED)
    {
        LOG_info << "Second factor required";
        setState(STATE_CHALLENGED);
        return e;
    }

    if (!e.ok())
    {
        // a rejected pin leaves the challenge pending
        LOG_err << "Login failed: " << e;
        return e;
    }

    return finishLogin(cmd);
}

Error Session::finishLogin(const CommandLogin& cmd)
{
    SymmCipher loginkey(mLoginKey.key);

    string k;
    if (!Base64::atobStrict(cmd.k, k) || k.size() != SymmCipher::KEYLENGTH)
    {
        LOG_err << "Invalid master key";
        return SESSION_EAUTH;
    }

    auto masterkey = unwrapKey(k, loginkey);
    if (!masterkey)
    {
        LOG_err << "Unable to unwrap the master key";
        return SESSION_EAUTH;
    }

    SymmCipher master;
    master.setkey((const byte*)masterkey->data());

    string privk;
    if (!Base64::atobStrict(cmd.privk, privk) || privk.empty() || privk.size() % SymmCipher::BLOCKSIZE)
    {
        LOG_err << "Invalid private key";
        return SESSION_EAUTH;
    }

    master.ecb_decrypt((byte*)&privk[0], privk.size());

    AsymmCipher rsa;
    if (!rsa.setkey((const byte*)privk.data(), privk.size()))
    {
        LOG_err << "Private key could not be decoded (wrong password?)";
        return SESSION_EAUTH;
    }

    string csid;
    byte sidbuf[SIDLEN];
    if (!Base64::atobStrict(cmd.csid, csid)
     || !rsa.decrypt((const byte*)csid.data(), csid.size(), sidbuf, sizeof sidbuf))
    {
        LOG_err << "Session challenge could not be decrypted";
        return SESSION_EAUTH;
    }

    // the decrypted challenge embeds the user handle
    if (string((const char*)sidbuf + 16, 11) != cmd.u)
    {
        LOG_err << "Session challenge does not match the user handle";
        return SESSION_EAUTH;
    }

    {
        std::lock_guard<std::mutex> g(mKeyMutex);
        mMasterKey = master;
        mHasMasterKey = true;
    }

    mUserHandle = cmd.u;
    mSid = Base64::btoa(string((const char*)sidbuf, sizeof sidbuf));
    mDispatcher.setSid(mSid);

    memset(mLoginKey.key, 0, sizeof mLoginKey.key);
    mLoginKey.uh.clear();

    setState(STATE_AUTHENTICATED);
    return API_OK;
}

Error Session::openPublicLink(const string& url)
{
    if (state() != STATE_UNAUTHENTICATED)
    {
        return state() == STATE_CLOSED ? SESSION_ECLOSED : API_EACCESS;
    }

    auto link = parsePublicLink(url);
    if (!link)
    {
        return link.error();
    }

    mPublicLink.reset(new PublicLink(std::move(*link)));

    if (mPublicLink->folder)
    {
        mDispatcher.setFolderLink(mPublicLink->id);
    }

    LOG_info << "Opened public " << (mPublicLink->folder ? "folder" : "file") << " link " << mPublicLink->id;
    setState(STATE_AUTHENTICATED);
    return API_OK;
}

vector<Error> Session::dispatch(const vector<Command*>& commands)
{
    Error gate = API_OK;

    switch (state())
    {
        case STATE_AUTHENTICATED:
            break;
        case STATE_CLOSED:
            gate = SESSION_ECLOSED;
            break;
        default:
            gate = SESSION_ENOTAUTH;
    }

    if (!gate.ok())
    {
        for (auto* c : commands)
        {
            c->fail(gate);
        }
        return vector<Error>(commands.size(), gate);
    }

    Error batch;
    vector<Error> results = mDispatcher.dispatch(commands, &batch);

    if (batch == API_ESID)
    {
        LOG_err << "Session rejected by the server";
        close();
    }

    return results;
}

Error Session::dispatch(Command& command)
{
    return dispatch(vector<Command*>{ &command }).front();
}

ErrorOr<Quota> Session::quota()
{
    if (readOnly())
    {
        return unexpected(Error(SESSION_ENOTAUTH));
    }

    CommandGetUserQuota cmd;
    Error e = dispatch(cmd);

    if (!e.ok())
    {
        return unexpected(e);
    }

    Quota q;
    q.storageUsed = cmd.storageUsed;
    q.storageMax = cmd.storageMax;
    q.transferUsed = cmd.transferUsed;
    q.transferMax = cmd.transferMax;
    return q;
}

ErrorOr<UserInfo> Session::userData()
{
    if (readOnly())
    {
        return unexpected(Error(SESSION_ENOTAUTH));
    }

    CommandGetUserData cmd;
    Error e = dispatch(cmd);

    if (!e.ok())
    {
        return unexpected(e);
    }

    UserInfo info;
    info.userhandle = cmd.userhandle;
    info.email = cmd.email;
    info.name = cmd.name;
    return info;
}

Error Session::checkWritable() const
{
    switch (state())
    {
        case STATE_AUTHENTICATED:
            break;
        case STATE_CLOSED:
            return SESSION_ECLOSED;
        default:
            return SESSION_ENOTAUTH;
    }

    return readOnly() ? SESSION_EREADONLY : API_OK;
}

ErrorOr<NodeRecord> Session::createFolder(handle parent, const string& name)
{
    Error e = checkWritable();
    if (!e.ok())
    {
        return unexpected(e);
    }

    byte key[FOLDERNODEKEYLENGTH];
    randomBytes(key, sizeof key);
    string folderkey((const char*)key, sizeof key);

    NodeAttributes attrs;
    attrs.name = name;

    auto attrstring = encryptAttributes(attrs, folderkey);
    if (!attrstring)
    {
        return unexpected(attrstring.error());
    }

    auto wrapped = wrapWithMasterKey(folderkey);
    if (!wrapped)
    {
        return unexpected(wrapped.error());
    }

    NewNode nn;
    nn.type = FOLDERNODE;
    nn.attrstring = std::move(*attrstring);
    nn.nodekey = std::move(*wrapped);

    return putNode(parent, nn);
}

ErrorOr<NodeRecord> Session::putNode(handle parent, const NewNode& newnode)
{
    Error e = checkWritable();
    if (!e.ok())
    {
        return unexpected(e);
    }

    CommandPutNodes cmd(parent, { newnode }, newRequestId());
    e = dispatch(cmd);

    if (!e.ok())
    {
        LOG_err << "Node creation failed: " << e;
        return unexpected(e);
    }

    if (cmd.created.empty())
    {
        LOG_err << "Node creation returned no node";
        return unexpected(Error(API_EINTERNAL));
    }

    return cmd.created.front();
}

Error Session::rename(handle h, const string& nodekey, const NodeAttributes& attrs, const string& newname)
{
    Error e = checkWritable();
    if (!e.ok())
    {
        return e;
    }

    NodeAttributes updated = attrs;
    updated.name = newname;

    auto attrstring = encryptAttributes(updated, nodekey);
    if (!attrstring)
    {
        return attrstring.error();
    }

    CommandSetAttr cmd(h, *attrstring, string(), newRequestId());
    return dispatch(cmd);
}

Error Session::move(handle h, handle target)
{
    Error e = checkWritable();
    if (!e.ok())
    {
        return e;
    }

    CommandMoveNode cmd(h, target, newRequestId());
    return dispatch(cmd);
}

Error Session::remove(handle h)
{
    Error e = checkWritable();
    if (!e.ok())
    {
        return e;
    }

    CommandDelNode cmd(h, newRequestId());
    return dispatch(cmd);
}

Error Session::logout()
{
    Error e = API_OK;

    if (state() == STATE_AUTHENTICATED && !readOnly())
    {
        CommandLogout cmd;
        e = dispatch(cmd);

        if (!e.ok())
        {
            LOG_warn << "Logout command failed: " << e;
        }
    }

    close();
    return e;
}

ErrorOr<string> Session::wrapWithMasterKey(const string& key)
{
    std::lock_guard<std::mutex> g(mKeyMutex);

    if (!mHasMasterKey)
    {
        return unexpected(Error(CRYPTO_EINVALIDKEY));
    }

    return wrapKey(key, mMasterKey);
}

ErrorOr<string> Session::unwrapWithMasterKey(const string& wrapped)
{
    std::lock_guard<std::mutex> g(mKeyMutex);

    if (!mHasMasterKey)
    {
        return unexpected(Error(CRYPTO_EINVALIDKEY));
    }

    return unwrapKey(wrapped, mMasterKey);
}

bool Session::hasMasterKey() const
{
    std::lock_guard<std::mutex> g(mKeyMutex);
    return mHasMasterKey;
}

string Session::newRequestId()
{
    std::lock_guard<std::mutex> g(mRngMutex);
    return Command::newRequestId(mRng);
}

void Session::randomBytes(byte* buf, size_t len)
{
    std::lock_guard<std::mutex> g(mRngMutex);
    mRng.genblock(buf, len);
}

} // namespace
