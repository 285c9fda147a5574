/**
 * (c) 2019 by Mega Limited, Wellsford, New Zealand
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

#include <gtest/gtest.h>

#include <megaflow/base64.h>
#include <megaflow/session.h>

#include "FakeHttpIO.h"
#include "TestAccount.h"

using namespace megaflow;

namespace mt {

namespace {

const TestAccount& account()
{
    return TestAccount::shared();
}

std::string folderLink()
{
    std::string key(FOLDERNODEKEYLENGTH, '\x05');
    return "https://mega.nz/folder/" + Base64::handleToB64(0x0000010203040506ull, NODEHANDLE)
         + "#" + Base64::btoa(key);
}

} // namespace

TEST(Session, LogsInWithPasswordDerivedHash)
{
    FakeHttpIO http;
    Session session(http, fastNetwork());

    EXPECT_EQ(STATE_UNAUTHENTICATED, session.state());
    account().login(http, session);

    auto sent = http.apiRequests();
    ASSERT_EQ(2u, sent.size());
    EXPECT_NE(std::string::npos, sent[0].body.find("\"a\":\"us0\""));
    EXPECT_NE(std::string::npos, sent[0].body.find("\"user\":\"alice@example.com\""));
    EXPECT_NE(std::string::npos, sent[1].body.find("\"uh\":\"" + account().loginHash() + "\""));
    EXPECT_EQ(std::string::npos, sent[1].body.find("\"mfa\""));

    EXPECT_EQ(account().userHandle(), session.userHandle());
    EXPECT_TRUE(session.hasMasterKey());
    EXPECT_FALSE(session.readOnly());

    http.queueApi("[{\"mstrg\":100,\"cstrg\":40}]");
    auto quota = session.quota();
    ASSERT_TRUE(quota);
    EXPECT_EQ(40, quota->storageUsed);
    EXPECT_EQ(-1, quota->transferMax);

    EXPECT_NE(std::string::npos, http.apiRequests().back().url.find("&sid=" + account().sid()));
}

TEST(Session, SecondFactorChallenge)
{
    FakeHttpIO http;
    Session session(http, fastNetwork());

    http.queueApi(account().preloginReply());
    http.queueApi("[-26]");

    EXPECT_EQ(API_EMFAREQUIRED, session.login(account().email(), account().password()));
    EXPECT_EQ(STATE_CHALLENGED, session.state());

    // nothing but the second factor goes out while challenged
    auto quota = session.quota();
    ASSERT_FALSE(quota);
    EXPECT_EQ(SESSION_ENOTAUTH, quota.error());
    EXPECT_EQ(2u, http.apiPosts());

    EXPECT_EQ(API_EARGS, session.submitSecondFactor(""));

    http.queueApi("[-9]");
    EXPECT_EQ(API_ENOENT, session.submitSecondFactor("000000"));
    EXPECT_EQ(STATE_CHALLENGED, session.state());

    http.queueApi(account().loginReply());
    EXPECT_EQ(API_OK, session.submitSecondFactor("123456"));
    EXPECT_EQ(STATE_AUTHENTICATED, session.state());

    auto sent = http.apiRequests();
    ASSERT_EQ(4u, sent.size());
    EXPECT_NE(std::string::npos, sent[3].body.find("\"mfa\":\"123456\""));
    EXPECT_NE(std::string::npos, sent[3].body.find("\"uh\":\"" + account().loginHash() + "\""));
}

TEST(Session, WrongPasswordFailsAuthentication)
{
    FakeHttpIO http;
    Session session(http, fastNetwork());

    // server-side rejection
    http.queueApi(account().preloginReply());
    http.queueApi("[-9]");
    EXPECT_EQ(API_ENOENT, session.login(account().email(), "wrong"));
    EXPECT_EQ(STATE_UNAUTHENTICATED, session.state());

    // keys that do not open with this password
    http.queueApi(account().preloginReply());
    http.queueApi(account().loginReply());
    EXPECT_EQ(SESSION_EAUTH, session.login(account().email(), "wrong"));
    EXPECT_EQ(STATE_UNAUTHENTICATED, session.state());
    EXPECT_FALSE(session.hasMasterKey());
}

TEST(Session, RejectedSessionIdClosesTheSession)
{
    FakeHttpIO http;
    Session session(http, fastNetwork());
    account().login(http, session);

    http.queueApi("-15");
    auto user = session.userData();
    ASSERT_FALSE(user);
    EXPECT_EQ(API_ESID, user.error());
    EXPECT_EQ(STATE_CLOSED, session.state());
    EXPECT_FALSE(session.hasMasterKey());

    size_t posts = http.apiPosts();
    auto quota = session.quota();
    ASSERT_FALSE(quota);
    EXPECT_EQ(SESSION_ECLOSED, quota.error());
    EXPECT_EQ(posts, http.apiPosts());
}

TEST(Session, LogoutClosesForGood)
{
    FakeHttpIO http;
    Session session(http, fastNetwork());
    account().login(http, session);

    http.queueApi("[0]");
    EXPECT_EQ(API_OK, session.logout());
    EXPECT_EQ(STATE_CLOSED, session.state());
    EXPECT_NE(std::string::npos, http.apiRequests().back().body.find("\"a\":\"sml\""));

    EXPECT_EQ(SESSION_ECLOSED, session.login(account().email(), account().password()));
    EXPECT_EQ(SESSION_ECLOSED, session.move(1, 2));
    EXPECT_EQ(3u, http.apiPosts());
}

TEST(Session, UnauthenticatedSessionsDoNotDispatch)
{
    FakeHttpIO http;
    Session session(http, fastNetwork());

    CommandGetUserData cmd;
    EXPECT_EQ(SESSION_ENOTAUTH, session.dispatch(cmd));
    EXPECT_EQ(SESSION_ENOTAUTH, cmd.error());
    EXPECT_EQ(SESSION_ENOTAUTH, session.remove(1));
    EXPECT_EQ(0u, http.apiPosts());

    auto wrapped = session.wrapWithMasterKey(std::string(16, 'x'));
    ASSERT_FALSE(wrapped);
    EXPECT_EQ(CRYPTO_EINVALIDKEY, wrapped.error());
}

TEST(Session, PublicLinkSessionsAreReadOnly)
{
    FakeHttpIO http;
    Session session(http, fastNetwork());

    ASSERT_EQ(API_OK, session.openPublicLink(folderLink()));
    EXPECT_EQ(STATE_AUTHENTICATED, session.state());
    EXPECT_TRUE(session.readOnly());
    ASSERT_NE(nullptr, session.publicLink());
    EXPECT_TRUE(session.publicLink()->folder);
    EXPECT_TRUE(session.userHandle().empty());
    EXPECT_EQ(0u, http.apiPosts());

    EXPECT_EQ(SESSION_EREADONLY, session.move(1, 2));
    EXPECT_EQ(SESSION_EREADONLY, session.remove(1));

    auto folder = session.createFolder(1, "new");
    ASSERT_FALSE(folder);
    EXPECT_EQ(SESSION_EREADONLY, folder.error());

    auto quota = session.quota();
    ASSERT_FALSE(quota);
    EXPECT_EQ(SESSION_ENOTAUTH, quota.error());
    EXPECT_EQ(0u, http.apiPosts());

    CommandFetchNodes fetch;
    http.queueApi("[{\"f\":[]}]");
    EXPECT_EQ(API_OK, session.dispatch(fetch));
    EXPECT_NE(std::string::npos, http.apiRequests().back().url.find("&n=" + session.publicLink()->id));

    // nothing to tell the server
    EXPECT_EQ(API_OK, session.logout());
    EXPECT_EQ(1u, http.apiPosts());
}

TEST(Session, BadLinkLeavesSessionUntouched)
{
    FakeHttpIO http;
    Session session(http, fastNetwork());

    EXPECT_EQ(SESSION_EBADLINK, session.openPublicLink("https://mega.nz/folder/nokey"));
    EXPECT_EQ(STATE_UNAUTHENTICATED, session.state());
    EXPECT_FALSE(session.readOnly());
}

TEST(Session, CreatesFoldersUnderTheMasterKey)
{
    FakeHttpIO http;
    Session session(http, fastNetwork());
    account().login(http, session);

    const std::string created = "{\"h\":\"" + Base64::handleToB64(0x77ull, NODEHANDLE) + "\",\"p\":\""
                              + Base64::handleToB64(0x11ull, NODEHANDLE) + "\",\"t\":1,\"u\":\""
                              + account().userHandle() + "\"}";
    http.queueApi("[{\"f\":[" + created + "]}]");

    auto folder = session.createFolder(0x11ull, "Photos");
    ASSERT_TRUE(folder);
    EXPECT_EQ(0x77ull, folder->nodehandle);
    EXPECT_EQ(FOLDERNODE, folder->type);

    const std::string body = http.apiRequests().back().body;
    EXPECT_NE(std::string::npos, body.find("\"a\":\"p\""));
    EXPECT_NE(std::string::npos, body.find("\"t\":\"" + Base64::handleToB64(0x11ull, NODEHANDLE) + "\""));
    EXPECT_NE(std::string::npos, body.find("\"i\":\""));

    std::string key = randomKey(FILENODEKEYLENGTH);
    auto wrapped = session.wrapWithMasterKey(key);
    ASSERT_TRUE(wrapped);
    EXPECT_EQ(account().wrap(key), *wrapped);
    EXPECT_EQ(key, *session.unwrapWithMasterKey(*wrapped));
}

} // mt
