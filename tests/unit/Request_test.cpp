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

#include <megaflow/request.h>

#include "FakeHttpIO.h"

using namespace megaflow;

namespace mt {

TEST(RequestDispatcher, BatchesCommandsAndDemultiplexesReplies)
{
    FakeHttpIO http;
    RequestDispatcher dispatcher(http, fastNetwork());

    CommandGetUserQuota quota;
    CommandGetFile file(0x123456789abcull, false);

    http.queueApi("[{\"mstrg\":1000,\"cstrg\":250,\"mxfer\":50,\"caxfer\":5},-9]");

    Error batch = API_EINTERNAL;
    auto results = dispatcher.dispatch({&quota, &file}, &batch);

    ASSERT_EQ(1u, http.apiPosts());
    ASSERT_EQ(2u, results.size());
    EXPECT_EQ(API_OK, batch);
    EXPECT_EQ(API_OK, results[0]);
    EXPECT_EQ(API_ENOENT, results[1]);

    EXPECT_EQ(1000, quota.storageMax);
    EXPECT_EQ(250, quota.storageUsed);
    EXPECT_EQ(50, quota.transferMax);
    EXPECT_EQ(5, quota.transferUsed);

    const std::string body = http.apiRequests().front().body;
    EXPECT_EQ('[', body.front());
    EXPECT_NE(std::string::npos, body.find("{\"a\":\"uq\",\"strg\":1,\"xfer\":1}"));
    EXPECT_NE(std::string::npos, body.find("\"a\":\"g\""));
    EXPECT_LT(body.find("\"uq\""), body.find("\"g\""));
}

TEST(RequestDispatcher, BatchLevelErrorFailsEveryCommand)
{
    FakeHttpIO http;
    RequestDispatcher dispatcher(http, fastNetwork());

    CommandGetUserQuota quota;
    CommandGetUserData user;

    http.queueApi("-15");

    Error batch = API_OK;
    auto results = dispatcher.dispatch({&quota, &user}, &batch);

    EXPECT_EQ(API_ESID, batch);
    EXPECT_EQ(API_ESID, results[0]);
    EXPECT_EQ(API_ESID, results[1]);
    EXPECT_EQ(1u, dispatcher.dispatches());
}

TEST(RequestDispatcher, ResendsOnlyTheCommandsThatFailedTransiently)
{
    FakeHttpIO http;
    RequestDispatcher dispatcher(http, fastNetwork());

    CommandGetUserQuota quota;
    CommandGetUserData user;

    http.queueApi("[-3,{\"u\":\"AAAAAAAAAAA\",\"email\":\"a@b.c\"}]");
    http.queueApi("[{\"mstrg\":10,\"cstrg\":1}]");

    auto results = dispatcher.dispatch({&quota, &user});

    EXPECT_EQ(API_OK, results[0]);
    EXPECT_EQ(API_OK, results[1]);
    EXPECT_EQ("a@b.c", user.email);
    EXPECT_EQ(10, quota.storageMax);

    auto sent = http.apiRequests();
    ASSERT_EQ(2u, sent.size());
    EXPECT_NE(std::string::npos, sent[0].body.find("\"ug\""));
    EXPECT_EQ(std::string::npos, sent[1].body.find("\"ug\""));
    EXPECT_NE(std::string::npos, sent[1].body.find("\"uq\""));
}

TEST(RequestDispatcher, RetriesTransportFailuresAndHttpErrors)
{
    FakeHttpIO http;
    RequestDispatcher dispatcher(http, fastNetwork());

    CommandGetUserData user;

    http.queueApiFailure(TRANSPORT_ECONNECT);
    http.queueApi("", 503);
    http.queueApi("[{\"u\":\"AAAAAAAAAAA\"}]");

    auto results = dispatcher.dispatch({&user});

    EXPECT_EQ(API_OK, results[0]);
    EXPECT_EQ(3u, dispatcher.dispatches());
    EXPECT_EQ(0u, http.pendingApiReplies());
}

TEST(RequestDispatcher, GivesUpAfterTheRetryLimit)
{
    FakeHttpIO http;
    RequestDispatcher dispatcher(http, fastNetwork(2));

    CommandGetUserData user;

    http.queueApi("-3");
    http.queueApi("-3");
    http.queueApi("-3");

    Error batch = API_OK;
    auto results = dispatcher.dispatch({&user}, &batch);

    EXPECT_EQ(API_EAGAIN, results[0]);
    EXPECT_EQ(API_EAGAIN, batch);
    EXPECT_EQ(3u, http.apiPosts());
}

TEST(RequestDispatcher, NeverResendsMutations)
{
    FakeHttpIO http;
    RequestDispatcher dispatcher(http, fastNetwork());

    CommandGetUserData user;
    CommandMoveNode move(0x1111ull, 0x2222ull, "AAAAAAAAAA");

    http.queueApiFailure(TRANSPORT_ETIMEOUT);

    auto results = dispatcher.dispatch({&user, &move});

    EXPECT_EQ(TRANSPORT_ETIMEOUT, results[0]);
    EXPECT_EQ(TRANSPORT_ETIMEOUT, results[1]);
    EXPECT_EQ(1u, http.apiPosts());
}

TEST(RequestDispatcher, MissingReplyElementsAreInternalErrors)
{
    FakeHttpIO http;
    RequestDispatcher dispatcher(http, fastNetwork());

    CommandGetUserData user;
    CommandGetUserQuota quota;

    http.queueApi("[{\"u\":\"AAAAAAAAAAA\"}]");

    auto results = dispatcher.dispatch({&user, &quota});

    EXPECT_EQ(API_OK, results[0]);
    EXPECT_EQ(API_EINTERNAL, results[1]);
}

TEST(RequestDispatcher, UrlCarriesSequenceSessionAndFolder)
{
    FakeHttpIO http;
    RequestDispatcher dispatcher(http, fastNetwork(), "https://api.example/");

    CommandGetUserData first;
    CommandGetUserData second;

    http.queueApi("[{}]");
    http.queueApi("[{}]");

    dispatcher.dispatch({&first});

    dispatcher.setSid("SESSION");
    dispatcher.setFolderLink("FOLDER");
    dispatcher.dispatch({&second});

    auto sent = http.apiRequests();
    ASSERT_EQ(2u, sent.size());

    EXPECT_EQ(0u, sent[0].url.find("https://api.example/cs?id="));
    EXPECT_EQ(std::string::npos, sent[0].url.find("&sid="));

    EXPECT_NE(std::string::npos, sent[1].url.find("&sid=SESSION"));
    EXPECT_NE(std::string::npos, sent[1].url.find("&n=FOLDER"));

    auto seq = [](const std::string& url)
    {
        size_t start = url.find("id=") + 3;
        return std::stoull(url.substr(start, url.find('&', start) - start));
    };
    EXPECT_EQ(seq(sent[0].url) + 1, seq(sent[1].url));
}

TEST(Command, MutationsCarryARequestId)
{
    PrnGen rng;
    std::string id = Command::newRequestId(rng);
    EXPECT_EQ(10u, id.size());

    CommandDelNode del(0x1234ull, id);
    EXPECT_FALSE(del.idempotent());
    EXPECT_NE(std::string::npos, del.getJSON().find("\"i\":\"" + id + "\""));

    CommandGetUserQuota quota;
    EXPECT_TRUE(quota.idempotent());
}

} // mt
