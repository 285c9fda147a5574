/**
 * @file megaflow/request.h
 * @brief Generic request interface
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

#ifndef MEGAFLOW_REQUEST_H
#define MEGAFLOW_REQUEST_H 1

#include <atomic>
#include <mutex>

#include "command.h"
#include "http.h"
#include "types.h"

namespace megaflow {

// API request: a batch of commands sent as one JSON array
class MEGAFLOW_API Request
{
private:
    vector<Command*> cmds;

public:
    void add(Command*);

    size_t size() const;
    bool empty() const;

    // true if every command may be resent
    bool idempotent() const;

    // the JSON array sent to the server
    string get() const;

    // hands each element of the reply to its command, in order.
    // returns the batch-level error, API_OK if the reply was an array
    Error process(const string& response);

    // fails every command with the same error
    void servererror(Error e);

    void clear();
};

class MEGAFLOW_API RequestDispatcher
{
    HttpIO& mHttp;
    NetworkSettings mSettings;
    string mApiUrl;

    std::mutex mMutex;

    // request sequence number, seeded randomly
    uint64_t mSeq;

    string mSid;
    string mFolderLink;

    // number of POSTs sent, retries included
    std::atomic<unsigned> mDispatches{0};

    string url();

public:
    RequestDispatcher(HttpIO& http, const NetworkSettings& settings, const string& apiurl = APIURL);

    // authenticates subsequent requests (`sid`); empty to clear
    void setSid(const string& sid);

    // scopes subsequent requests to a public folder (`n`); empty to clear
    void setFolderLink(const string& handle);

    const NetworkSettings& settings() const { return mSettings; }

    /**
     * @brief Sends the commands as one batch and demultiplexes the reply.
     *
     * Transient failures (transport errors, API_EAGAIN, API_ERATELIMIT) are
     * retried with exponential backoff, resending only the failed commands,
     * as long as every command of the batch is idempotent.
     *
     * @param batchError receives the batch-level error, if not null
     * @return one Error per command, in order
     */
    vector<Error> dispatch(const vector<Command*>& commands, Error* batchError = nullptr);

    unsigned dispatches() const { return mDispatches; }
};

} // namespace

#endif
