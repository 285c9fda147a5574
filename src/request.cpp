/**
 * @file request.cpp
 * @brief Generic request interface
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

#include <thread>

#include "megaflow/backofftimer.h"
#include "megaflow/logging.h"
#include "megaflow/request.h"

namespace megaflow {

void Request::add(Command* c)
{
    cmds.push_back(c);
}

size_t Request::size() const
{
    return cmds.size();
}

bool Request::empty() const
{
    return cmds.empty();
}

bool Request::idempotent() const
{
    for (const auto* c : cmds)
    {
        if (!c->idempotent())
        {
            return false;
        }
    }
    return true;
}

string Request::get() const
{
    string req = "[";

    for (size_t i = 0; i < cmds.size(); i++)
    {
        if (i)
        {
            req.append(",");
        }
        req.append(cmds[i]->getJSON());
    }

    req.append("]");
    return req;
}

static char nextchar(const char* ptr)
{
    while (*ptr == ',' || *ptr == ' ' || *ptr == '\n' || *ptr == '\r' || *ptr == '\t')
    {
        ptr++;
    }
    return *ptr;
}

Error Request::process(const string& response)
{
    JSON json(response);
    error e;

    if (json.isNumericError(e))
    {
        // the whole batch failed
        LOG_warn << "Batch-level error: " << Error(e);
        servererror(e);
        return e;
    }

    if (!json.enterarray())
    {
        LOG_err << "Unexpected response: " << response.substr(0, 64);
        servererror(API_EINTERNAL);
        return API_EINTERNAL;
    }

    size_t i = 0;

    for (; i < cmds.size(); i++)
    {
        Command* cmd = cmds[i];
        char c = nextchar(json.pos);

        if (!c || c == ']')
        {
            break;
        }

        if (json.isNumericError(e))
        {
            cmd->procresult(Command::Result(Command::CmdError, e), json);
            continue;
        }

        // locate the end of this element, whatever the command consumes
        JSON end = json;
        if (!end.storeobject())
        {
            LOG_err << "Malformed reply element for " << cmd->commandStr;
            break;
        }

        bool parsed;
        if (c == '{')
        {
            json.enterobject();
            parsed = cmd->procresult(Command::Result(Command::CmdObject), json);
        }
        else if (c == '[')
        {
            json.enterarray();
            parsed = cmd->procresult(Command::Result(Command::CmdArray), json);
        }
        else
        {
            parsed = cmd->procresult(Command::Result(Command::CmdItem), json);
        }

        if (!parsed)
        {
            LOG_err << "Failed to parse reply to " << cmd->commandStr;
        }

        json.pos = end.pos;
    }

    // elements missing from the reply
    for (; i < cmds.size(); i++)
    {
        cmds[i]->fail(API_EINTERNAL);
    }

    return API_OK;
}

void Request::servererror(Error e)
{
    for (auto* c : cmds)
    {
        c->fail(e);
    }
}

void Request::clear()
{
    cmds.clear();
}

RequestDispatcher::RequestDispatcher(HttpIO& http, const NetworkSettings& settings, const string& apiurl)
    : mHttp(http)
    , mSettings(settings)
    , mApiUrl(apiurl)
{
    PrnGen rng;
    mSeq = rng.genuint32(UINT32_MAX);
}

void RequestDispatcher::setSid(const string& sid)
{
    std::lock_guard<std::mutex> g(mMutex);
    mSid = sid;
}

void RequestDispatcher::setFolderLink(const string& handle)
{
    std::lock_guard<std::mutex> g(mMutex);
    mFolderLink = handle;
}

string RequestDispatcher::url()
{
    std::lock_guard<std::mutex> g(mMutex);

    string u = mApiUrl + "cs?id=" + std::to_string(mSeq++);

    if (!mSid.empty())
    {
        u.append("&sid=").append(mSid);
    }

    if (!mFolderLink.empty())
    {
        u.append("&n=").append(mFolderLink);
    }

    return u;
}

vector<Error> RequestDispatcher::dispatch(const vector<Command*>& commands, Error* batchError)
{
    vector<Command*> pending = commands;
    BackoffTimer timer(mSettings.minRetryDelay, mSettings.maxRetryDelay);
    Error batch = API_OK;

    while (!pending.empty())
    {
        Request req;
        string names;

        for (auto* c : pending)
        {
            req.add(c);
            names.append(names.empty() ? "" : " ").append(c->commandStr);
        }

        LOG_debug << "Sending batch: " << names;
        mDispatches++;

        auto response = mHttp.post(url(), req.get(), mSettings.timeout);

        if (!response)
        {
            batch = response.error();
            req.servererror(batch);
        }
        else if (!(batch = httpStatusError(response->status)).ok())
        {
            LOG_warn << "API request failed with HTTP status " << response->status;
            req.servererror(batch);
        }
        else
        {
            batch = req.process(response->body);
        }

        vector<Command*> retry;
        for (auto* c : pending)
        {
            if (c->error().transient())
            {
                retry.push_back(c);
            }
        }

        if (retry.empty())
        {
            break;
        }

        if (!req.idempotent())
        {
            LOG_warn << "Not resending batch with mutations: " << names;
            break;
        }

        if (timer.attempts() >= mSettings.maxRetries)
        {
            LOG_err << "Giving up on " << retry.size() << " command(s) after " << timer.attempts() << " retries";
            break;
        }

        auto delay = timer.backoff();
        LOG_warn << "Retrying " << retry.size() << " command(s) in " << delay.count() << " ms ("
                 << retry.front()->error() << ")";
        std::this_thread::sleep_for(delay);

        pending.swap(retry);
    }

    if (batchError)
    {
        *batchError = batch;
    }

    vector<Error> results;
    results.reserve(commands.size());
    for (const auto* c : commands)
    {
        results.push_back(c->error());
    }
    return results;
}

} // namespace
