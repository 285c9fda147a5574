/**
 * @file command.cpp
 * @brief Implementation of various commands
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
#include "megaflow/command.h"
#include "megaflow/logging.h"

namespace megaflow {

void Command::cmd(const char* cmd)
{
    commandStr = cmd;
    jsonWriter.cmd(cmd);
}

void Command::arg(const char* name, const char* value, int quotes)
{
    jsonWriter.arg(name, value, quotes);
}

void Command::arg(const char* name, const string& value, int quotes)
{
    jsonWriter.arg(name, value, quotes);
}

void Command::arg(const char* name, const byte* value, int len)
{
    jsonWriter.arg(name, value, len);
}

void Command::arg(const char* name, handle h, int len)
{
    jsonWriter.arg(name, h, len);
}

void Command::arg(const char* name, m_off_t n)
{
    jsonWriter.arg(name, n);
}

void Command::beginarray(const char* name)
{
    jsonWriter.beginarray(name);
}

void Command::endarray()
{
    jsonWriter.endarray();
}

void Command::beginobject()
{
    jsonWriter.beginobject();
}

void Command::endobject()
{
    jsonWriter.endobject();
}

string Command::getJSON() const
{
    return "{" + jsonWriter.getstring() + "}";
}

string Command::newRequestId(PrnGen& rng)
{
    static const char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

    string id(10, 'A');
    for (auto& c : id)
    {
        c = alphabet[rng.genuint32(sizeof alphabet - 1)];
    }
    return id;
}

bool NodeRecord::parse(JSON& json)
{
    for (;;)
    {
        switch (json.getnameid())
        {
            case 'h':
                nodehandle = json.gethandle(NODEHANDLE);
                break;

            case 'p':
                parenthandle = json.gethandle(NODEHANDLE);
                break;

            case 'u':
                json.storeobject(&owner);
                break;

            case 't':
                type = nodetype_t(json.getint32());
                break;

            case 'a':
                json.storeobject(&attrstring);
                break;

            case 'k':
                json.storeobject(&keystring);
                break;

            case 's':
                size = json.getint();
                break;

            case makeNameid("ts"):
                ctime = json.getint();
                break;

            case makeNameid("fa"):
                json.storeobject(&fileattrstring);
                break;

            case makeNameid("sk"):
                json.storeobject(&sharekey);
                break;

            case makeNameid("su"):
                json.storeobject(&shareuser);
                break;

            case EOO:
                if (ISUNDEF(nodehandle))
                {
                    LOG_err << "Node without handle";
                    return false;
                }
                if (type < FILENODE || type > RUBBISHNODE)
                {
                    LOG_warn << "Unknown node type " << int(type);
                    type = TYPE_UNKNOWN;
                }
                return true;

            default:
                if (!json.storeobject())
                {
                    return false;
                }
        }
    }
}

// parses an array of node objects; the array has been entered
static bool readnodes(JSON& json, vector<NodeRecord>& out)
{
    while (json.enterobject())
    {
        NodeRecord nr;

        if (!nr.parse(json) || !json.leaveobject())
        {
            return false;
        }

        out.push_back(std::move(nr));
    }

    return json.leavearray();
}

CommandPrelogin::CommandPrelogin(const string& email)
{
    cmd("us0");
    arg("user", email);
}

bool CommandPrelogin::procresult(Result r, JSON& json)
{
    if (r.wasErrorOrOK())
    {
        setResult(r.errorOrOK() == API_OK ? Error(API_EINTERNAL) : r.errorOrOK());
        return true;
    }

    if (!r.hasJsonObject())
    {
        setResult(API_EINTERNAL);
        return false;
    }

    for (;;)
    {
        switch (json.getnameid())
        {
            case 'v':
                version = int(json.getint());
                break;
            case 's':
                json.storeobject(&salt);
                break;
            case EOO:
                if (version == 0)
                {
                    LOG_err << "No version returned";
                    setResult(API_EINTERNAL);
                }
                else if (version > 2)
                {
                    LOG_err << "Version of account not supported";
                    setResult(API_EINTERNAL);
                }
                else if (version == 2 && !salt.size())
                {
                    LOG_err << "No salt returned";
                    setResult(API_EINTERNAL);
                }
                else
                {
                    setResult(API_OK);
                }
                return true;
            default:
                if (!json.storeobject())
                {
                    setResult(API_EINTERNAL);
                    return false;
                }
        }
    }
}

// login request with user e-mail address and user hash
CommandLogin::CommandLogin(const string& email, const string& uh, const string& pin)
{
    cmd("us");
    arg("user", email);
    arg("uh", uh);

    if (!pin.empty())
    {
        arg("mfa", pin);
    }
}

bool CommandLogin::procresult(Result r, JSON& json)
{
    if (r.wasErrorOrOK())
    {
        setResult(r.errorOrOK() == API_OK ? Error(API_EINTERNAL) : r.errorOrOK());
        return true;
    }

    if (!r.hasJsonObject())
    {
        setResult(API_EINTERNAL);
        return false;
    }

    for (;;)
    {
        switch (json.getnameid())
        {
            case 'k':
                json.storeobject(&k);
                break;

            case 'u':
                json.storeobject(&u);
                break;

            case makeNameid("privk"):
                json.storeobject(&privk);
                break;

            case makeNameid("csid"):
                json.storeobject(&csid);
                break;

            case EOO:
                if (k.empty() || privk.empty() || csid.empty() || u.empty())
                {
                    LOG_err << "Incomplete login response";
                    setResult(API_EINTERNAL);
                }
                else
                {
                    setResult(API_OK);
                }
                return true;

            default:
                if (!json.storeobject())
                {
                    setResult(API_EINTERNAL);
                    return false;
                }
        }
    }
}

CommandLogout::CommandLogout()
{
    cmd("sml");
    mIdempotent = false;
}

bool CommandLogout::procresult(Result r, JSON&)
{
    setResult(r.wasErrorOrOK() ? r.errorOrOK() : Error(API_OK));
    return true;
}

CommandGetUserData::CommandGetUserData()
{
    cmd("ug");
}

bool CommandGetUserData::procresult(Result r, JSON& json)
{
    if (r.wasErrorOrOK())
    {
        setResult(r.errorOrOK() == API_OK ? Error(API_EINTERNAL) : r.errorOrOK());
        return true;
    }

    if (!r.hasJsonObject())
    {
        setResult(API_EINTERNAL);
        return false;
    }

    for (;;)
    {
        switch (json.getnameid())
        {
            case 'u':
                json.storeobject(&userhandle);
                break;

            case makeNameid("email"):
                json.storestring(&email);
                break;

            case makeNameid("name"):
                json.storestring(&name);
                break;

            case EOO:
                setResult(API_OK);
                return true;

            default:
                if (!json.storeobject())
                {
                    setResult(API_EINTERNAL);
                    return false;
                }
        }
    }
}

CommandGetUserQuota::CommandGetUserQuota()
{
    cmd("uq");
    arg("strg", "1", 0);
    arg("xfer", "1", 0);
}

bool CommandGetUserQuota::procresult(Result r, JSON& json)
{
    if (r.wasErrorOrOK())
    {
        setResult(r.errorOrOK() == API_OK ? Error(API_EINTERNAL) : r.errorOrOK());
        return true;
    }

    if (!r.hasJsonObject())
    {
        setResult(API_EINTERNAL);
        return false;
    }

    for (;;)
    {
        switch (json.getnameid())
        {
            case makeNameid("mstrg"):
                storageMax = json.getint();
                break;

            case makeNameid("cstrg"):
                storageUsed = json.getint();
                break;

            case makeNameid("mxfer"):
                transferMax = json.getint();
                break;

            case makeNameid("caxfer"):
                transferUsed = json.getint();
                break;

            case EOO:
                setResult(storageMax < 0 || storageUsed < 0 ? Error(API_EINTERNAL) : Error(API_OK));
                return true;

            default:
                if (!json.storeobject())
                {
                    setResult(API_EINTERNAL);
                    return false;
                }
        }
    }
}

CommandFetchNodes::CommandFetchNodes()
{
    cmd("f");
    arg("c", "1", 0);
    arg("r", "1", 0);
}

bool CommandFetchNodes::procresult(Result r, JSON& json)
{
    if (r.wasErrorOrOK())
    {
        setResult(r.errorOrOK() == API_OK ? Error(API_EINTERNAL) : r.errorOrOK());
        return true;
    }

    if (!r.hasJsonObject())
    {
        setResult(API_EINTERNAL);
        return false;
    }

    for (;;)
    {
        switch (json.getnameid())
        {
            case 'f':
                if (!json.enterarray() || !readnodes(json, nodes))
                {
                    LOG_err << "Malformed node list";
                    setResult(API_EINTERNAL);
                    return false;
                }
                break;

            case makeNameid("ok"):
                if (json.enterarray())
                {
                    while (json.enterobject())
                    {
                        ShareKeyRecord sk;

                        for (bool done = false; !done; )
                        {
                            switch (json.getnameid())
                            {
                                case 'h':
                                    sk.h = json.gethandle(NODEHANDLE);
                                    break;
                                case 'k':
                                    json.storeobject(&sk.key);
                                    break;
                                case EOO:
                                    done = true;
                                    break;
                                default:
                                    if (!json.storeobject())
                                    {
                                        setResult(API_EINTERNAL);
                                        return false;
                                    }
                            }
                        }

                        if (!json.leaveobject())
                        {
                            setResult(API_EINTERNAL);
                            return false;
                        }

                        sharekeys.push_back(std::move(sk));
                    }
                    json.leavearray();
                }
                else
                {
                    json.storeobject();
                }
                break;

            case makeNameid("sn"):
                json.storeobject(&scsn);
                break;

            case EOO:
                LOG_debug << "Fetched " << nodes.size() << " nodes, " << sharekeys.size() << " share keys";
                setResult(API_OK);
                return true;

            default:
                if (!json.storeobject())
                {
                    setResult(API_EINTERNAL);
                    return false;
                }
        }
    }
}

CommandGetFile::CommandGetFile(handle h, bool publicHandle)
{
    cmd("g");
    arg("g", "1", 0);
    arg("ssl", "2", 0);
    arg(publicHandle ? "p" : "n", h, NODEHANDLE);
}

// process file credentials
bool CommandGetFile::procresult(Result r, JSON& json)
{
    if (r.wasErrorOrOK())
    {
        setResult(r.errorOrOK() == API_OK ? Error(API_EINTERNAL) : r.errorOrOK());
        return true;
    }

    if (!r.hasJsonObject())
    {
        setResult(API_EINTERNAL);
        return false;
    }

    ErrorCodes e = API_OK;

    for (;;)
    {
        switch (json.getnameid())
        {
            case 'g':
                // single URL, or an array for cloudraid files: take the first
                if (json.enterarray())
                {
                    string first;
                    json.storeobject(&first);
                    while (json.storeobject()) { }
                    json.leavearray();
                    url = first;
                }
                else
                {
                    json.storeobject(&url);
                }
                break;

            case 's':
                size = json.getint();
                break;

            case makeNameid("at"):
                json.storeobject(&attrstring);
                break;

            case 'e':
                e = static_cast<ErrorCodes>(json.getint());
                break;

            case EOO:
                if (e != API_OK)
                {
                    setResult(e);
                }
                else if (url.empty() || size < 0)
                {
                    LOG_err << "Download URL or size missing";
                    setResult(API_EINTERNAL);
                }
                else
                {
                    setResult(API_OK);
                }
                return true;

            default:
                if (!json.storeobject())
                {
                    setResult(API_EINTERNAL);
                    return false;
                }
        }
    }
}

CommandGetUploadURL::CommandGetUploadURL(m_off_t size)
{
    cmd("u");
    arg("s", size);
    arg("ssl", "2", 0);
}

bool CommandGetUploadURL::procresult(Result r, JSON& json)
{
    if (r.wasErrorOrOK())
    {
        setResult(r.errorOrOK() == API_OK ? Error(API_EINTERNAL) : r.errorOrOK());
        return true;
    }

    if (!r.hasJsonObject())
    {
        setResult(API_EINTERNAL);
        return false;
    }

    for (;;)
    {
        switch (json.getnameid())
        {
            case 'p':
                json.storeobject(&url);
                break;

            case EOO:
                setResult(url.empty() ? Error(API_EINTERNAL) : Error(API_OK));
                return true;

            default:
                if (!json.storeobject())
                {
                    setResult(API_EINTERNAL);
                    return false;
                }
        }
    }
}

// add new nodes (folders or completed uploads)
CommandPutNodes::CommandPutNodes(handle target, const vector<NewNode>& newnodes, const string& reqid)
{
    cmd("p");
    mIdempotent = false;

    arg("t", target, NODEHANDLE);

    beginarray("n");

    for (const auto& nn : newnodes)
    {
        beginobject();

        if (nn.type == FILENODE)
        {
            arg("h", nn.uploadtoken);
        }
        else
        {
            // placeholder handle for new folders
            arg("h", "xxxxxxxx");
        }

        arg("t", m_off_t(nn.type));
        arg("a", (const byte*)nn.attrstring.data(), int(nn.attrstring.size()));
        arg("k", (const byte*)nn.nodekey.data(), int(nn.nodekey.size()));

        endobject();
    }

    endarray();

    arg("i", reqid);
}

bool CommandPutNodes::procresult(Result r, JSON& json)
{
    if (r.wasErrorOrOK())
    {
        setResult(r.errorOrOK());
        return true;
    }

    if (!r.hasJsonObject())
    {
        setResult(API_EINTERNAL);
        return false;
    }

    for (;;)
    {
        switch (json.getnameid())
        {
            case 'f':
                if (!json.enterarray() || !readnodes(json, created))
                {
                    setResult(API_EINTERNAL);
                    return false;
                }
                break;

            case EOO:
                setResult(API_OK);
                return true;

            default:
                if (!json.storeobject())
                {
                    setResult(API_EINTERNAL);
                    return false;
                }
        }
    }
}

CommandSetAttr::CommandSetAttr(handle h, const string& attrstring, const string& wrappedkey, const string& reqid)
{
    cmd("a");
    mIdempotent = false;

    arg("n", h, NODEHANDLE);
    arg("attr", (const byte*)attrstring.data(), int(attrstring.size()));
    if (!wrappedkey.empty())
    {
        arg("key", (const byte*)wrappedkey.data(), int(wrappedkey.size()));
    }
    arg("i", reqid);
}

bool CommandSetAttr::procresult(Result r, JSON&)
{
    setResult(r.wasErrorOrOK() ? r.errorOrOK() : Error(API_OK));
    return true;
}

CommandMoveNode::CommandMoveNode(handle h, handle target, const string& reqid)
{
    cmd("m");
    mIdempotent = false;

    arg("n", h, NODEHANDLE);
    arg("t", target, NODEHANDLE);
    arg("i", reqid);
}

bool CommandMoveNode::procresult(Result r, JSON&)
{
    setResult(r.wasErrorOrOK() ? r.errorOrOK() : Error(API_OK));
    return true;
}

CommandDelNode::CommandDelNode(handle h, const string& reqid)
{
    cmd("d");
    mIdempotent = false;

    arg("n", h, NODEHANDLE);
    arg("i", reqid);
}

bool CommandDelNode::procresult(Result r, JSON&)
{
    setResult(r.wasErrorOrOK() ? r.errorOrOK() : Error(API_OK));
    return true;
}

} // namespace
