/**
 * @file megaflow/command.h
 * @brief Request command component
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

#ifndef MEGAFLOW_COMMAND_H
#define MEGAFLOW_COMMAND_H 1

#include "crypto/cryptopp.h"
#include "error.h"
#include "json.h"
#include "types.h"

namespace megaflow {

// request command component
class MEGAFLOW_API Command
{
    Error result = API_EINTERNAL;

protected:
    JSONWriter jsonWriter;

    // false for commands that change server state; those are never resent
    bool mIdempotent = true;

    void setResult(Error e) { result = e; }

public:
    // command name, for logging
    string commandStr;

    void cmd(const char*);

    void arg(const char*, const char*, int = 1);
    void arg(const char*, const string&, int = 1);
    void arg(const char*, const byte*, int);
    void arg(const char*, handle, int);
    void arg(const char*, m_off_t);
    void beginarray(const char*);
    void endarray();
    void beginobject();
    void endobject();

    enum Outcome {  CmdError,            // The reply was an error code, already extracted from the JSON.  The error code may have been 0 (API_OK)
                    CmdArray,            // The reply was an array, and we have already entered it
                    CmdObject,           // the reply was an object, and we have already entered it
                    CmdItem };           // The reply was none of the above - so a string

    struct Result
    {
        Outcome mOutcome = CmdError;
        Error mError = API_OK;
        Result(Outcome o, Error e = API_OK) : mOutcome(o), mError(e) {}

        bool succeeded() const
        {
            return mOutcome != CmdError || mError.ok();
        }

        bool hasJsonArray() const { return mOutcome == CmdArray; }
        bool hasJsonObject() const { return mOutcome == CmdObject; }
        bool hasJsonItem() const { return mOutcome == CmdItem; }

        bool wasErrorOrOK() const
        {
            return mOutcome == CmdError;
        }

        Error errorOrOK() const
        {
            return mOutcome == CmdError ? mError : Error(API_EINTERNAL);
        }
    };

    // parses the reply and records the outcome; false if the JSON was unusable
    virtual bool procresult(Result, JSON&) = 0;

    // the command object, {"a":"name",...}
    string getJSON() const;

    bool idempotent() const { return mIdempotent; }

    // outcome of the last dispatch
    Error error() const { return result; }

    // marks the command failed without parsing a reply (batch-level errors, transport failures)
    void fail(Error e) { result = e; }

    // random 10-character idempotence id sent as `i` with mutations
    static string newRequestId(PrnGen& rng);

    Command() = default;
    virtual ~Command() = default;
};

// one node entry as listed by `f` or returned by `p`
struct MEGAFLOW_API NodeRecord
{
    handle nodehandle = UNDEF;
    handle parenthandle = UNDEF;
    string owner;
    nodetype_t type = TYPE_UNKNOWN;
    string attrstring;          // base64, encrypted
    string keystring;           // "owner:key/owner:key"
    m_off_t size = -1;
    m_time_t ctime = 0;
    string fileattrstring;      // "fa"
    string sharekey;            // "sk", base64
    string shareuser;           // "su"

    // parses one node object; pos must be inside the object
    bool parse(JSON& json);
};

// share key entry from `ok`
struct MEGAFLOW_API ShareKeyRecord
{
    handle h = UNDEF;
    string key;                 // base64, wrapped under the master key
};

struct MEGAFLOW_API CommandPrelogin : public Command
{
    int version = 0;
    string salt;

    bool procresult(Result, JSON&) override;

    explicit CommandPrelogin(const string& email);
};

struct MEGAFLOW_API CommandLogin : public Command
{
    string k;
    string privk;
    string csid;
    string u;

    bool procresult(Result, JSON&) override;

    CommandLogin(const string& email, const string& uh, const string& pin);
};

struct MEGAFLOW_API CommandLogout : public Command
{
    bool procresult(Result, JSON&) override;

    CommandLogout();
};

struct MEGAFLOW_API CommandGetUserData : public Command
{
    string userhandle;
    string email;
    string name;

    bool procresult(Result, JSON&) override;

    CommandGetUserData();
};

struct MEGAFLOW_API CommandGetUserQuota : public Command
{
    m_off_t storageUsed = -1;
    m_off_t storageMax = -1;
    m_off_t transferUsed = -1;
    m_off_t transferMax = -1;

    bool procresult(Result, JSON&) override;

    CommandGetUserQuota();
};

struct MEGAFLOW_API CommandFetchNodes : public Command
{
    vector<NodeRecord> nodes;
    vector<ShareKeyRecord> sharekeys;
    string scsn;

    bool procresult(Result, JSON&) override;

    CommandFetchNodes();
};

struct MEGAFLOW_API CommandGetFile : public Command
{
    string url;
    m_off_t size = -1;
    string attrstring;

    bool procresult(Result, JSON&) override;

    // `publicHandle` asks for a file shared by link (p), otherwise an owned node (n)
    CommandGetFile(handle h, bool publicHandle);
};

struct MEGAFLOW_API CommandGetUploadURL : public Command
{
    string url;

    bool procresult(Result, JSON&) override;

    explicit CommandGetUploadURL(m_off_t size);
};

// a node to be created by `p`
struct MEGAFLOW_API NewNode
{
    nodetype_t type = FILENODE;
    string uploadtoken;         // files: completion token from the upload
    string attrstring;          // encrypted attributes, raw bytes
    string nodekey;             // wrapped key, raw bytes
};

struct MEGAFLOW_API CommandPutNodes : public Command
{
    vector<NodeRecord> created;

    bool procresult(Result, JSON&) override;

    CommandPutNodes(handle target, const vector<NewNode>& newnodes, const string& reqid);
};

struct MEGAFLOW_API CommandSetAttr : public Command
{
    bool procresult(Result, JSON&) override;

    CommandSetAttr(handle h, const string& attrstring, const string& wrappedkey, const string& reqid);
};

struct MEGAFLOW_API CommandMoveNode : public Command
{
    bool procresult(Result, JSON&) override;

    CommandMoveNode(handle h, handle target, const string& reqid);
};

struct MEGAFLOW_API CommandDelNode : public Command
{
    bool procresult(Result, JSON&) override;

    CommandDelNode(handle h, const string& reqid);
};

} // namespace

#endif
