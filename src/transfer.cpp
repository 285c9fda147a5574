/**
 * @file transfer.cpp
 * @brief File downloads and uploads
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
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <thread>

#include "megaflow/backofftimer.h"
#include "megaflow/base64.h"
#include "megaflow/json.h"
#include "megaflow/logging.h"
#include "megaflow/transfer.h"

namespace megaflow {

void CancelToken::pause()
{
    std::lock_guard<std::mutex> g(mMutex);

    if (mState == TOKEN_RUNNING)
    {
        mState = TOKEN_PAUSE;
    }

    mCV.notify_all();
}

void CancelToken::cancel()
{
    std::lock_guard<std::mutex> g(mMutex);
    mState = TOKEN_CANCEL;
    mCV.notify_all();
}

tokenstate_t CancelToken::state() const
{
    std::lock_guard<std::mutex> g(mMutex);
    return mState;
}

Error CancelToken::stopError() const
{
    switch (state())
    {
        case TOKEN_PAUSE: return TRANSFER_EPAUSED;
        case TOKEN_CANCEL: return TRANSFER_ECANCELLED;
        case TOKEN_RUNNING: break;
    }

    return API_OK;
}

bool CancelToken::waitFor(std::chrono::milliseconds delay) const
{
    std::unique_lock<std::mutex> lock(mMutex);
    return !mCV.wait_for(lock, delay, [this]() { return mState != TOKEN_RUNNING; });
}

unsigned TransferResult::totalRetries() const
{
    unsigned total = 0;

    for (const auto& r : chunkRetries)
    {
        total += r.second;
    }

    return total;
}

const char* const TransferCheckpoint::FORMAT = "megaflow-resume-1";

string TransferCheckpoint::serialize() const
{
    JSONWriter w;

    w.beginobject();
    w.arg("v", FORMAT);
    w.arg("h", nodehandle, NODEHANDLE);
    w.arg("s", size);
    w.arg("w", watermark);
    w.arg_stringWithEscapes("t", target);
    w.arg("d", keydigest);
    w.endobject();

    return w.getstring();
}

bool TransferCheckpoint::parse(const string& data)
{
    JSON json(data);
    string format;

    if (!json.enterobject())
    {
        return false;
    }

    for (;;)
    {
        switch (json.getnameid())
        {
            case 'v':
                json.storeobject(&format);
                break;

            case 'h':
                nodehandle = json.gethandle(NODEHANDLE);
                break;

            case 's':
                size = json.getint();
                break;

            case 'w':
                watermark = json.getint();
                break;

            case 't':
                json.storestring(&target);
                break;

            case 'd':
                json.storeobject(&keydigest);
                break;

            case EOO:
                return format == FORMAT
                    && !ISUNDEF(nodehandle)
                    && size >= 0
                    && watermark >= 0
                    && watermark <= size;

            default:
                if (!json.storeobject())
                {
                    return false;
                }
        }
    }
}

bool TransferCheckpoint::load(FileSystemAccess& fsaccess, const string& path)
{
    string data;

    if (!fsaccess.existslocal(path) || !fsaccess.readfile(path, data))
    {
        return false;
    }

    if (!parse(data))
    {
        LOG_warn << "Ignoring malformed checkpoint " << path;
        return false;
    }

    return true;
}

bool TransferCheckpoint::save(FileSystemAccess& fsaccess, const string& path) const
{
    return fsaccess.writefileatomic(path, serialize());
}

string TransferCheckpoint::digest(const string& nodekey)
{
    byte hash[CryptoPP::SHA256::DIGESTSIZE];

    CryptoPP::SHA256().CalculateDigest(hash, (const byte*)nodekey.data(), nodekey.size());

    return Base64::btoa(string((const char*)hash, 16));
}

bool ChunkWatermark::add(m_off_t start, m_off_t end)
{
    if (start != mWatermark)
    {
        if (start > mWatermark)
        {
            mDone[start] = end;
        }
        return false;
    }

    mWatermark = end;

    for (auto it = mDone.find(mWatermark); it != mDone.end(); it = mDone.find(mWatermark))
    {
        mWatermark = it->second;
        mDone.erase(it);
    }

    return true;
}

// state shared by the chunk lanes of one download
struct DownloadTask::Lanes
{
    std::mutex mutex;

    // signalled whenever a chunk leaves flight
    std::condition_variable landed;

    vector<ChunkRange> chunks;
    size_t next = 0;
    size_t inflight = 0;

    // first failure; stops every lane
    Error error = API_OK;

    FileCipher cipher;
    FileAccess* partial = nullptr;

    // null when resumed bytes were not re-verified
    MacAccumulator* acc = nullptr;

    ChunkWatermark watermark;
    TransferCheckpoint checkpoint;
    TransferResult* result = nullptr;

    m_off_t bytes = 0;

    Lanes(const FileKey& fk, m_off_t start)
        : cipher(fk)
        , watermark(start)
        , bytes(start)
    {
    }
};

DownloadTask::DownloadTask(Session& session,
                           HttpIO& http,
                           FileSystemAccess& fsaccess,
                           const Node& node,
                           const string& target,
                           const TransferSettings& settings)
    : mSession(session)
    , mHttp(http)
    , mFsAccess(fsaccess)
    , mHandle(node.nodehandle)
    , mPublicHandle(session.publicLink() && !session.publicLink()->folder)
    , mNodeKey(node.nodekey)
    , mNodeSize(node.size)
    , mTarget(target)
    , mSettings(settings)
{
}

TransferResult DownloadTask::run(CancelToken& token, TransferProgress& progress)
{
    TransferResult result;
    string name = Base64::handleToB64(mHandle, NODEHANDLE);

    auto fk = FileKey::fromNodeKey(mNodeKey);
    if (!fk)
    {
        LOG_err << "No file key for " << name;
        result.error = TRANSFER_ENOKEY;
        return result;
    }

    if (!token.running())
    {
        result.error = token.stopError();
        return result;
    }

    if (completed())
    {
        LOG_info << "Skipping " << name << ", " << mTarget << " is already complete";
        result.size = mNodeSize;
        result.bytesDone = mNodeSize;
        result.path = mTarget;
        progress.total = mNodeSize;
        progress.done = mNodeSize;
        return result;
    }

    CommandGetFile cmd(mHandle, mPublicHandle);
    Error e = mSession.dispatch(cmd);

    if (!e.ok())
    {
        LOG_err << "Unable to get the download URL for " << name << ": " << e;
        result.error = e;
        return result;
    }

    mUrl = cmd.url;
    mSize = cmd.size;
    result.size = mSize;
    progress.total = mSize;

    LOG_info << "Starting download of " << name << " (" << mSize << " bytes) to " << mTarget;

    string dir = parentpath(mTarget);
    auto partial = mFsAccess.newfileaccess();

    if ((!dir.empty() && !mFsAccess.mkdirlocal(dir)) || !partial->fopen(partialPath(), true, true))
    {
        result.error = TRANSFER_ELOCALIO;
        return result;
    }

    SymmCipher maccipher(fk->key);
    MacAccumulator acc(maccipher, mSize);
    FileCipher cipher(*fk);
    bool verify = true;

    m_off_t start = resume(*partial, cipher, acc, verify);

    Lanes lanes(*fk, start);
    lanes.partial = partial.get();
    lanes.acc = verify ? &acc : nullptr;
    lanes.result = &result;
    lanes.checkpoint.nodehandle = mHandle;
    lanes.checkpoint.size = mSize;
    lanes.checkpoint.watermark = start;
    lanes.checkpoint.target = mTarget;
    lanes.checkpoint.keydigest = TransferCheckpoint::digest(mNodeKey);

    for (const auto& chunk : chunkPlan(mSize))
    {
        if (chunk.start >= start)
        {
            lanes.chunks.push_back(chunk);
        }
    }

    progress.done = start;

    // a scheduled download gets one lane per unit of weight it holds
    size_t wanted = progress.weight ? progress.weight.load() : mSettings.parallelism;
    size_t numlanes = std::max<size_t>(1, std::min<size_t>({ wanted, size_t(TransferSettings::MAX_LANES), lanes.chunks.size() }));
    LOG_debug << "Fetching " << lanes.chunks.size() << " chunks of " << name << " on " << numlanes << " lanes";
    vector<std::thread> threads;

    for (size_t i = 1; i < numlanes; i++)
    {
        threads.emplace_back([this, &lanes, &token, &progress]() { lane(lanes, token, progress); });
    }

    lane(lanes, token, progress);

    for (auto& t : threads)
    {
        t.join();
    }

    result.bytesDone = lanes.bytes;

    if (!lanes.error.ok())
    {
        partial->fclose();

        if (lanes.error == TRANSFER_ECANCELLED && !mSettings.keepPartial)
        {
            discard();
        }

        LOG_warn << "Download of " << name << " stopped at " << lanes.watermark.value() << ": " << lanes.error;
        result.error = lanes.error;
        return result;
    }

    if (verify)
    {
        auto mac = acc.finalize();

        if (!mac || memcmp(mac->data(), fk->metamac, sizeof fk->metamac))
        {
            LOG_err << "MAC mismatch for " << name << ", discarding download";
            partial->fclose();
            discard();
            result.error = TRANSFER_EINTEGRITY;
            return result;
        }

        result.macVerified = true;
    }
    else
    {
        LOG_warn << "Download of " << name << " resumed without verification, MAC not checked";
    }

    bool synced = partial->fsync();
    partial->fclose();

    if (!synced || !mFsAccess.renamelocal(partialPath(), mTarget))
    {
        result.error = TRANSFER_ELOCALIO;
        return result;
    }

    if (!mFsAccess.unlinklocal(checkpointPath()))
    {
        LOG_warn << "Stale checkpoint left at " << checkpointPath();
    }

    result.path = mTarget;
    LOG_info << "Download of " << name << " finished, " << result.totalRetries() << " retries";
    return result;
}

bool DownloadTask::completed()
{
    // a checkpoint means the target is stale and a newer download is under way
    if (mNodeSize < 0 || !mFsAccess.existslocal(mTarget) || mFsAccess.existslocal(checkpointPath()))
    {
        return false;
    }

    auto existing = mFsAccess.newfileaccess();
    if (!existing->fopen(mTarget, true, false))
    {
        return false;
    }

    m_off_t size = existing->size;
    existing->fclose();

    if (size != mNodeSize)
    {
        LOG_warn << "Replacing " << mTarget << ": " << size << " bytes on disk, " << mNodeSize << " expected";
        return false;
    }

    return true;
}

m_off_t DownloadTask::resume(FileAccess& partial, FileCipher& cipher, MacAccumulator& acc, bool& verify)
{
    TransferCheckpoint cp;
    verify = true;

    bool usable = cp.load(mFsAccess, checkpointPath())
               && cp.nodehandle == mHandle
               && cp.size == mSize
               && cp.keydigest == TransferCheckpoint::digest(mNodeKey)
               && cp.watermark > 0
               && partial.size >= cp.watermark
               && (cp.watermark == mSize || ChunkedHash::chunkfloor(cp.watermark) == cp.watermark);

    if (usable && !mSettings.verifyResumed)
    {
        LOG_warn << "Resuming at " << cp.watermark << " without re-reading downloaded data";
        verify = false;
        return cp.watermark;
    }

    if (usable)
    {
        // feed the bytes already on disk back into the MAC
        vector<pair<ChunkRange, string>> macs;
        string data;

        for (const auto& chunk : chunkPlan(cp.watermark))
        {
            data.resize(static_cast<size_t>(chunk.size()));

            if (!partial.fread((byte*)&data[0], static_cast<unsigned>(data.size()), chunk.start))
            {
                LOG_warn << "Unable to re-read partial data at " << chunk.start;
                usable = false;
                break;
            }

            byte mac[SymmCipher::BLOCKSIZE];
            chunkMac(cipher.cipher(), cipher.nonce(), (const byte*)data.data(), data.size(), mac);
            macs.emplace_back(chunk, string((const char*)mac, sizeof mac));
        }

        if (usable)
        {
            for (const auto& m : macs)
            {
                Error e = acc.add(m.first.start, m.first.end, (const byte*)m.second.data());
                if (!e.ok())
                {
                    LOG_err << "Unable to replay chunk MAC at " << m.first.start << ": " << e;
                    return 0;
                }
            }

            LOG_info << "Resuming at " << cp.watermark << " of " << mSize;
            return cp.watermark;
        }
    }

    if (!partial.ftruncate(0))
    {
        LOG_warn << "Unable to reset " << partialPath();
    }

    return 0;
}

void DownloadTask::lane(Lanes& lanes, CancelToken& token, TransferProgress& progress)
{
    FileCipher cipher(lanes.cipher);

    for (;;)
    {
        size_t index;

        {
            std::unique_lock<std::mutex> g(lanes.mutex);

            // chunks ahead of the MAC watermark are buffered; keep that bounded
            lanes.landed.wait(g, [&lanes]() {
                return !lanes.acc
                       || !lanes.error.ok()
                       || lanes.acc->pending() + lanes.inflight < MacAccumulator::DEFAULT_MAXPENDING;
            });

            if (!lanes.error.ok() || lanes.next >= lanes.chunks.size())
            {
                return;
            }

            if (!token.running())
            {
                lanes.error = token.stopError();
                lanes.landed.notify_all();
                return;
            }

            index = lanes.next++;
            ++lanes.inflight;
        }

        const ChunkRange& chunk = lanes.chunks[index];
        byte mac[SymmCipher::BLOCKSIZE];
        unsigned retries = 0;

        Error e = fetchChunk(chunk, cipher, *lanes.partial, mac, token, retries);

        std::lock_guard<std::mutex> g(lanes.mutex);

        --lanes.inflight;
        lanes.landed.notify_all();

        if (retries)
        {
            lanes.result->chunkRetries[chunk.start] = retries;
        }

        if (!e.ok())
        {
            if (lanes.error.ok())
            {
                lanes.error = e;
            }
            return;
        }

        if (lanes.acc)
        {
            e = lanes.acc->add(chunk.start, chunk.end, mac);

            if (!e.ok())
            {
                LOG_err << "Chunk MAC rejected at " << chunk.start << ": " << e;
                lanes.error = e;
                return;
            }
        }

        lanes.bytes += chunk.size();
        progress.done = lanes.bytes;

        if (lanes.watermark.add(chunk.start, chunk.end))
        {
            lanes.checkpoint.watermark = lanes.watermark.value();

            if (!lanes.checkpoint.save(mFsAccess, checkpointPath()))
            {
                LOG_warn << "Unable to persist download progress";
            }
        }
    }
}

Error DownloadTask::fetchChunk(const ChunkRange& chunk, FileCipher& cipher, FileAccess& partial,
                               byte* mac, CancelToken& token, unsigned& retries)
{
    string url = mUrl + "/" + std::to_string(chunk.start) + "-" + std::to_string(chunk.end - 1);

    for (;;)
    {
        auto response = mHttp.get(url, mSettings.network.timeout);
        Error e = response ? httpStatusError(response->status) : response.error();

        if (e.ok() && static_cast<m_off_t>(response->body.size()) != chunk.size())
        {
            LOG_warn << "Chunk at " << chunk.start << " truncated: " << response->body.size() << " of " << chunk.size();
            e = TRANSPORT_ECONNECT;
        }

        if (e.ok())
        {
            string& data = response->body;

            cipher.crypt((byte*)&data[0], data.size(), chunk.start);
            chunkMac(cipher.cipher(), cipher.nonce(), (const byte*)data.data(), data.size(), mac);

            if (!partial.fwrite((const byte*)data.data(), static_cast<unsigned>(data.size()), chunk.start))
            {
                LOG_err << "Unable to write chunk at " << chunk.start << ": " << partial.errorcode;
                return TRANSFER_ELOCALIO;
            }

            return API_OK;
        }

        if (!e.transient())
        {
            LOG_err << "Chunk at " << chunk.start << " failed: " << e;
            return e;
        }

        if (retries >= mSettings.network.maxRetries)
        {
            LOG_err << "Chunk at " << chunk.start << " failed after " << retries << " retries: " << e;
            return TRANSFER_ERETRIES;
        }

        auto delay = BackoffTimer::delay(retries, mSettings.network.minRetryDelay, mSettings.network.maxRetryDelay);
        retries++;

        LOG_warn << "Chunk at " << chunk.start << " failed (" << e << "), retry " << retries
                 << " in " << delay.count() << " ms";

        if (!token.waitFor(delay))
        {
            return token.stopError();
        }
    }
}

void DownloadTask::discard()
{
    if (!mFsAccess.unlinklocal(partialPath()) || !mFsAccess.unlinklocal(checkpointPath()))
    {
        LOG_warn << "Unable to remove partial download " << partialPath();
    }
}

UploadTask::UploadTask(Session& session,
                       HttpIO& http,
                       FileSystemAccess& fsaccess,
                       const string& source,
                       handle parent,
                       const string& name,
                       const TransferSettings& settings)
    : mSession(session)
    , mHttp(http)
    , mFsAccess(fsaccess)
    , mSource(source)
    , mParent(parent)
    , mName(name)
    , mSettings(settings)
{
}

TransferResult UploadTask::run(CancelToken& token, TransferProgress& progress)
{
    TransferResult result;

    if (mSession.readOnly())
    {
        result.error = SESSION_EREADONLY;
        return result;
    }

    auto file = mFsAccess.newfileaccess();
    if (!file->fopen(mSource, true, false))
    {
        LOG_err << "Unable to open " << mSource;
        result.error = TRANSFER_ELOCALIO;
        return result;
    }

    m_off_t size = file->size;
    result.size = size;
    progress.total = size;

    CommandGetUploadURL cmd(size);
    Error e = mSession.dispatch(cmd);

    if (!e.ok())
    {
        LOG_err << "Unable to get an upload URL: " << e;
        result.error = e;
        return result;
    }

    mUrl = cmd.url;
    LOG_info << "Starting upload of " << mSource << " (" << size << " bytes)";

    FileKey fk;
    byte nonce[sizeof(SymmCipher::ctr_iv)];
    mSession.randomBytes(fk.key, sizeof fk.key);
    mSession.randomBytes(nonce, sizeof nonce);
    fk.nonce = MemAccess::get<SymmCipher::ctr_iv>((const char*)nonce);

    FileCipher cipher(fk);
    SymmCipher maccipher(fk.key);
    MacAccumulator acc(maccipher, size);

    vector<ChunkRange> chunks = chunkPlan(size);
    if (chunks.empty())
    {
        // empty files still need one (empty) POST for their completion token
        chunks.push_back(ChunkRange{0, 0});
    }

    string completion;

    for (const auto& chunk : chunks)
    {
        if (!token.running())
        {
            result.error = token.stopError();
            LOG_info << "Upload of " << mSource << " stopped: " << result.error;
            return result;
        }

        string data(static_cast<size_t>(chunk.size()), '\0');

        if (chunk.size())
        {
            if (!file->fread((byte*)&data[0], static_cast<unsigned>(data.size()), chunk.start))
            {
                LOG_err << "Unable to read " << mSource << " at " << chunk.start;
                result.error = TRANSFER_ELOCALIO;
                return result;
            }

            byte mac[SymmCipher::BLOCKSIZE];
            chunkMac(cipher.cipher(), fk.nonce, (const byte*)data.data(), data.size(), mac);

            e = acc.add(chunk.start, chunk.end, mac);
            if (!e.ok())
            {
                result.error = e;
                return result;
            }

            cipher.crypt((byte*)&data[0], data.size(), chunk.start);
        }

        unsigned retries = 0;
        string reply;

        e = sendChunk(chunk, data, reply, token, retries);

        if (retries)
        {
            result.chunkRetries[chunk.start] = retries;
        }

        if (!e.ok())
        {
            result.error = e;
            return result;
        }

        result.bytesDone += chunk.size();
        progress.done = result.bytesDone;
        completion = reply;
    }

    file->fclose();

    if (completion.empty())
    {
        LOG_err << "Upload finished without a completion token";
        result.error = API_EINTERNAL;
        return result;
    }

    auto metamac = acc.finalize();
    if (!metamac)
    {
        result.error = metamac.error();
        return result;
    }

    memcpy(fk.metamac, metamac->data(), sizeof fk.metamac);
    string nodekey = fk.nodeKey();

    auto wrapped = mSession.wrapWithMasterKey(nodekey);
    if (!wrapped)
    {
        result.error = wrapped.error();
        return result;
    }

    NodeAttributes attrs;
    attrs.name = mName;

    auto attrstring = encryptAttributes(attrs, nodekey);
    if (!attrstring)
    {
        result.error = attrstring.error();
        return result;
    }

    NewNode nn;
    nn.type = FILENODE;
    nn.uploadtoken = completion;
    nn.attrstring = std::move(*attrstring);
    nn.nodekey = std::move(*wrapped);

    auto record = mSession.putNode(mParent, nn);
    if (!record)
    {
        result.error = record.error();
        return result;
    }

    mCreated = *record;
    result.nodehandle = mCreated.nodehandle;

    LOG_info << "Upload of " << mSource << " finished as " << Base64::handleToB64(result.nodehandle, NODEHANDLE);
    return result;
}

// a reply of a negative number is an API error code
static bool uploadError(const string& body, Error& e)
{
    if (body.size() < 2 || body.size() > 4 || body[0] != '-')
    {
        return false;
    }

    for (size_t i = 1; i < body.size(); i++)
    {
        if (!isdigit(static_cast<unsigned char>(body[i])))
        {
            return false;
        }
    }

    e = static_cast<ErrorCodes>(atoi(body.c_str()));
    return true;
}

Error UploadTask::sendChunk(const ChunkRange& chunk, const string& data, string& reply,
                            CancelToken& token, unsigned& retries)
{
    string url = mUrl + "/" + std::to_string(chunk.start);

    for (;;)
    {
        auto response = mHttp.post(url, data, mSettings.network.timeout);
        Error e = response ? httpStatusError(response->status) : response.error();

        if (e.ok() && !uploadError(response->body, e))
        {
            reply = response->body;
            return API_OK;
        }

        if (!e.transient())
        {
            LOG_err << "Upload of chunk at " << chunk.start << " failed: " << e;
            return e;
        }

        if (retries >= mSettings.network.maxRetries)
        {
            LOG_err << "Upload of chunk at " << chunk.start << " failed after " << retries << " retries: " << e;
            return TRANSFER_ERETRIES;
        }

        auto delay = BackoffTimer::delay(retries, mSettings.network.minRetryDelay, mSettings.network.maxRetryDelay);
        retries++;

        LOG_warn << "Upload of chunk at " << chunk.start << " failed (" << e << "), retry " << retries
                 << " in " << delay.count() << " ms";

        if (!token.waitFor(delay))
        {
            return token.stopError();
        }
    }
}

} // namespace
