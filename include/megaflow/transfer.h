/**
 * @file megaflow/transfer.h
 * @brief File downloads and uploads
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

#ifndef MEGAFLOW_TRANSFER_H
#define MEGAFLOW_TRANSFER_H 1

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

#include "chunkmac.h"
#include "filecrypto.h"
#include "filesystem.h"
#include "http.h"
#include "node.h"
#include "session.h"

namespace megaflow {

typedef enum { TOKEN_RUNNING = 0, TOKEN_PAUSE, TOKEN_CANCEL } tokenstate_t;

// cooperative stop signal, observed between chunks and during retry waits
class MEGAFLOW_API CancelToken
{
    mutable std::mutex mMutex;
    mutable std::condition_variable mCV;
    tokenstate_t mState = TOKEN_RUNNING;

public:
    // no effect once cancelled
    void pause();
    void cancel();

    tokenstate_t state() const;
    bool running() const { return state() == TOKEN_RUNNING; }

    // TRANSFER_EPAUSED or TRANSFER_ECANCELLED, API_OK while running
    Error stopError() const;

    // sleeps up to `delay`; false if a stop was requested meanwhile
    bool waitFor(std::chrono::milliseconds delay) const;
};

typedef shared_ptr<CancelToken> CancelTokenPtr;

// live byte counters, read by the scheduler while a task runs
struct MEGAFLOW_API TransferProgress
{
    std::atomic<m_off_t> done{0};
    std::atomic<m_off_t> total{0};

    // budget units the scheduler granted this run, 0 when run directly
    std::atomic<unsigned> weight{0};
};

struct MEGAFLOW_API TransferSettings
{
    NetworkSettings network;

    // upper bound on concurrent chunk requests within one download
    static const unsigned MAX_LANES = 10;

    // chunk requests in flight when no scheduler weight is given
    unsigned parallelism = 1;

    // keep `.partial` files of cancelled downloads
    bool keepPartial = true;

    // re-read resumed bytes so the MAC still covers the whole file
    bool verifyResumed = true;
};

struct MEGAFLOW_API TransferResult
{
    Error error = API_OK;

    m_off_t size = -1;
    m_off_t bytesDone = 0;

    // retries per chunk, keyed by chunk offset; chunks without retries are absent
    map<m_off_t, unsigned> chunkRetries;

    bool macVerified = false;

    // downloads: final file
    string path;

    // uploads: the new node
    handle nodehandle = UNDEF;

    unsigned totalRetries() const;
};

// progress record of a download, stored beside the partial file
struct MEGAFLOW_API TransferCheckpoint
{
    static const char* const FORMAT;

    handle nodehandle = UNDEF;
    m_off_t size = -1;
    m_off_t watermark = 0;
    string target;

    // identifies the file key without storing it
    string keydigest;

    string serialize() const;
    bool parse(const string& data);

    bool load(FileSystemAccess& fsaccess, const string& path);
    bool save(FileSystemAccess& fsaccess, const string& path) const;

    static string digest(const string& nodekey);
};

// the highest offset below which every chunk is done
class MEGAFLOW_API ChunkWatermark
{
    m_off_t mWatermark = 0;
    map<m_off_t, m_off_t> mDone;

public:
    explicit ChunkWatermark(m_off_t start = 0) : mWatermark(start) { }

    // true if the watermark moved
    bool add(m_off_t start, m_off_t end);

    m_off_t value() const { return mWatermark; }
};

/**
 * @brief Download of one file node into a local path.
 *
 * Data goes to `<target>.partial`, progress to `<target>.partial.resume`;
 * the target only appears once the content MAC has been checked. A target
 * that is already complete is left as it is.
 */
class MEGAFLOW_API DownloadTask
{
public:
    DownloadTask(Session& session,
                 HttpIO& http,
                 FileSystemAccess& fsaccess,
                 const Node& node,
                 const string& target,
                 const TransferSettings& settings);

    TransferResult run(CancelToken& token, TransferProgress& progress);

    string partialPath() const { return mTarget + ".partial"; }
    string checkpointPath() const { return mTarget + ".partial.resume"; }

private:
    struct Lanes;

    // true if the target already holds a file of the node's size and no
    // download of it is pending
    bool completed();

    // restores progress from the checkpoint; returns the watermark to start at
    m_off_t resume(FileAccess& partial, FileCipher& cipher, MacAccumulator& acc, bool& verify);

    Error fetchChunk(const ChunkRange& chunk, FileCipher& cipher, FileAccess& partial,
                     byte* mac, CancelToken& token, unsigned& retries);

    void lane(Lanes& lanes, CancelToken& token, TransferProgress& progress);

    void discard();

    Session& mSession;
    HttpIO& mHttp;
    FileSystemAccess& mFsAccess;

    handle mHandle;
    bool mPublicHandle;
    string mNodeKey;
    m_off_t mNodeSize;
    string mTarget;
    TransferSettings mSettings;

    // from the `g` reply
    string mUrl;
    m_off_t mSize = -1;
};

// upload of one local file into a remote folder
class MEGAFLOW_API UploadTask
{
public:
    UploadTask(Session& session,
               HttpIO& http,
               FileSystemAccess& fsaccess,
               const string& source,
               handle parent,
               const string& name,
               const TransferSettings& settings);

    TransferResult run(CancelToken& token, TransferProgress& progress);

    // valid after a successful run
    const NodeRecord& created() const { return mCreated; }

private:
    // sends one encrypted chunk; `reply` receives the server's answer
    Error sendChunk(const ChunkRange& chunk, const string& data, string& reply,
                    CancelToken& token, unsigned& retries);

    Session& mSession;
    HttpIO& mHttp;
    FileSystemAccess& mFsAccess;

    string mSource;
    handle mParent;
    string mName;
    TransferSettings mSettings;

    string mUrl;
    NodeRecord mCreated;
};

} // namespace

#endif
