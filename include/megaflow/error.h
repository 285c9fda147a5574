/**
 * @file megaflow/error.h
 * @brief Error codes and classification
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

#ifndef MEGAFLOW_ERROR_H
#define MEGAFLOW_ERROR_H 1

#include <ostream>

#include "types.h"

namespace megaflow {

/**
 * @brief Declaration of error codes.
 *
 * Codes 0 to -29 are reported in-band by the API. Local failures live in
 * separate ranges, one per subsystem, so a single value always identifies
 * both the subsystem and the reason.
 */
typedef enum ErrorCodes : int
{
    API_OK = 0,                     ///< Everything OK.
    API_EINTERNAL = -1,             ///< Internal error.
    API_EARGS = -2,                 ///< Bad arguments.
    API_EAGAIN = -3,                ///< Request failed, retry with exponential backoff.
    API_ERATELIMIT = -4,            ///< Too many requests, slow down.
    API_EFAILED = -5,               ///< Request failed permanently.
    API_ETOOMANY = -6,              ///< Too many requests for this resource.
    API_ERANGE = -7,                ///< Resource access out of range.
    API_EEXPIRED = -8,              ///< Resource expired.
    API_ENOENT = -9,                ///< Resource does not exist.
    API_ECIRCULAR = -10,            ///< Circular linkage.
    API_EACCESS = -11,              ///< Access denied.
    API_EEXIST = -12,               ///< Resource already exists.
    API_EINCOMPLETE = -13,          ///< Request incomplete.
    API_EKEY = -14,                 ///< Cryptographic error.
    API_ESID = -15,                 ///< Bad session ID.
    API_EBLOCKED = -16,             ///< Resource administratively blocked.
    API_EOVERQUOTA = -17,           ///< Quota exceeded.
    API_ETEMPUNAVAIL = -18,         ///< Resource temporarily not available.
    API_ETOOMANYCONNECTIONS = -19,  ///< Too many connections on this resource.
    API_EWRITE = -20,               ///< File could not be written to.
    API_EREAD = -21,                ///< File could not be read from.
    API_EAPPKEY = -22,              ///< Invalid or missing application key.
    API_ESSL = -23,                 ///< SSL verification failed
    API_EGOINGOVERQUOTA = -24,      ///< Not enough quota
    API_EMFAREQUIRED = -26,         ///< Multi-factor authentication required
    API_EMASTERONLY = -27,          ///< Access denied for sub-users
    API_EBUSINESSPASTDUE = -28,     ///< Business account expired
    API_EPAYWALL = -29,             ///< Over Disk Quota Paywall

    CRYPTO_EINVALIDKEY = -1100,     ///< Key has the wrong size or could not be unwrapped.
    CRYPTO_EMALFORMED = -1101,      ///< Plaintext is not well formed (usually: wrong key).

    TRANSPORT_ECONNECT = -1200,     ///< Connection could not be established or was dropped.
    TRANSPORT_ETIMEOUT = -1201,     ///< Request timed out.
    TRANSPORT_EHTTP = -1202,        ///< Server answered with an unexpected HTTP status.

    TREE_EORPHAN = -1300,           ///< Node's parent chain never resolved.
    TREE_ECYCLIC = -1301,           ///< Move would make a node its own ancestor.
    TREE_ENOTFOUND = -1302,         ///< No node with that handle or path.
    TREE_ENOTFOLDER = -1303,        ///< Node is not a container.

    TRANSFER_EINTEGRITY = -1400,    ///< Content MAC does not match the node's MAC.
    TRANSFER_ERETRIES = -1401,      ///< Transient failures exceeded the retry limit.
    TRANSFER_ECANCELLED = -1402,    ///< Transfer was cancelled.
    TRANSFER_EPAUSED = -1403,       ///< Transfer was paused, progress kept.
    TRANSFER_ELOCALIO = -1404,      ///< Local file could not be read or written.
    TRANSFER_ENOKEY = -1405,        ///< Node has no usable file key.

    SESSION_ECLOSED = -1500,        ///< Session has been closed.
    SESSION_EAUTH = -1501,          ///< Authentication failed.
    SESSION_ENOTAUTH = -1502,       ///< Session is not (yet) authenticated.
    SESSION_EREADONLY = -1503,      ///< Session only grants read access.
    SESSION_EBADLINK = -1504,       ///< Public link could not be parsed.
} error;

// which subsystem produced an error
typedef enum
{
    ERRCAT_NONE = 0,
    ERRCAT_PROTOCOL,
    ERRCAT_CRYPTO,
    ERRCAT_TRANSPORT,
    ERRCAT_TREE,
    ERRCAT_TRANSFER,
    ERRCAT_SESSION
} errorcategory_t;

class MEGAFLOW_API Error
{
public:
    Error(error err = API_EINTERNAL)
        : mError(err)
    { }

    void setErrorCode(error err)
    {
        mError = err;
    }

    operator error() const { return mError; }

    bool ok() const { return mError == API_OK; }

    errorcategory_t category() const;

    // true if the same request may succeed when repeated later
    bool transient() const;

private:
    error mError = API_EINTERNAL;
};

const char* errorstring(error e);

errorcategory_t errorcategory(error e);

std::ostream& operator<<(std::ostream& ostr, const Error& e);

} // namespace

#endif
