/**
 * @file error.cpp
 * @brief Error codes and classification
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

#include "megaflow/error.h"

namespace megaflow {

errorcategory_t errorcategory(error e)
{
    if (e == API_OK)
    {
        return ERRCAT_NONE;
    }

    if (e > -1000)
    {
        return ERRCAT_PROTOCOL;
    }

    switch (-e / 100)
    {
        case 11: return ERRCAT_CRYPTO;
        case 12: return ERRCAT_TRANSPORT;
        case 13: return ERRCAT_TREE;
        case 14: return ERRCAT_TRANSFER;
        case 15: return ERRCAT_SESSION;
        default: return ERRCAT_PROTOCOL;
    }
}

errorcategory_t Error::category() const
{
    return errorcategory(mError);
}

bool Error::transient() const
{
    return category() == ERRCAT_TRANSPORT
        || mError == API_EAGAIN
        || mError == API_ERATELIMIT;
}

const char* errorstring(error e)
{
    switch (e)
    {
        case API_OK:
            return "No error";
        case API_EINTERNAL:
            return "Internal error";
        case API_EARGS:
            return "Invalid argument";
        case API_EAGAIN:
            return "Request failed, retrying";
        case API_ERATELIMIT:
            return "Rate limit exceeded";
        case API_EFAILED:
            return "Failed permanently";
        case API_ETOOMANY:
            return "Too many concurrent connections or transfers";
        case API_ERANGE:
            return "Out of range";
        case API_EEXPIRED:
            return "Expired";
        case API_ENOENT:
            return "Not found";
        case API_ECIRCULAR:
            return "Circular linkage detected";
        case API_EACCESS:
            return "Access denied";
        case API_EEXIST:
            return "Already exists";
        case API_EINCOMPLETE:
            return "Incomplete";
        case API_EKEY:
            return "Invalid key/Decryption error";
        case API_ESID:
            return "Bad session ID";
        case API_EBLOCKED:
            return "Blocked";
        case API_EOVERQUOTA:
            return "Over quota";
        case API_ETEMPUNAVAIL:
            return "Temporarily not available";
        case API_ETOOMANYCONNECTIONS:
            return "Connection overflow";
        case API_EWRITE:
            return "Write error";
        case API_EREAD:
            return "Read error";
        case API_EAPPKEY:
            return "Invalid application key";
        case API_ESSL:
            return "SSL verification failed";
        case API_EGOINGOVERQUOTA:
            return "Not enough quota";
        case API_EMFAREQUIRED:
            return "Multi-factor authentication required";
        case API_EMASTERONLY:
            return "Access denied for users";
        case API_EBUSINESSPASTDUE:
            return "Business account has expired";
        case API_EPAYWALL:
            return "Storage Quota Exceeded. Upgrade now";
        case CRYPTO_EINVALIDKEY:
            return "Invalid key";
        case CRYPTO_EMALFORMED:
            return "Malformed plaintext";
        case TRANSPORT_ECONNECT:
            return "Connection failed";
        case TRANSPORT_ETIMEOUT:
            return "Request timed out";
        case TRANSPORT_EHTTP:
            return "Unexpected HTTP status";
        case TREE_EORPHAN:
            return "Orphan node";
        case TREE_ECYCLIC:
            return "Move would create a cycle";
        case TREE_ENOTFOUND:
            return "Node not found";
        case TREE_ENOTFOLDER:
            return "Not a folder";
        case TRANSFER_EINTEGRITY:
            return "Integrity check failed";
        case TRANSFER_ERETRIES:
            return "Retries exhausted";
        case TRANSFER_ECANCELLED:
            return "Transfer cancelled";
        case TRANSFER_EPAUSED:
            return "Transfer paused";
        case TRANSFER_ELOCALIO:
            return "Local I/O error";
        case TRANSFER_ENOKEY:
            return "No file key";
        case SESSION_ECLOSED:
            return "Session closed";
        case SESSION_EAUTH:
            return "Authentication failed";
        case SESSION_ENOTAUTH:
            return "Not authenticated";
        case SESSION_EREADONLY:
            return "Read-only session";
        case SESSION_EBADLINK:
            return "Invalid link";
    }

    return "Unknown error";
}

std::ostream& operator<<(std::ostream& ostr, const Error& e)
{
    return ostr << errorstring(e) << " (" << static_cast<int>(error(e)) << ")";
}

} // namespace
