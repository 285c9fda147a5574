/**
 * @file megaflow/http.h
 * @brief Generic host HTTP I/O interface
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

#ifndef MEGAFLOW_HTTP_H
#define MEGAFLOW_HTTP_H 1

#include <chrono>

#include "common/error_or.h"
#include "error.h"
#include "types.h"

namespace megaflow {

typedef enum { PROXY_NONE = 0, PROXY_SINGLE, PROXY_RANDOM } proxymode_t;

const char* proxyModeName(proxymode_t mode);
bool proxyModeFromName(const string& name, proxymode_t& mode);

struct MEGAFLOW_API ProxySettings
{
    proxymode_t mode = PROXY_NONE;
    vector<string> proxies;
};

// timeouts and retry limits shared by API requests and transfers
struct MEGAFLOW_API NetworkSettings
{
    std::chrono::seconds timeout{20};
    unsigned maxRetries = 3;
    std::chrono::milliseconds minRetryDelay{10000};
    std::chrono::milliseconds maxRetryDelay{30000};
};

struct MEGAFLOW_API HttpResponse
{
    int status = 0;
    string body;
};

// API requests go here
static const char* const APIURL = "https://g.api.mega.co.nz/";

/**
 * @brief Blocking HTTP transport.
 *
 * Implementations must be safe to call from several threads at once. A
 * response is returned for every status code; connection failures and
 * timeouts are reported as TRANSPORT_ECONNECT and TRANSPORT_ETIMEOUT.
 */
struct MEGAFLOW_API HttpIO
{
    virtual common::ErrorOr<HttpResponse> post(const string& url,
                                               const string& body,
                                               std::chrono::seconds timeout) = 0;

    virtual common::ErrorOr<HttpResponse> get(const string& url,
                                              std::chrono::seconds timeout) = 0;

    virtual ~HttpIO() = default;
};

// API_OK for 2xx, TRANSPORT_EHTTP otherwise
Error httpStatusError(int status);

} // namespace

#endif
