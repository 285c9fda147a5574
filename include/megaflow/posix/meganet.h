/**
 * @file megaflow/posix/meganet.h
 * @brief POSIX network access layer (using cURL)
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

#ifndef MEGAFLOW_POSIX_NET_H
#define MEGAFLOW_POSIX_NET_H 1

#include <curl/curl.h>

#include <mutex>

#include "megaflow/crypto/cryptopp.h"
#include "megaflow/http.h"

namespace megaflow {

class MEGAFLOW_API CurlHttpIO : public HttpIO
{
public:
    explicit CurlHttpIO(const ProxySettings& proxy = ProxySettings(),
                        const string& useragent = "megaflow/1.0");
    ~CurlHttpIO() override;

    CurlHttpIO(const CurlHttpIO&) = delete;
    CurlHttpIO& operator=(const CurlHttpIO&) = delete;

    common::ErrorOr<HttpResponse> post(const string& url,
                                       const string& body,
                                       std::chrono::seconds timeout) override;

    common::ErrorOr<HttpResponse> get(const string& url,
                                      std::chrono::seconds timeout) override;

private:
    common::ErrorOr<HttpResponse> perform(const string& url,
                                          const string* body,
                                          std::chrono::seconds timeout);

    // proxy for the next request, empty for a direct connection
    string pickProxy();

    static size_t write_data(void* ptr, size_t size, size_t nmemb, void* target);
    static void lock_share(CURL*, curl_lock_data data, curl_lock_access, void* userptr);
    static void unlock_share(CURL*, curl_lock_data data, void* userptr);

    ProxySettings mProxy;
    string mUserAgent;

    CURLSH* curlsh = nullptr;
    struct curl_slist* contenttypejson = nullptr;
    struct curl_slist* contenttypebinary = nullptr;

    std::mutex mShareMutex[CURL_LOCK_DATA_LAST];

    std::mutex mRngMutex;
    PrnGen mRng;
};

} // namespace

#endif
