/**
 * @file posix/net.cpp
 * @brief POSIX network access layer (using cURL)
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

#include "megaflow/logging.h"
#include "megaflow/posix/meganet.h"

namespace megaflow {

using common::ErrorOr;
using common::unexpected;

namespace {

std::once_flag curlGlobalInit;

} // namespace

CurlHttpIO::CurlHttpIO(const ProxySettings& proxy, const string& useragent)
    : mProxy(proxy)
    , mUserAgent(useragent)
{
    std::call_once(curlGlobalInit, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });

    curlsh = curl_share_init();
    curl_share_setopt(curlsh, CURLSHOPT_LOCKFUNC, lock_share);
    curl_share_setopt(curlsh, CURLSHOPT_UNLOCKFUNC, unlock_share);
    curl_share_setopt(curlsh, CURLSHOPT_USERDATA, this);
    curl_share_setopt(curlsh, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(curlsh, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);

    contenttypejson = curl_slist_append(NULL, "Content-Type: application/json");
    contenttypejson = curl_slist_append(contenttypejson, "Expect:");

    contenttypebinary = curl_slist_append(NULL, "Content-Type: application/octet-stream");
    contenttypebinary = curl_slist_append(contenttypebinary, "Expect:");

    LOG_debug << "cURL transport ready, proxy mode " << proxyModeName(mProxy.mode);
}

CurlHttpIO::~CurlHttpIO()
{
    curl_share_cleanup(curlsh);
    curl_slist_free_all(contenttypejson);
    curl_slist_free_all(contenttypebinary);
}

void CurlHttpIO::lock_share(CURL*, curl_lock_data data, curl_lock_access, void* userptr)
{
    static_cast<CurlHttpIO*>(userptr)->mShareMutex[data].lock();
}

void CurlHttpIO::unlock_share(CURL*, curl_lock_data data, void* userptr)
{
    static_cast<CurlHttpIO*>(userptr)->mShareMutex[data].unlock();
}

size_t CurlHttpIO::write_data(void* ptr, size_t size, size_t nmemb, void* target)
{
    size_t len = size * nmemb;
    static_cast<string*>(target)->append(static_cast<const char*>(ptr), len);
    return len;
}

string CurlHttpIO::pickProxy()
{
    if (mProxy.mode == PROXY_NONE || mProxy.proxies.empty())
    {
        return string();
    }

    if (mProxy.mode == PROXY_SINGLE)
    {
        return mProxy.proxies.front();
    }

    std::lock_guard<std::mutex> g(mRngMutex);
    return mProxy.proxies[mRng.genuint32(mProxy.proxies.size())];
}

ErrorOr<HttpResponse> CurlHttpIO::post(const string& url, const string& body, std::chrono::seconds timeout)
{
    return perform(url, &body, timeout);
}

ErrorOr<HttpResponse> CurlHttpIO::get(const string& url, std::chrono::seconds timeout)
{
    return perform(url, nullptr, timeout);
}

ErrorOr<HttpResponse> CurlHttpIO::perform(const string& url, const string* body, std::chrono::seconds timeout)
{
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);

    if (!curl)
    {
        LOG_err << "Unable to create a cURL handle";
        return unexpected(Error(TRANSPORT_ECONNECT));
    }

    HttpResponse response;
    bool isApi = url.compare(0, strlen(APIURL), APIURL) == 0;

    if (body)
    {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, isApi ? contenttypejson : contenttypebinary);
    }
    else
    {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, mUserAgent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_ENCODING, "");
    curl_easy_setopt(curl.get(), CURLOPT_SHARE, curlsh);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_data);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, (void*)&response.body);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSLVERSION, CURL_SSLVERSION_TLSv1_2);

    string proxy = pickProxy();
    if (!proxy.empty())
    {
        curl_easy_setopt(curl.get(), CURLOPT_PROXY, proxy.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_PROXYAUTH, CURLAUTH_ANY);
    }
    else
    {
        curl_easy_setopt(curl.get(), CURLOPT_PROXY, "");
    }

    CURLcode res = curl_easy_perform(curl.get());

    if (res == CURLE_OPERATION_TIMEDOUT)
    {
        LOG_warn << "Request timed out: " << (isApi ? "API" : "transfer");
        return unexpected(Error(TRANSPORT_ETIMEOUT));
    }

    if (res != CURLE_OK)
    {
        LOG_warn << "cURL error " << res << ": " << curl_easy_strerror(res);
        return unexpected(Error(TRANSPORT_ECONNECT));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<int>(status);

    LOG_verbose << "HTTP " << response.status << ", " << response.body.size() << " bytes";

    return response;
}

} // namespace
