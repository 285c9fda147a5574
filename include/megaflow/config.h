/**
 * @file megaflow/config.h
 * @brief Tunables, loaded from and saved to a JSON file
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

#ifndef MEGAFLOW_CONFIG_H
#define MEGAFLOW_CONFIG_H 1

#include "common/task_executor_flags.h"
#include "filesystem.h"
#include "http.h"
#include "transfer.h"

namespace megaflow {

struct MEGAFLOW_API Config
{
    static const unsigned MAX_WORKERS = 10;
    static const unsigned MAX_BUDGET = 100;
    static const unsigned MAX_RETRIES = 100;
    static const unsigned MAX_TIMEOUT = 600;
    static const unsigned MAX_RETRY_DELAY = 3600;

    unsigned maxWorkers = 10;
    unsigned concurrencyBudget = 10;
    unsigned maxRetries = 3;

    // seconds
    unsigned timeout = 20;
    unsigned minRetryDelay = 10;
    unsigned maxRetryDelay = 30;

    proxymode_t proxyMode = PROXY_NONE;
    vector<string> proxies;

    string downloadDir = "downloads";
    bool keepPartial = true;
    bool verifyResumed = true;

    // API_EARGS if a field is out of bounds or inconsistent
    Error validate() const;

    /**
     * @brief Sets one field from its textual form.
     *
     * `proxies` takes a comma-separated list. Bounds are not checked here.
     *
     * @return API_ENOENT for an unknown name, API_EARGS for a malformed value.
     */
    Error set(const string& name, const string& value);

    string serialize() const;

    // unknown fields are skipped; false on a syntax error or a malformed value
    bool parse(const string& data);

    /**
     * @brief Reads the configuration at `path`.
     *
     * A missing file is created with the defaults. A file that fails to
     * parse or validate is moved to `<path>.backup.<unix time>` and replaced
     * by the defaults.
     */
    static Config load(FileSystemAccess& fsaccess, const string& path);

    bool save(FileSystemAccess& fsaccess, const string& path) const;

    // scheduler weight of a download of `size` bytes
    unsigned downloadWeight(m_off_t size) const;

    NetworkSettings networkSettings() const;
    ProxySettings proxySettings() const;
    TransferSettings transferSettings() const;
    common::TaskExecutorFlags executorFlags() const;
};

} // namespace

#endif
