/**
 * @file config.cpp
 * @brief Tunables, loaded from and saved to a JSON file
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
#include <ctime>

#include "megaflow/config.h"
#include "megaflow/json.h"
#include "megaflow/logging.h"

namespace megaflow {

static const char* const BACKUP_SUFFIX = ".backup.";

// hand-edited files may be indented; the scanner expects compact input
static string compact(const string& data)
{
    string out;
    bool quoted = false;
    bool escaped = false;

    out.reserve(data.size());

    for (char c : data)
    {
        if (quoted)
        {
            quoted = escaped || c != '"';
            escaped = c == '\\' && !escaped;
        }
        else if (isspace(static_cast<unsigned char>(c)))
        {
            continue;
        }
        else if (c == '"')
        {
            quoted = true;
        }

        out += c;
    }

    return out;
}

static bool parseUnsigned(const string& value, unsigned& out)
{
    if (value.empty() || value.size() > 9)
    {
        return false;
    }

    unsigned n = 0;

    for (char c : value)
    {
        if (c < '0' || c > '9')
        {
            return false;
        }

        n = n * 10 + static_cast<unsigned>(c - '0');
    }

    out = n;
    return true;
}

static bool parseBool(const string& value, bool& out)
{
    if (value == "true" || value == "1")
    {
        out = true;
    }
    else if (value == "false" || value == "0")
    {
        out = false;
    }
    else
    {
        return false;
    }

    return true;
}

Error Config::validate() const
{
    struct Bound
    {
        const char* name;
        unsigned value;
        unsigned min;
        unsigned max;
    };

    const Bound bounds[] = {
        { "max_workers", maxWorkers, 1, MAX_WORKERS },
        { "concurrency_budget", concurrencyBudget, 1, MAX_BUDGET },
        { "max_retries", maxRetries, 0, MAX_RETRIES },
        { "timeout", timeout, 1, MAX_TIMEOUT },
        { "max_retry_delay", maxRetryDelay, 0, MAX_RETRY_DELAY },
    };

    for (const auto& b : bounds)
    {
        if (b.value < b.min || b.value > b.max)
        {
            LOG_err << "Config: " << b.name << " must be within " << b.min << ".." << b.max
                    << ", got " << b.value;
            return API_EARGS;
        }
    }

    if (minRetryDelay > maxRetryDelay)
    {
        LOG_err << "Config: min_retry_delay (" << minRetryDelay << ") exceeds max_retry_delay ("
                << maxRetryDelay << ")";
        return API_EARGS;
    }

    if (proxyMode != PROXY_NONE && proxies.empty())
    {
        LOG_err << "Config: proxy_mode " << proxyModeName(proxyMode) << " needs at least one proxy";
        return API_EARGS;
    }

    if (downloadDir.empty())
    {
        LOG_err << "Config: download_dir is empty";
        return API_EARGS;
    }

    return API_OK;
}

Error Config::set(const string& name, const string& value)
{
    bool ok;

    if (name == "max_workers")
    {
        ok = parseUnsigned(value, maxWorkers);
    }
    else if (name == "concurrency_budget")
    {
        ok = parseUnsigned(value, concurrencyBudget);
    }
    else if (name == "max_retries")
    {
        ok = parseUnsigned(value, maxRetries);
    }
    else if (name == "timeout")
    {
        ok = parseUnsigned(value, timeout);
    }
    else if (name == "min_retry_delay")
    {
        ok = parseUnsigned(value, minRetryDelay);
    }
    else if (name == "max_retry_delay")
    {
        ok = parseUnsigned(value, maxRetryDelay);
    }
    else if (name == "proxy_mode")
    {
        ok = proxyModeFromName(value, proxyMode);
    }
    else if (name == "proxies")
    {
        proxies.clear();

        for (size_t start = 0; start < value.size(); )
        {
            size_t end = value.find(',', start);
            if (end == string::npos)
            {
                end = value.size();
            }

            if (end > start)
            {
                proxies.push_back(value.substr(start, end - start));
            }

            start = end + 1;
        }

        ok = true;
    }
    else if (name == "download_dir")
    {
        downloadDir = value;
        ok = true;
    }
    else if (name == "keep_partial")
    {
        ok = parseBool(value, keepPartial);
    }
    else if (name == "verify_resumed")
    {
        ok = parseBool(value, verifyResumed);
    }
    else
    {
        return API_ENOENT;
    }

    if (!ok)
    {
        LOG_err << "Config: bad value for " << name << ": " << value;
        return API_EARGS;
    }

    return API_OK;
}

string Config::serialize() const
{
    JSONWriter w;

    w.beginobject();
    w.arg("max_workers", m_off_t(maxWorkers));
    w.arg("concurrency_budget", m_off_t(concurrencyBudget));
    w.arg("max_retries", m_off_t(maxRetries));
    w.arg("timeout", m_off_t(timeout));
    w.arg("min_retry_delay", m_off_t(minRetryDelay));
    w.arg("max_retry_delay", m_off_t(maxRetryDelay));
    w.arg("proxy_mode", proxyModeName(proxyMode));

    w.beginarray("proxies");
    for (const auto& p : proxies)
    {
        w.element(JSONWriter::escape(p.data(), p.size()));
    }
    w.endarray();

    w.arg_stringWithEscapes("download_dir", downloadDir);
    w.arg("keep_partial", keepPartial ? "true" : "false", 0);
    w.arg("verify_resumed", verifyResumed ? "true" : "false", 0);
    w.endobject();

    return w.getstring();
}

bool Config::parse(const string& data)
{
    string input = compact(data);
    JSON json(input.c_str());

    if (!json.enterobject())
    {
        return false;
    }

    for (;;)
    {
        if (*json.pos == '}')
        {
            json.pos++;
            return json.atend();
        }

        string name = json.getname();
        if (name.empty())
        {
            return false;
        }

        Error e;

        if (name == "proxies")
        {
            if (!json.enterarray())
            {
                return false;
            }

            string proxy;
            string list;

            while (json.storestring(&proxy))
            {
                list += list.empty() ? proxy : "," + proxy;
            }

            if (!json.leavearray())
            {
                return false;
            }

            e = set(name, list);
        }
        else
        {
            string value;

            if (*json.pos == '"' ? !json.storestring(&value) : !json.storeobject(&value))
            {
                return false;
            }

            e = set(name, value);
        }

        if (e == API_ENOENT)
        {
            LOG_warn << "Config: ignoring unknown field " << name;
        }
        else if (!e.ok())
        {
            return false;
        }
    }
}

Config Config::load(FileSystemAccess& fsaccess, const string& path)
{
    Config config;

    if (!fsaccess.existslocal(path))
    {
        LOG_info << "Config: writing defaults to " << path;

        if (!config.save(fsaccess, path))
        {
            LOG_warn << "Config: unable to write " << path;
        }

        return config;
    }

    string data;

    if (fsaccess.readfile(path, data) && config.parse(data) && config.validate().ok())
    {
        return config;
    }

    string backup = path + BACKUP_SUFFIX + std::to_string(static_cast<long long>(time(nullptr)));

    LOG_warn << "Config: " << path << " is invalid, moving it to " << backup;

    if (!fsaccess.renamelocal(path, backup))
    {
        LOG_err << "Config: unable to back up " << path;
    }

    config = Config();

    if (!config.save(fsaccess, path))
    {
        LOG_warn << "Config: unable to write " << path;
    }

    return config;
}

bool Config::save(FileSystemAccess& fsaccess, const string& path) const
{
    string dir = parentpath(path);

    if (!dir.empty() && !fsaccess.mkdirlocal(dir))
    {
        return false;
    }

    return fsaccess.writefileatomic(path, serialize());
}

unsigned Config::downloadWeight(m_off_t size) const
{
    const m_off_t MIB = 1 << 20;
    unsigned weight;

    if (size < 5 * MIB)
    {
        weight = 1;
    }
    else if (size < 20 * MIB)
    {
        weight = 2;
    }
    else if (size < 100 * MIB)
    {
        weight = 5;
    }
    else
    {
        weight = 10;
    }

    return std::min(weight, concurrencyBudget ? concurrencyBudget : 1u);
}

NetworkSettings Config::networkSettings() const
{
    NetworkSettings settings;

    settings.timeout = std::chrono::seconds(timeout);
    settings.maxRetries = maxRetries;
    settings.minRetryDelay = std::chrono::seconds(minRetryDelay);
    settings.maxRetryDelay = std::chrono::seconds(maxRetryDelay);

    return settings;
}

ProxySettings Config::proxySettings() const
{
    ProxySettings settings;

    settings.mode = proxyMode;
    settings.proxies = proxies;

    return settings;
}

TransferSettings Config::transferSettings() const
{
    TransferSettings settings;

    settings.network = networkSettings();
    settings.keepPartial = keepPartial;
    settings.verifyResumed = verifyResumed;

    return settings;
}

common::TaskExecutorFlags Config::executorFlags() const
{
    common::TaskExecutorFlags flags;

    flags.mMaxWorkers = maxWorkers;

    return flags;
}

} // namespace
