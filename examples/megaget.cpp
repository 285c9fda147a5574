/**
 * @file examples/megaget.cpp
 * @brief Downloads a MEGA file or folder tree
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

#include <cstdlib>
#include <cstring>
#include <iostream>

#include "megaflow.h"

using namespace megaflow;
using std::cout;
using std::cerr;
using std::endl;

static const char* USAGE =
    "Usage: megaget <link | mega:/path> [config=<file>] [name=value ...]\n"
    "\n"
    "  <link>        public file or folder link\n"
    "  mega:/path    file or folder in your own account; needs MEGA_EMAIL and\n"
    "                MEGA_PWD, and MEGA_PIN if two-factor login is enabled\n"
    "\n"
    "  config=<file> configuration file (default: config.json)\n"
    "  name=value    overrides a configuration field, e.g. max_workers=4\n"
    "\n"
    "Set MEGA_DEBUG=1 for debug logging.";

static const char* const MEGA_SCHEME = "mega:";

static string env(const char* name)
{
    const char* value = getenv(name);
    return value ? value : "";
}

// node names must not escape their folder
static string localName(const string& name)
{
    if (name.empty() || name == "." || name == "..")
    {
        return "_";
    }

    string out = name;

    for (char& c : out)
    {
        if (c == '/' || c == '\\' || c == '\0')
        {
            c = '_';
        }
    }

    return out;
}

static Error openSession(Session& session, const string& url)
{
    if (url.compare(0, strlen(MEGA_SCHEME), MEGA_SCHEME))
    {
        return session.openPublicLink(url);
    }

    string email = env("MEGA_EMAIL");
    string password = env("MEGA_PWD");

    if (email.empty() || password.empty())
    {
        cerr << "MEGA_EMAIL and MEGA_PWD must be set for " << url << endl;
        return SESSION_EAUTH;
    }

    Error e = session.login(email, password, env("MEGA_PIN"));

    if (!e.ok() && session.state() == STATE_CHALLENGED)
    {
        cerr << "This account needs a second factor: set MEGA_PIN" << endl;
    }

    return e;
}

static common::ErrorOr<Node> resolveTarget(const NodeTree& tree, const Session& session, const string& url)
{
    vector<Node> roots = tree.roots();

    if (session.publicLink())
    {
        if (roots.empty())
        {
            return common::unexpected(Error(TREE_ENOTFOUND));
        }
        return roots.front();
    }

    for (const auto& root : roots)
    {
        if (root.type == ROOTNODE)
        {
            return tree.resolvePath(root.nodehandle, url.substr(strlen(MEGA_SCHEME)));
        }
    }

    return common::unexpected(Error(TREE_ENOTFOUND));
}

int main(int argc, char* argv[])
{
    auto arguments = ArgumentsParser::parse(argc, argv);

    if (arguments.contains("-h") || arguments.positionals().size() != 1)
    {
        cout << USAGE << endl;
        return arguments.contains("-h") ? 0 : 1;
    }

    g_externalLogger.setLogToConsole(true);
    SimpleLogger::setLogLevel(env("MEGA_DEBUG") == "1" ? logDebug : logWarning);

    PosixFileSystemAccess fsaccess;
    Config config = Config::load(fsaccess, arguments.getValue("config", "config.json"));

    for (const auto& value : arguments.values())
    {
        if (value.first == "config" || value.first == "-h")
        {
            continue;
        }

        Error e = config.set(value.first, value.second);

        if (e == API_ENOENT)
        {
            cerr << "Unknown option: " << value.first << endl << USAGE << endl;
            return 1;
        }

        if (!e.ok())
        {
            cerr << "Bad value for " << value.first << ": " << value.second << endl;
            return 1;
        }
    }

    if (!config.validate().ok())
    {
        cerr << "Invalid configuration" << endl;
        return 1;
    }

    const string& url = arguments.positionals().front();

    CurlHttpIO http(config.proxySettings());
    Session session(http, config.networkSettings());

    Error e = openSession(session, url);
    if (!e.ok())
    {
        cerr << "Unable to open " << url << ": " << errorstring(e) << endl;
        return 1;
    }

    NodeTree tree;

    e = tree.fetch(session);
    if (!e.ok())
    {
        cerr << "Unable to list " << url << ": " << errorstring(e) << endl;
        return 1;
    }

    auto target = resolveTarget(tree, session, url);
    if (!target)
    {
        cerr << "Not found: " << url << " (" << errorstring(target.error()) << ")" << endl;
        return 1;
    }

    // local path of every file below the target, folders mapped as they are visited
    vector<pair<Node, string>> files;
    map<handle, string> folders;

    e = tree.walk(target->nodehandle, [&](const Node& n, const string&) {
        auto parent = folders.find(n.parenthandle);
        string local = (n.nodehandle == target->nodehandle || parent == folders.end())
                     ? config.downloadDir + "/" + localName(n.name())
                     : parent->second + "/" + localName(n.name());

        if (n.isFile())
        {
            files.emplace_back(n, local);
        }
        else
        {
            folders[n.nodehandle] = local;
        }
    });

    if (!e.ok())
    {
        cerr << "Unable to expand " << url << ": " << errorstring(e) << endl;
        return 1;
    }

    TransferSettings settings = config.transferSettings();
    Scheduler scheduler(std::make_unique<ConcurrencyBudget>(config.concurrencyBudget),
                        config.executorFlags());

    for (const auto& file : files)
    {
        auto task = std::make_shared<DownloadTask>(session, http, fsaccess, file.first, file.second, settings);

        Job job;
        job.label = file.second;
        job.weight = config.downloadWeight(file.first.size);
        job.run = [task](CancelToken& token, TransferProgress& progress) {
            return task->run(token, progress);
        };

        scheduler.submit(std::move(job));
    }

    auto outcomes = scheduler.wait();

    for (const auto& outcome : outcomes)
    {
        const TransferResult& r = outcome.result;

        if (r.error.ok())
        {
            cout << "OK      " << outcome.label << " (" << r.bytesDone << " bytes";
            if (r.totalRetries())
            {
                cout << ", " << r.totalRetries() << " retries";
            }
            cout << ")" << endl;
        }
        else
        {
            cout << "FAILED  " << outcome.label << ": " << errorstring(r.error) << endl;
        }
    }

    if (!session.publicLink())
    {
        e = session.logout();
        if (!e.ok())
        {
            LOG_warn << "Logout failed: " << e;
        }
    }

    return Scheduler::exitStatus(outcomes);
}
