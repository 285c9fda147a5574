/**
 * @file megaflow/logging.h
 * @brief Logging class
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

// Records are built with the LOG_<level> stream macros and handed to a single
// output object when the statement ends:
//
//     SimpleLogger::setLogLevel(logDebug);
//     SimpleLogger::setOutputClass(&myOutput);
//     LOG_info << "fetching " << count << " chunks";
//
// Statements above the current level cost one atomic load and evaluate
// none of their operands.

#ifndef MEGAFLOW_LOGGING_H
#define MEGAFLOW_LOGGING_H 1

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <type_traits>

#include "types.h"

namespace megaflow {

enum LogLevel
{
    logFatal = 0,
    logError,
    logWarning,
    logInfo,
    logDebug,
    logMax      // verbose
};

// parses "err", "warn", "info", "debug" etc; unknown names map to logInfo
LogLevel toLogLevel(const std::string& name);

class MEGAFLOW_API Logger
{
public:
    virtual ~Logger() = default;
    virtual void log(const char *time, int loglevel, const char *source, const char *message) = 0;
};

typedef std::function<void(const char *time, int loglevel, const char *source, const char *message)> LogCallback;

// Default output: fans out to registered callbacks and optionally stderr.
class MEGAFLOW_API ExternalLogger : public Logger
{
public:
    void addMegaLogger(void* id, LogCallback lc);
    void removeMegaLogger(void* id);
    void setLogToConsole(bool enable);

    void log(const char *time, int loglevel, const char *source, const char *message) override;

private:
    std::map<void*, LogCallback> mCallbacks;
    std::recursive_mutex mMutex;
    bool mToConsole = false;

    // set while callbacks run, so a callback that logs is not re-entered
    bool mDispatching = false;
};

extern ExternalLogger g_externalLogger;

// One log record; emitted to the output class on destruction.
class MEGAFLOW_API SimpleLogger
{
public:
    SimpleLogger(LogLevel ll, const char* filename, int line);
    ~SimpleLogger();

    SimpleLogger(const SimpleLogger&) = delete;
    SimpleLogger& operator=(const SimpleLogger&) = delete;

    static const char *toStr(LogLevel ll);

    template <typename T>
    SimpleLogger& operator<<(T* obj)
    {
        if (obj)
        {
            mStream << obj;
        }
        else
        {
            mStream << "(NULL)";
        }
        return *this;
    }

    template <typename T, typename = typename std::enable_if<std::is_scalar<T>::value>::type>
    SimpleLogger& operator<<(const T obj)
    {
        static_assert(!std::is_same<T, std::nullptr_t>::value, "T cannot be nullptr_t");
        mStream << obj;
        return *this;
    }

    template <typename T, typename = typename std::enable_if<!std::is_scalar<T>::value>::type>
    SimpleLogger& operator<<(const T& obj)
    {
        mStream << obj;
        return *this;
    }

    // nullptr silences all output
    static void setOutputClass(Logger *output);

    // records above this level are dropped
    static void setLogLevel(LogLevel ll);
    static LogLevel getLogLevel();

    // post a preformatted message, bypassing the LOG_<level> macros
    static void postLog(LogLevel ll, const char *message, const char *filename, int line);

private:
    static std::string now();

    static Logger* sOutput;
    static std::atomic<LogLevel> sLevel;

    LogLevel mLevel;
    std::ostringstream mStream;
    std::string mTime;
    std::string mSource;
};

// source file leaf name
template<std::size_t N> inline const char* log_file_leafname(const char (&fullpath)[N])
{
    for (auto i = N - 1; --i; )
    {
        if (fullpath[i] == '/' || fullpath[i] == '\\')
            return &fullpath[i + 1];
    }
    return fullpath;
}

// turns the SimpleLogger expression into void, to match the other branch of ?:
struct LoggerVoidify
{
    void operator&(SimpleLogger&) {}
};

#define MEGAFLOW_LOG(ll) \
    ::megaflow::SimpleLogger::getLogLevel() < (ll) ? (void)0 : \
        ::megaflow::LoggerVoidify() & ::megaflow::SimpleLogger((ll), ::megaflow::log_file_leafname(__FILE__), __LINE__)

#define LOG_verbose MEGAFLOW_LOG(::megaflow::logMax)
#define LOG_debug   MEGAFLOW_LOG(::megaflow::logDebug)
#define LOG_info    MEGAFLOW_LOG(::megaflow::logInfo)
#define LOG_warn    MEGAFLOW_LOG(::megaflow::logWarning)
#define LOG_err     MEGAFLOW_LOG(::megaflow::logError)

// never filtered
#define LOG_fatal \
    ::megaflow::SimpleLogger(::megaflow::logFatal, ::megaflow::log_file_leafname(__FILE__), __LINE__)

} // namespace

#endif
