/**
 * @file logging.cpp
 * @brief Logging class
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

#include <ctime>
#include <iostream>

namespace megaflow {

namespace {

const char* const LEVEL_NAMES[] = { "FATAL", "err", "warn", "info", "debug", "verbose" };

} // namespace

ExternalLogger g_externalLogger;

Logger* SimpleLogger::sOutput = &g_externalLogger;

std::atomic<LogLevel> SimpleLogger::sLevel{logInfo};

SimpleLogger::SimpleLogger(LogLevel ll, const char* filename, int line)
    : mLevel(ll)
{
    if (!sOutput)
    {
        return;
    }

    mTime = now();
    mSource = filename ? filename : "";
    if (line >= 0)
    {
        mSource += ":" + std::to_string(line);
    }
}

SimpleLogger::~SimpleLogger()
{
    if (sOutput)
    {
        sOutput->log(mTime.c_str(), mLevel, mSource.c_str(), mStream.str().c_str());
    }
}

// UTC wall clock, seconds resolution
std::string SimpleLogger::now()
{
    char ts[16];
    time_t t = std::time(nullptr);
    std::tm tm{};

    gmtime_r(&t, &tm);

    return std::strftime(ts, sizeof ts, "%H:%M:%S", &tm) ? ts : "";
}

const char* SimpleLogger::toStr(LogLevel ll)
{
    return ll >= logFatal && ll <= logMax ? LEVEL_NAMES[ll] : "";
}

void SimpleLogger::setOutputClass(Logger* output)
{
    sOutput = output;
}

void SimpleLogger::setLogLevel(LogLevel ll)
{
    sLevel = ll;
}

LogLevel SimpleLogger::getLogLevel()
{
    return sLevel;
}

void SimpleLogger::postLog(LogLevel ll, const char* message, const char* filename, int line)
{
    if (sLevel < ll)
    {
        return;
    }

    SimpleLogger record(ll, filename, line);
    if (message)
    {
        record << message;
    }
}

LogLevel toLogLevel(const std::string& name)
{
    for (int i = logFatal; i <= logMax; ++i)
    {
        if (name == LEVEL_NAMES[i])
        {
            return static_cast<LogLevel>(i);
        }
    }
    return logInfo;
}

void ExternalLogger::addMegaLogger(void* id, LogCallback lc)
{
    std::lock_guard<std::recursive_mutex> g(mMutex);
    mCallbacks[id] = std::move(lc);
}

void ExternalLogger::removeMegaLogger(void* id)
{
    std::lock_guard<std::recursive_mutex> g(mMutex);
    mCallbacks.erase(id);
}

void ExternalLogger::setLogToConsole(bool enable)
{
    std::lock_guard<std::recursive_mutex> g(mMutex);
    mToConsole = enable;
}

void ExternalLogger::log(const char* time, int loglevel, const char* source, const char* message)
{
    time = time ? time : "";
    source = source ? source : "";
    message = message ? message : "";

    std::lock_guard<std::recursive_mutex> g(mMutex);

    if (mDispatching)
    {
        return;
    }

    struct Dispatching
    {
        bool& flag;
        explicit Dispatching(bool& f) : flag(f) { flag = true; }
        ~Dispatching() { flag = false; }
    } dispatching(mDispatching);

    for (auto& entry : mCallbacks)
    {
        entry.second(time, loglevel, source, message);
    }

    if (mToConsole)
    {
        std::cerr << "[" << time << "][" << SimpleLogger::toStr(static_cast<LogLevel>(loglevel)) << "] "
                  << message << " [" << source << "]" << std::endl;
    }
}

} // namespace
