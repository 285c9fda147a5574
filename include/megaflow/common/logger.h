#pragma once

#include <cstdarg>
#include <stdexcept>
#include <string>

#include <megaflow/common/logger_forward.h>

namespace megaflow
{
namespace common
{

// Subsystem logger: prefixes each message with its name and the calling
// thread, then posts it through SimpleLogger.
class Logger
{
    // Prefix, empty for none.
    const std::string mName;

public:
    explicit Logger(std::string name);

    Logger(const Logger& other) = delete;

    Logger& operator=(const Logger& rhs) = delete;

    // Log at logError and build the exception the caller throws.
    std::runtime_error error(const char* filename,
                             const char* format,
                             unsigned int line,
                             ...) const;

    void log(const char* filename,
             const std::string& message,
             unsigned int line,
             int severity) const;

    void log(const char* filename,
             const char* format,
             unsigned int line,
             int severity,
             ...) const;

    // True if SimpleLogger would drop a message at this severity.
    bool masked(int severity) const;

    const std::string& name() const
    {
        return mName;
    }
}; // Logger

} // common
} // megaflow

