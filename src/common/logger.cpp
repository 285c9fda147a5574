#include <sstream>
#include <thread>

#include <megaflow/common/logger.h>
#include <megaflow/common/utility.h>
#include <megaflow/logging.h>

namespace megaflow
{
namespace common
{

Logger::Logger(std::string name)
  : mName(std::move(name))
{
}

std::runtime_error Logger::error(const char* filename,
                                 const char* format,
                                 unsigned int line,
                                 ...) const
{
    std::va_list arguments;

    va_start(arguments, line);

    std::string message = formatv(arguments, format);

    va_end(arguments);

    log(filename, message, line, logError);

    return std::runtime_error(mName.empty() ? message : mName + ": " + message);
}

void Logger::log(const char* filename,
                 const std::string& message,
                 unsigned int line,
                 int severity) const
{
    if (masked(severity))
        return;

    std::ostringstream ostream;

    if (!mName.empty())
        ostream << "[" << mName << "] ";

    ostream << "(" << std::this_thread::get_id() << ") " << message;

    SimpleLogger::postLog(static_cast<LogLevel>(severity),
                          ostream.str().c_str(),
                          filename,
                          static_cast<int>(line));
}

void Logger::log(const char* filename,
                 const char* format,
                 unsigned int line,
                 int severity,
                 ...) const
{
    if (masked(severity))
        return;

    std::va_list arguments;

    va_start(arguments, severity);

    std::string message = formatv(arguments, format);

    va_end(arguments);

    log(filename, message, line, severity);
}

bool Logger::masked(int severity) const
{
    return severity > SimpleLogger::getLogLevel();
}

} // common
} // megaflow

