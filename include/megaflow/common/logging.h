#pragma once

#include <megaflow/common/logger.h>
#include <megaflow/logging.h>

// Keep things DRY.
#define Log1(logger, format, severity) do \
{ \
    if (!(logger).masked((severity))) \
        (logger).log(::megaflow::log_file_leafname(__FILE__), \
                     std::string(format), \
                     __LINE__, \
                     (severity)); \
} \
while (0)

#define LogF(logger, format, severity, ...) do \
{ \
    if (!(logger).masked((severity))) \
        (logger).log(::megaflow::log_file_leafname(__FILE__), \
                     (format), \
                     __LINE__, \
                     (severity), \
                     __VA_ARGS__); \
} \
while (0)

// Emit a debug message.
#define LogDebug1(logger, format) \
  Log1((logger), (format), ::megaflow::logDebug)

#define LogDebugF(logger, format, ...) \
  LogF((logger), (format), ::megaflow::logDebug, __VA_ARGS__)

// Emit an info message.
#define LogInfo1(logger, format) \
  Log1((logger), (format), ::megaflow::logInfo)

#define LogInfoF(logger, format, ...) \
  LogF((logger), (format), ::megaflow::logInfo, __VA_ARGS__)

// Emit a warning message.
#define LogWarning1(logger, format) \
  Log1((logger), (format), ::megaflow::logWarning)

#define LogWarningF(logger, format, ...) \
  LogF((logger), (format), ::megaflow::logWarning, __VA_ARGS__)

// Emit an error message.
#define LogError1(logger, format) \
  (logger).error(::megaflow::log_file_leafname(__FILE__), (format), __LINE__)

#define LogErrorF(logger, format, ...) \
  (logger).error(::megaflow::log_file_leafname(__FILE__), (format), __LINE__, __VA_ARGS__)

