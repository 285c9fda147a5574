#include <cstdio>
#include <vector>

#include <megaflow/common/utility.h>

namespace megaflow
{
namespace common
{

std::string formatv(std::va_list arguments, const char* format)
{
    if (!format)
        return std::string();

    // Most messages fit; only measure when they don't.
    char small[256];

    std::va_list copy;

    va_copy(copy, arguments);

    int required = std::vsnprintf(small, sizeof(small), format, copy);

    va_end(copy);

    if (required < 0)
        return std::string();

    if (static_cast<std::size_t>(required) < sizeof(small))
        return std::string(small, static_cast<std::size_t>(required));

    std::vector<char> large(static_cast<std::size_t>(required) + 1);

    va_copy(copy, arguments);

    std::vsnprintf(large.data(), large.size(), format, copy);

    va_end(copy);

    return std::string(large.data(), static_cast<std::size_t>(required));
}

} // common
} // megaflow

