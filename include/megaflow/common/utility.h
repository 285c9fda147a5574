#pragma once

#include <cstdarg>
#include <string>

namespace megaflow
{
namespace common
{

// printf-style formatting into a string; a bad format yields "".
std::string formatv(std::va_list arguments, const char* format);

} // common
} // megaflow

