#pragma once

namespace megaflow
{
namespace common
{

class Logger;

} // common
} // megaflow

