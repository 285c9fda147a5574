/**
 * @file http.cpp
 * @brief Generic host HTTP I/O interface
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

#include "megaflow/http.h"

namespace megaflow {

const char* proxyModeName(proxymode_t mode)
{
    switch (mode)
    {
        case PROXY_SINGLE: return "single";
        case PROXY_RANDOM: return "random";
        case PROXY_NONE: break;
    }

    return "none";
}

bool proxyModeFromName(const string& name, proxymode_t& mode)
{
    if (name == "none")
    {
        mode = PROXY_NONE;
    }
    else if (name == "single")
    {
        mode = PROXY_SINGLE;
    }
    else if (name == "random")
    {
        mode = PROXY_RANDOM;
    }
    else
    {
        return false;
    }

    return true;
}

Error httpStatusError(int status)
{
    return (status >= 200 && status < 300) ? API_OK : TRANSPORT_EHTTP;
}

} // namespace
