/**
 * @file filesystem.cpp
 * @brief Generic host filesystem access interfaces
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

#include "megaflow/filesystem.h"
#include "megaflow/logging.h"

namespace megaflow {

bool FileSystemAccess::readfile(const string& name, string& data)
{
    auto fa = newfileaccess();

    if (!fa->fopen(name, true, false))
    {
        return false;
    }

    data.resize(static_cast<size_t>(fa->size));

    if (fa->size && !fa->fread((byte*)&data[0], static_cast<unsigned>(fa->size), 0))
    {
        LOG_err << "Unable to read " << name << ": " << fa->errorcode;
        data.clear();
        return false;
    }

    return true;
}

bool FileSystemAccess::writefileatomic(const string& name, const string& data)
{
    string tmp = name + ".tmp";

    {
        auto fa = newfileaccess();

        if (!fa->fopen(tmp, false, true)
         || !fa->ftruncate(0)
         || (!data.empty() && !fa->fwrite((const byte*)data.data(), static_cast<unsigned>(data.size()), 0))
         || !fa->fsync())
        {
            LOG_err << "Unable to write " << tmp << ": " << fa->errorcode;
            fa->fclose();
            unlinklocal(tmp);
            return false;
        }

        fa->fclose();
    }

    if (!renamelocal(tmp, name))
    {
        unlinklocal(tmp);
        return false;
    }

    return true;
}

string parentpath(const string& path)
{
    size_t slash = path.find_last_of('/');

    if (slash == string::npos)
    {
        return string();
    }

    return slash ? path.substr(0, slash) : string("/");
}

} // namespace
