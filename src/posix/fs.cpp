/**
 * @file posix/fs.cpp
 * @brief POSIX filesystem access
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

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "megaflow/logging.h"
#include "megaflow/posix/megafs.h"

namespace megaflow {

PosixFileAccess::PosixFileAccess(int defaultfilepermissions)
    : mDefaultFilePermissions(defaultfilepermissions)
{
}

PosixFileAccess::~PosixFileAccess()
{
    fclose();
}

bool PosixFileAccess::fopen(const string& path, bool read, bool write)
{
    fclose();

    int flags = O_CLOEXEC;

    if (write)
    {
        flags |= (read ? O_RDWR : O_WRONLY) | O_CREAT;
    }
    else
    {
        flags |= O_RDONLY;
    }

    fd = ::open(path.c_str(), flags, mDefaultFilePermissions);

    if (fd < 0)
    {
        errorcode = errno;

        if (errorcode != ENOENT || write)
        {
            LOG_err << "Unable to open file: " << path << ". Error was: " << errorcode;
        }

        return false;
    }

    struct stat attributes;

    if (::fstat(fd, &attributes))
    {
        errorcode = errno;
        LOG_err << "Unable to stat descriptor: " << fd << ". Error was: " << errorcode;
        fclose();
        return false;
    }

    if (S_ISDIR(attributes.st_mode))
    {
        errorcode = EISDIR;
        fclose();
        return false;
    }

    size = static_cast<m_off_t>(attributes.st_size);
    return true;
}

bool PosixFileAccess::fread(byte* dst, unsigned len, m_off_t pos)
{
    size_t done = 0;

    while (done < len)
    {
        ssize_t r = pread(fd, dst + done, len - done, pos + static_cast<m_off_t>(done));

        if (r < 0 && errno == EINTR)
        {
            continue;
        }

        if (r <= 0)
        {
            errorcode = r < 0 ? errno : EIO;
            return false;
        }

        done += static_cast<size_t>(r);
    }

    return true;
}

bool PosixFileAccess::fwrite(const byte* data, unsigned len, m_off_t pos)
{
    size_t done = 0;

    while (done < len)
    {
        ssize_t r = pwrite(fd, data + done, len - done, pos + static_cast<m_off_t>(done));

        if (r < 0 && errno == EINTR)
        {
            continue;
        }

        if (r <= 0)
        {
            errorcode = r < 0 ? errno : EIO;
            return false;
        }

        done += static_cast<size_t>(r);
    }

    return true;
}

bool PosixFileAccess::ftruncate(m_off_t newsize)
{
    if (::ftruncate(fd, newsize))
    {
        errorcode = errno;
        LOG_err << "Unable to truncate descriptor: " << fd << ". Error was: " << errorcode;
        return false;
    }

    size = newsize;
    return true;
}

bool PosixFileAccess::fsync()
{
    if (::fsync(fd))
    {
        errorcode = errno;
        return false;
    }

    return true;
}

void PosixFileAccess::fclose()
{
    if (fd >= 0)
    {
        close(fd);
    }

    fd = -1;
}

unique_ptr<FileAccess> PosixFileSystemAccess::newfileaccess()
{
    return std::make_unique<PosixFileAccess>(defaultfilepermissions);
}

bool PosixFileSystemAccess::renamelocal(const string& oldname, const string& newname)
{
    if (!rename(oldname.c_str(), newname.c_str()))
    {
        LOG_verbose << "Successfully moved file: " << oldname << " to " << newname;
        return true;
    }

    LOG_warn << "Unable to move file: " << oldname << " to " << newname << ". Error code: " << errno;
    return false;
}

bool PosixFileSystemAccess::unlinklocal(const string& name)
{
    if (!unlink(name.c_str()) || errno == ENOENT)
    {
        return true;
    }

    LOG_warn << "Unable to delete file: " << name << ". Error code: " << errno;
    return false;
}

bool PosixFileSystemAccess::mkdirlocal(const string& path)
{
    if (path.empty())
    {
        return true;
    }

    struct stat st;
    if (!stat(path.c_str(), &st))
    {
        return S_ISDIR(st.st_mode);
    }

    string parent = parentpath(path);
    if (!parent.empty() && parent != path && !mkdirlocal(parent))
    {
        return false;
    }

    if (mkdir(path.c_str(), static_cast<mode_t>(defaultfolderpermissions)) && errno != EEXIST)
    {
        LOG_err << "Error creating local directory: " << path << " errno: " << errno;
        return false;
    }

    return true;
}

bool PosixFileSystemAccess::existslocal(const string& name)
{
    return !access(name.c_str(), F_OK);
}

} // namespace
