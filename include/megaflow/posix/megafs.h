/**
 * @file megaflow/posix/megafs.h
 * @brief POSIX filesystem access
 *
 * (c) 2013-2014 by Mega Limited, Auckland, New Zealand
 *
 * This file is part of the MEGA SDK - Client Access Engine.
 *
 * Applications using the MEGA API must present a valid application key
 * and comply with the the rules set forth in the Terms of Service.
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

#ifndef MEGAFLOW_POSIX_FS_H
#define MEGAFLOW_POSIX_FS_H 1

#include "megaflow/filesystem.h"

namespace megaflow {

class MEGAFLOW_API PosixFileAccess : public FileAccess
{
    int fd = -1;
    int mDefaultFilePermissions;

public:
    explicit PosixFileAccess(int defaultfilepermissions = 0600);
    ~PosixFileAccess() override;

    bool fopen(const string& path, bool read, bool write) override;
    bool fread(byte* dst, unsigned len, m_off_t pos) override;
    bool fwrite(const byte* data, unsigned len, m_off_t pos) override;
    bool ftruncate(m_off_t size) override;
    bool fsync() override;
    void fclose() override;
};

class MEGAFLOW_API PosixFileSystemAccess : public FileSystemAccess
{
public:
    int defaultfilepermissions = 0600;
    int defaultfolderpermissions = 0700;

    unique_ptr<FileAccess> newfileaccess() override;

    bool renamelocal(const string& oldname, const string& newname) override;
    bool unlinklocal(const string& name) override;
    bool mkdirlocal(const string& path) override;
    bool existslocal(const string& name) override;
};

} // namespace

#endif
