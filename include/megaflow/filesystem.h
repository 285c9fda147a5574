/**
 * @file megaflow/filesystem.h
 * @brief Generic host filesystem access interfaces
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

#ifndef MEGAFLOW_FILESYSTEM_H
#define MEGAFLOW_FILESYSTEM_H 1

#include "types.h"

namespace megaflow {

// generic host file access interface
struct MEGAFLOW_API FileAccess
{
    // file size, valid after a successful fopen()
    m_off_t size = -1;

    // errno of the last failed operation
    int errorcode = 0;

    // open for reading and/or writing; writing creates the file
    virtual bool fopen(const string& path, bool read, bool write) = 0;

    // positioned read/write of exactly `len` bytes
    virtual bool fread(byte* dst, unsigned len, m_off_t pos) = 0;
    virtual bool fwrite(const byte* data, unsigned len, m_off_t pos) = 0;

    virtual bool ftruncate(m_off_t size) = 0;

    // flush to stable storage
    virtual bool fsync() = 0;

    virtual void fclose() = 0;

    virtual ~FileAccess() = default;
};

// generic host filesystem access interface
struct MEGAFLOW_API FileSystemAccess
{
    virtual unique_ptr<FileAccess> newfileaccess() = 0;

    // replaces newname if it exists
    virtual bool renamelocal(const string& oldname, const string& newname) = 0;

    // succeeds if the file does not exist
    virtual bool unlinklocal(const string& name) = 0;

    // creates missing parent directories too
    virtual bool mkdirlocal(const string& path) = 0;

    virtual bool existslocal(const string& name) = 0;

    // whole-file helpers built on the primitives above

    bool readfile(const string& name, string& data);

    // writes `<name>.tmp`, syncs it and renames it over `name`
    bool writefileatomic(const string& name, const string& data);

    virtual ~FileSystemAccess() = default;
};

// parent directory of a path, empty if it has none
string parentpath(const string& path);

} // namespace

#endif
