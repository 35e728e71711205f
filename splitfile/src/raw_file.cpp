
#include "raw_file.hpp"
#include "syscall_checker.hpp"

#include <cstdint>

#include <fcntl.h>
#include <sys/stat.h>

//----------------------------------------------------------------------------------------------------------------------

namespace splitfile
{
//----------------------------------------------------------------------------------------------------------------------

raw_file::~raw_file()
{
    if (_unixFD != -1) {
        ::close(_unixFD);
    }
}


int raw_file::_unixOpenFlags(const open_flags &flags)
{
    // same rules as a conventional single-file open: no access mode at all, or
    // creation/truncation without write access, is an invalid request
    if (!flags.read && !flags.write) {
        syscall_fail("open_flags: neither read nor write requested", EINVAL);
    }
    if (!flags.write && (flags.truncate || flags.create || flags.createNew)) {
        syscall_fail("open_flags: create/truncate requested without write access", EINVAL);
    }

    int unixFlags = O_CLOEXEC;
    if (flags.read && flags.write) {
        unixFlags |= O_RDWR;
    } else if (flags.write) {
        unixFlags |= O_WRONLY;
    } else {
        unixFlags |= O_RDONLY;
    }

    if (flags.createNew) {
        unixFlags |= O_CREAT | O_EXCL;
    } else {
        if (flags.create)    unixFlags |= O_CREAT;
        if (flags.truncate)  unixFlags |= O_TRUNC;
    }

    return unixFlags;
}


raw_file *raw_file::open(const std::string &path, const open_flags &flags)
{
    int unixFD = ::open(path.c_str(), _unixOpenFlags(flags), 0666);
    syscall_check( unixFD );

    raw_file *file = new raw_file();
    file->_unixFD = unixFD;

    struct stat fileStat = {};
    if (::fstat(unixFD, &fileStat) == -1) {
        int errorCode = errno;
        delete file;
        syscall_fail("::fstat(unixFD, &fileStat)", errorCode);
    }

    file->_actualFileSize = size_t(fileStat.st_size);
    return file;
}


bool raw_file::exists(const std::string &path)
{
    struct stat fileStat = {};
    return ::stat(path.c_str(), &fileStat) == 0 && S_ISREG(fileStat.st_mode);
}


bool raw_file::remove(const std::string &path)
{
    int unlinkResult = ::unlink(path.c_str());
    if (unlinkResult == -1 && errno == ENOENT) {
        return false;
    }

    syscall_check( unlinkResult );
    return true;
}


size_t raw_file::readAll(void *data, size_t length, uint64_t *cursor)
{
    size_t readBytes = 0;

    for (; readBytes < length;) {
        ssize_t readResult = ::read(_unixFD, (uint8_t *)data + readBytes, length - readBytes);
        syscall_check( readResult );
        if (readResult == 0) {
            return readBytes;
        }
        readBytes += readResult;
        if (cursor != nullptr)  *cursor += uint64_t(readResult);
    }

    return readBytes;
}


void raw_file::writeAll(const void *data, size_t length, uint64_t *cursor)
{
    for (size_t writtenBytes = 0; writtenBytes < length;) {
        ssize_t writeResult = ::write(_unixFD, (const uint8_t *)data + writtenBytes, length - writtenBytes);
        syscall_check( writeResult );
        writtenBytes += writeResult;
        if (cursor != nullptr)  *cursor += uint64_t(writeResult);
    }
}


off_t raw_file::seek(off_t offset, int whence)
{
    off_t seekResult = ::lseek(_unixFD, offset, whence);
    syscall_check( seekResult );
    return seekResult;
}


void raw_file::sync()
{
    syscall_check( ::fsync(_unixFD) );
}

//----------------------------------------------------------------------------------------------------------------------
}
