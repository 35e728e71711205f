
#include "volume.hpp"

//----------------------------------------------------------------------------------------------------------------------

using namespace splitfile;

//----------------------------------------------------------------------------------------------------------------------

auto volume::open(const std::string &path, const raw_file::open_flags &flags) -> volume *
{
    raw_file *file = raw_file::open(path, flags);

    auto vol = new volume();
    vol->_file = file;
    return vol;
}


volume::~volume()
{
    delete _file;  // this will also close the file
}


void volume::resolvePendingReset()
{
    if (_syncState == NEEDS_RESET) {
        _pos = uint64_t(_file->seek(0, SEEK_SET));
        _syncState = SYNCHRONIZED;
    }
}


size_t volume::read(void *data, size_t length)
{
    return _file->readAll(data, length, &_pos);
}


void volume::write(const void *data, size_t length)
{
    _file->writeAll(data, length, &_pos);
}


void volume::seekTo(uint64_t offset)
{
    _pos = uint64_t(_file->seek(off_t(offset), SEEK_SET));
    _syncState = SYNCHRONIZED;
}


uint64_t volume::seekToEnd()
{
    _pos = uint64_t(_file->seek(0, SEEK_END));
    _syncState = NEEDS_RESET;
    return _pos;
}


void volume::flush()
{
    _file->sync();
}
