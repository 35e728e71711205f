
#include "split_file.hpp"
#include "volume_names.hpp"
#include "volume_open_mode.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>

//----------------------------------------------------------------------------------------------------------------------

namespace splitfile
{
//----------------------------------------------------------------------------------------------------------------------

namespace
{
    uint64_t offsetFrom(uint64_t base, int64_t offset)
    {
        if (offset >= 0) {
            uint64_t forward = uint64_t(offset);
            if (forward > std::numeric_limits<uint64_t>::max() - base) {
                throw std::overflow_error("seek position does not fit into a 64-bit offset");
            }
            return base + forward;
        }

        uint64_t backward = uint64_t(-(offset + 1)) + 1;
        if (backward > base) {
            throw std::invalid_argument("invalid argument: cannot seek to a negative position in the file");
        }
        return base - backward;
    }
}

//----------------------------------------------------------------------------------------------------------------------

auto split_file::open(const std::string &path, uint64_t volumeSize) -> split_file *
{
    return open_options().read(true).open(path, volumeSize);
}


auto split_file::create(const std::string &path, uint64_t volumeSize) -> split_file *
{
    return open_options().write(true).create(true).truncate(true).open(path, volumeSize);
}


auto split_file::openWithOptions(const std::string &path, const open_options &options, uint64_t volumeSize)
-> split_file *
{
    if (volumeSize == 0) {
        throw std::invalid_argument("invalid argument: volume size must be positive");
    }

    if (options.truncate()) {
        volume_names::removeContinuations(path);
    }

    auto splitFile = new split_file();
    splitFile->_basePath = path;
    splitFile->_options = options;
    splitFile->_volumeSize = volumeSize;

    try {
        splitFile->_openVolumes();
        splitFile->_checkVolumeSizes();

        if (options.append()) {
            splitFile->seek(0, END);
        }
    }
    catch (...) {
        delete splitFile;
        throw;
    }

    return splitFile;
}


split_file::~split_file()
{
    for (auto vol : _volumes) {
        delete vol;
    }
}


void split_file::_openVolumes()
{
    volume_open_sequence openSequence;

    _pushVolume(_basePath, openSequence.next());

    for (size_t index = 2; volume_names::exists(_basePath, index); ++index) {
        _pushVolume(volume_names::nameFor(_basePath, index), openSequence.next());
    }
}


volume* split_file::_pushVolume(const std::string &path, volume_open_sequence::stage_t stage)
{
    _volumes.reserve(_volumes.size() + 1);  // so that push_back cannot throw once the volume is open
    _volumes.push_back(volume::open(path, volume_open_mode::translate(_options, stage)));
    return _volumes.back();
}


volume* split_file::_addVolume()
{
    return _pushVolume(volume_names::nameFor(_basePath, _volumes.size() + 1), volume_open_sequence::CONTINUATION);
}


void split_file::_checkVolumeSizes() const
{
    for (size_t index = 1; index <= _volumes.size(); ++index) {
        uint64_t size = _volume(index)->sizeAtOpen();
        bool last = (index == _volumes.size());

        if ((!last && size != _volumeSize) || size > _volumeSize) {
            std::cerr << "warning: volume " << volume_names::nameFor(_basePath, index) << " holds " << size
                      << " bytes but the volume size is " << _volumeSize
                      << " -> was it written with another volume size?" << std::endl;
        }
    }
}


uint64_t split_file::_logicalLength()
{
    uint64_t lastVolumeSize = _volumes.back()->seekToEnd();
    return (_volumes.size() - 1) * _volumeSize + lastVolumeSize;
}


size_t split_file::_fillVolume(volume *vol, const uint8_t *data, size_t length)
{
    uint64_t room = (vol->position() < _volumeSize) ? _volumeSize - vol->position() : 0;
    size_t chunk = size_t(std::min<uint64_t>(length, room));

    vol->write(data, chunk);
    return chunk;
}


size_t split_file::read(void *data, size_t length)
{
    size_t readBytes = 0;

    for (size_t index = _activeIndex; index <= _volumes.size(); ++index) {
        _activeIndex = index;

        volume *vol = _volume(index);
        vol->resolvePendingReset();
        readBytes += vol->read((uint8_t *)data + readBytes, length - readBytes);

        if (readBytes == length) {
            break;
        }
    }

    return readBytes;
}


size_t split_file::write(const void *data, size_t length)
{
    size_t writtenBytes = 0;

    for (size_t index = _activeIndex; index <= _volumes.size(); ++index) {
        _activeIndex = index;

        volume *vol = _volume(index);
        vol->resolvePendingReset();
        writtenBytes += _fillVolume(vol, (const uint8_t *)data + writtenBytes, length - writtenBytes);

        if (writtenBytes == length) {
            return writtenBytes;
        }
    }

    // out of volumes: extend the file
    while (writtenBytes < length) {
        volume *vol = _addVolume();
        _activeIndex = _volumes.size();
        writtenBytes += _fillVolume(vol, (const uint8_t *)data + writtenBytes, length - writtenBytes);
    }

    return writtenBytes;
}


uint64_t split_file::seek(int64_t offset, seek_origin origin)
{
    bool lengthKnown = false;
    uint64_t fileLength = 0;
    uint64_t target = 0;

    switch (origin) {
        case BEGIN:
            target = offsetFrom(0, offset);
            break;
        case CURRENT:
            target = offsetFrom(position(), offset);
            break;
        case END:
            fileLength = _logicalLength();
            lengthKnown = true;
            target = offsetFrom(fileLength, offset);
            break;
    }

    // a target in or beyond the last volume can't go past the end of data
    if (target / _volumeSize + 1 >= _volumes.size()) {
        if (!lengthKnown) {
            fileLength = _logicalLength();
        }
        target = std::min(target, fileLength);
    }

    size_t index = size_t(target / _volumeSize + 1);
    if (index > _volumes.size()) {
        index = _volumes.size();    // exactly at the end of a full last volume
    }
    uint64_t localOffset = target - (index - 1) * _volumeSize;

    _volume(index)->seekTo(localOffset);
    _activeIndex = index;

    for (size_t following = index + 1; following <= _volumes.size(); ++following) {
        _volume(following)->markNeedsReset();
    }

    return target;
}


void split_file::flush()
{
    for (auto vol : _volumes) {
        vol->flush();
    }
}


uint64_t split_file::length()
{
    bool lastIsActive = (_activeIndex == _volumes.size());
    uint64_t activeOffset = position() - (_activeIndex - 1) * _volumeSize;

    uint64_t fileLength = _logicalLength();

    // measuring moved the last volume's cursor, put it back if reads/writes continue from there
    if (lastIsActive) {
        _volume(_activeIndex)->seekTo(activeOffset);
    }

    return fileLength;
}


uint64_t split_file::position() const
{
    volume *active = _volume(_activeIndex);
    uint64_t localOffset = (active->syncState() == volume::NEEDS_RESET) ? 0 : active->position();

    return (_activeIndex - 1) * _volumeSize + localOffset;
}

//----------------------------------------------------------------------------------------------------------------------
}
