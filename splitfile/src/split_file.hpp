#ifndef SPLITFILE_SPLIT_FILE_H
#define SPLITFILE_SPLIT_FILE_H

//----------------------------------------------------------------------------------------------------------------------

#include "open_options.hpp"
#include "volume.hpp"
#include "volume_open_mode.hpp"

#include <cstdint>
#include <string>
#include <vector>

//----------------------------------------------------------------------------------------------------------------------

namespace splitfile
{

    // One logical file stored as volumes of at most `volumeSize` bytes: "<path>", "<path>.2", "<path>.3", ...
    // Every volume but the last is exactly `volumeSize` bytes long.
    class split_file
    {
    public:
        enum seek_origin : uint8_t { BEGIN, CURRENT, END };

    private:
        std::string  _basePath;
        open_options _options;
        uint64_t     _volumeSize = 0;

        std::vector<volume*> _volumes;
        size_t _activeIndex = 1;        // 1-based


    private:
        void _openVolumes();
        volume* _pushVolume(const std::string &path, volume_open_sequence::stage_t stage);
        volume* _addVolume();
        size_t _fillVolume(volume *vol, const uint8_t *data, size_t length);
        uint64_t _logicalLength();
        void _checkVolumeSizes() const;

        inline volume* _volume(size_t index) const  { return _volumes[index - 1]; }

    private:
        split_file() { };
        split_file(const split_file &);
        split_file& operator=(const split_file &);

    public:
        ~split_file();
        static split_file* open(const std::string &path, uint64_t volumeSize);
        static split_file* create(const std::string &path, uint64_t volumeSize);
        static split_file* openWithOptions(const std::string &path, const open_options &options, uint64_t volumeSize);

        size_t   read(void *data, size_t length);
        size_t   write(const void *data, size_t length);
        uint64_t seek(int64_t offset, seek_origin origin);
        void     flush();

        // issues a real seek on the last volume every time it is called
        uint64_t length();
        uint64_t position() const;

        inline const std::string& basePath() const  { return _basePath; }
        inline const open_options& options() const  { return _options; }
        inline uint64_t volumeSize() const  { return _volumeSize; }
        inline size_t volumeCount() const  { return _volumes.size(); }
        inline size_t activeVolumeIndex() const  { return _activeIndex; }
    };

}

//----------------------------------------------------------------------------------------------------------------------

#endif    //SPLITFILE_SPLIT_FILE_H
