#ifndef SPLITFILE_VOLUME_H
#define SPLITFILE_VOLUME_H

//----------------------------------------------------------------------------------------------------------------------

#include "raw_file.hpp"

#include <cstdint>

//----------------------------------------------------------------------------------------------------------------------

namespace splitfile
{

    class volume
    {
    public:
        enum sync_state_t : uint8_t { SYNCHRONIZED, NEEDS_RESET };

    private:
        raw_file *_file = nullptr;
        uint64_t _pos = 0;
        sync_state_t _syncState = SYNCHRONIZED;


    private:
        volume() { };
        volume(const volume &);
        volume& operator=(const volume &);

    public:
        ~volume();
        static volume* open(const std::string &path, const raw_file::open_flags &flags);

        // a volume marked NEEDS_RESET is moved back to its start here, before it is accessed
        void resolvePendingReset();
        inline void markNeedsReset()  { _syncState = NEEDS_RESET; }

        size_t read(void *data, size_t length);
        void   write(const void *data, size_t length);
        void   seekTo(uint64_t offset);
        uint64_t seekToEnd();
        void   flush();

        inline uint64_t position() const  { return _pos; }
        inline sync_state_t syncState() const  { return _syncState; }
        inline size_t sizeAtOpen() const  { return _file->actualSize(); }
    };

}

//----------------------------------------------------------------------------------------------------------------------

#endif    //SPLITFILE_VOLUME_H
