#ifndef SPLITFILE_RAW_FILE_H
#define SPLITFILE_RAW_FILE_H

//----------------------------------------------------------------------------------------------------------------------

#include <unistd.h>
#include <cstdint>
#include <string>

//----------------------------------------------------------------------------------------------------------------------

namespace splitfile
{

    class raw_file
    {
    public:
        struct open_flags
        {
            bool read      = false;
            bool write     = false;
            bool create    = false;
            bool createNew = false;
            bool truncate  = false;
        };

    private:
        int _unixFD = -1;
        size_t _actualFileSize = 0;


    private:
        static int _unixOpenFlags(const open_flags &flags);

    private:
        raw_file() { };

    public:
        ~raw_file();
        static raw_file* open(const std::string &path, const open_flags &flags);
        static bool exists(const std::string &path);
        static bool remove(const std::string &path);

        // `cursor`, when given, is advanced after every completed syscall, so it stays
        // in step with the descriptor even when a later call in the loop throws
        size_t readAll(void *data, size_t length, uint64_t *cursor = nullptr);
        void   writeAll(const void *data, size_t length, uint64_t *cursor = nullptr);
        off_t  seek(off_t offset, int whence);
        void   sync();

        inline size_t actualSize() const  { return _actualFileSize; }
        inline int unixFD() const  { return _unixFD; }
    };

}

//----------------------------------------------------------------------------------------------------------------------

#endif    //SPLITFILE_RAW_FILE_H
