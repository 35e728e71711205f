#ifndef SPLITFILE_OPEN_OPTIONS_H
#define SPLITFILE_OPEN_OPTIONS_H

//----------------------------------------------------------------------------------------------------------------------

#include <cstdint>
#include <string>

//----------------------------------------------------------------------------------------------------------------------

namespace splitfile
{

    class split_file;

    //----------------------------------------------------------------------------------------------------------------------

    // Flags applied to the logical file as a whole, like a single-file open.
    // Nothing is validated here: bad combinations fail when the first volume is opened.
    class open_options
    {
    private:
        bool _read      = false;
        bool _write     = false;
        bool _append    = false;
        bool _truncate  = false;
        bool _create    = false;
        bool _createNew = false;

    public:
        open_options() { }

        inline open_options& read(bool read)              { _read = read;           return *this; }
        inline open_options& write(bool write)            { _write = write;         return *this; }
        inline open_options& append(bool append)          { _append = append;       return *this; }
        inline open_options& truncate(bool truncate)      { _truncate = truncate;   return *this; }
        inline open_options& create(bool create)          { _create = create;       return *this; }
        inline open_options& createNew(bool createNew)    { _createNew = createNew; return *this; }

        inline bool read() const       { return _read; }
        inline bool write() const      { return _write; }
        inline bool append() const     { return _append; }
        inline bool truncate() const   { return _truncate; }
        inline bool create() const     { return _create; }
        inline bool createNew() const  { return _createNew; }

        // `path` is the first volume, `volumeSize` the maximum byte size of every volume.
        split_file* open(const std::string &path, uint64_t volumeSize) const;
    };

}

//----------------------------------------------------------------------------------------------------------------------

#endif    //SPLITFILE_OPEN_OPTIONS_H
