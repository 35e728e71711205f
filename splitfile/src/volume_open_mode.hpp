#ifndef SPLITFILE_VOLUME_OPEN_MODE_H
#define SPLITFILE_VOLUME_OPEN_MODE_H

//----------------------------------------------------------------------------------------------------------------------

#include "open_options.hpp"
#include "raw_file.hpp"

//----------------------------------------------------------------------------------------------------------------------

namespace splitfile
{

    // Hands out the open stage of each volume opened while a split_file is being constructed:
    // the first call yields FIRST_VOLUME, every later one CONTINUATION.
    class volume_open_sequence
    {
    public:
        enum stage_t : uint8_t { FIRST_VOLUME, CONTINUATION };

    private:
        bool _firstTaken = false;

    public:
        stage_t next();
    };

    //----------------------------------------------------------------------------------------------------------------------

    class volume_open_mode
    {
    public:
        // Only the first volume gets the caller's flags verbatim. Continuations are never
        // created exclusively nor truncated, and are writable/creatable whenever the logical
        // file is writable or appendable. O_APPEND is never used.
        static raw_file::open_flags translate(const open_options &options, volume_open_sequence::stage_t stage);
    };

}

//----------------------------------------------------------------------------------------------------------------------

#endif    //SPLITFILE_VOLUME_OPEN_MODE_H
