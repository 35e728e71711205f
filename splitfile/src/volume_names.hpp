#ifndef SPLITFILE_VOLUME_NAMES_H
#define SPLITFILE_VOLUME_NAMES_H

//----------------------------------------------------------------------------------------------------------------------

#include <cstddef>
#include <string>

//----------------------------------------------------------------------------------------------------------------------

namespace splitfile
{

    // Volume 1 is the base path itself, volume k > 1 is "<base>.k".
    class volume_names
    {
    public:
        static std::string nameFor(const std::string &basePath, size_t index);
        static bool exists(const std::string &basePath, size_t index);

        // Deletes volumes 2, 3, ... up to the first missing one. Returns how many were deleted.
        static size_t removeContinuations(const std::string &basePath);
    };

}

//----------------------------------------------------------------------------------------------------------------------

#endif    //SPLITFILE_VOLUME_NAMES_H
