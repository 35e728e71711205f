
#include "open_options.hpp"
#include "split_file.hpp"

//----------------------------------------------------------------------------------------------------------------------

using namespace splitfile;

//----------------------------------------------------------------------------------------------------------------------

split_file* open_options::open(const std::string &path, uint64_t volumeSize) const
{
    return split_file::openWithOptions(path, *this, volumeSize);
}
