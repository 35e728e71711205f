
#include "volume_names.hpp"
#include "raw_file.hpp"

#include <stdexcept>

//----------------------------------------------------------------------------------------------------------------------

using namespace splitfile;

//----------------------------------------------------------------------------------------------------------------------

std::string volume_names::nameFor(const std::string &basePath, size_t index)
{
    if (index == 0) {
        throw std::out_of_range("volume indices start at 1");
    }

    if (index == 1) {
        return basePath;
    }

    return basePath + "." + std::to_string(index);
}


bool volume_names::exists(const std::string &basePath, size_t index)
{
    return raw_file::exists(nameFor(basePath, index));
}


size_t volume_names::removeContinuations(const std::string &basePath)
{
    size_t removedCount = 0;
    for (size_t index = 2; raw_file::remove(nameFor(basePath, index)); ++index) {
        ++removedCount;
    }

    return removedCount;
}
