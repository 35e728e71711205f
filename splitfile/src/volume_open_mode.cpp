
#include "volume_open_mode.hpp"

//----------------------------------------------------------------------------------------------------------------------

using namespace splitfile;

//----------------------------------------------------------------------------------------------------------------------

auto volume_open_sequence::next() -> stage_t
{
    if (_firstTaken) {
        return CONTINUATION;
    }

    _firstTaken = true;
    return FIRST_VOLUME;
}


raw_file::open_flags volume_open_mode::translate(const open_options &options, volume_open_sequence::stage_t stage)
{
    bool continuation = (stage == volume_open_sequence::CONTINUATION);

    raw_file::open_flags flags;
    flags.read      = options.read();
    flags.write     = (continuation && options.append()) ? true : options.write();
    flags.create    = (continuation && (options.append() || options.createNew() || options.write())) ? true
                                                                                                        : options.create();
    flags.createNew = (continuation && options.createNew()) ? false : options.createNew();
    flags.truncate  = (continuation && options.truncate()) ? false : options.truncate();

    return flags;
}
