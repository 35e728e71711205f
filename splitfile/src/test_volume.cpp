
#include "test_helpers.hpp"

#include "raw_file.hpp"
#include "split_file.hpp"
#include "syscall_checker.hpp"
#include "volume.hpp"
#include "volume_names.hpp"
#include "volume_open_mode.hpp"

#include <algorithm>
#include <cerrno>
#include <memory>
#include <stdexcept>
#include <type_traits>

using namespace splitfile;


TEST(VolumeNames, FirstVolumeIsTheBasePath)
{
    EXPECT_EQ(volume_names::nameFor("/data/archive.tar", 1), "/data/archive.tar");
}


TEST(VolumeNames, ContinuationsGetDecimalSuffix)
{
    EXPECT_EQ(volume_names::nameFor("/data/archive.tar", 2), "/data/archive.tar.2");
    EXPECT_EQ(volume_names::nameFor("/data/archive.tar", 10), "/data/archive.tar.10");
    EXPECT_EQ(volume_names::nameFor("out", 123), "out.123");
}


TEST(VolumeNames, IndexZeroIsRejected)
{
    EXPECT_THROW(volume_names::nameFor("out", 0), std::out_of_range);
}


class VolumeFiles : public temp_dir_test
{
protected:
    void touch(const std::string &name)
    {
        raw_file::open_flags flags;
        flags.write = true;
        flags.create = true;
        delete raw_file::open(path(name), flags);
    }
};


TEST_F(VolumeFiles, RemoveContinuationsStopsAtFirstGap)
{
    touch("f");
    touch("f.2");
    touch("f.3");
    touch("f.5");

    EXPECT_EQ(volume_names::removeContinuations(path("f")), 2u);

    EXPECT_TRUE(fileExists(path("f")));
    EXPECT_FALSE(fileExists(path("f.2")));
    EXPECT_FALSE(fileExists(path("f.3")));
    EXPECT_TRUE(fileExists(path("f.5")));
}


TEST_F(VolumeFiles, RemoveContinuationsWithoutAnyIsNoop)
{
    EXPECT_EQ(volume_names::removeContinuations(path("nothing")), 0u);
}


TEST_F(VolumeFiles, ExistsOnlyForRegularFiles)
{
    touch("f");
    EXPECT_TRUE(volume_names::exists(path("f"), 1));
    EXPECT_FALSE(volume_names::exists(path("f"), 2));

    ASSERT_EQ(::mkdir(path("f.2").c_str(), 0777), 0);
    EXPECT_FALSE(volume_names::exists(path("f"), 2));
    ::rmdir(path("f.2").c_str());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(VolumeOpenSequence, OnlyTheFirstCallIsFirstVolume)
{
    volume_open_sequence sequence;
    EXPECT_EQ(sequence.next(), volume_open_sequence::FIRST_VOLUME);
    EXPECT_EQ(sequence.next(), volume_open_sequence::CONTINUATION);
    EXPECT_EQ(sequence.next(), volume_open_sequence::CONTINUATION);
}


TEST(VolumeOpenMode, FirstVolumeGetsFlagsVerbatim)
{
    open_options options;
    options.read(true).write(true).truncate(true).create(true).createNew(true).append(true);

    raw_file::open_flags flags = volume_open_mode::translate(options, volume_open_sequence::FIRST_VOLUME);
    EXPECT_TRUE(flags.read);
    EXPECT_TRUE(flags.write);
    EXPECT_TRUE(flags.create);
    EXPECT_TRUE(flags.createNew);
    EXPECT_TRUE(flags.truncate);

    flags = volume_open_mode::translate(open_options().read(true), volume_open_sequence::FIRST_VOLUME);
    EXPECT_TRUE(flags.read);
    EXPECT_FALSE(flags.write);
    EXPECT_FALSE(flags.create);
    EXPECT_FALSE(flags.createNew);
    EXPECT_FALSE(flags.truncate);
}


TEST(VolumeOpenMode, AppendDoesNotGrantWriteOnFirstVolume)
{
    raw_file::open_flags flags = volume_open_mode::translate(open_options().read(true).append(true),
                                                             volume_open_sequence::FIRST_VOLUME);
    EXPECT_FALSE(flags.write);
    EXPECT_FALSE(flags.create);
}


TEST(VolumeOpenMode, AppendMakesContinuationsWritableAndCreatable)
{
    raw_file::open_flags flags = volume_open_mode::translate(open_options().read(true).append(true),
                                                             volume_open_sequence::CONTINUATION);
    EXPECT_TRUE(flags.read);
    EXPECT_TRUE(flags.write);
    EXPECT_TRUE(flags.create);
}


TEST(VolumeOpenMode, ContinuationsAreNeverTruncatedNorExclusive)
{
    open_options options;
    options.write(true).createNew(true).truncate(true);

    raw_file::open_flags flags = volume_open_mode::translate(options, volume_open_sequence::CONTINUATION);
    EXPECT_TRUE(flags.write);
    EXPECT_TRUE(flags.create);
    EXPECT_FALSE(flags.createNew);
    EXPECT_FALSE(flags.truncate);
}


TEST(VolumeOpenMode, WritableFileCreatesMissingContinuations)
{
    raw_file::open_flags flags = volume_open_mode::translate(open_options().write(true),
                                                             volume_open_sequence::CONTINUATION);
    EXPECT_TRUE(flags.create);

    flags = volume_open_mode::translate(open_options().write(true), volume_open_sequence::FIRST_VOLUME);
    EXPECT_FALSE(flags.create);
}


TEST(VolumeOpenMode, ReadOnlyContinuationStaysReadOnly)
{
    raw_file::open_flags flags = volume_open_mode::translate(open_options().read(true),
                                                             volume_open_sequence::CONTINUATION);
    EXPECT_TRUE(flags.read);
    EXPECT_FALSE(flags.write);
    EXPECT_FALSE(flags.create);
    EXPECT_FALSE(flags.createNew);
    EXPECT_FALSE(flags.truncate);
}

//----------------------------------------------------------------------------------------------------------------------

class RawFile : public temp_dir_test { };


TEST_F(RawFile, OpenWithoutAccessModeIsInvalid)
{
    raw_file::open_flags flags;
    try {
        delete raw_file::open(path("f"), flags);
        FAIL() << "expected syscall_result_failed";
    }
    catch (const errors::syscall_result_failed &err) {
        EXPECT_EQ(err.errorCode(), EINVAL);
    }
}


TEST_F(RawFile, CreateWithoutWriteIsInvalid)
{
    raw_file::open_flags flags;
    flags.read = true;
    flags.create = true;
    try {
        delete raw_file::open(path("f"), flags);
        FAIL() << "expected syscall_result_failed";
    }
    catch (const errors::syscall_result_failed &err) {
        EXPECT_EQ(err.errorCode(), EINVAL);
    }
    EXPECT_FALSE(fileExists(path("f")));
}


TEST_F(RawFile, MissingFileReportsNotFound)
{
    raw_file::open_flags flags;
    flags.read = true;
    try {
        delete raw_file::open(path("missing"), flags);
        FAIL() << "expected syscall_result_failed";
    }
    catch (const errors::syscall_result_failed &err) {
        EXPECT_EQ(err.errorCode(), ENOENT);
    }
}


TEST_F(RawFile, ReadAllStopsAtEndOfFile)
{
    raw_file::open_flags flags;
    flags.read = true;
    flags.write = true;
    flags.create = true;

    std::unique_ptr<raw_file> file(raw_file::open(path("f"), flags));
    EXPECT_EQ(file->actualSize(), 0u);

    std::vector<uint8_t> data = sequence(10);
    file->writeAll(data.data(), data.size());
    EXPECT_EQ(file->seek(0, SEEK_SET), 0);

    std::vector<uint8_t> back(32, 0xff);
    EXPECT_EQ(file->readAll(back.data(), back.size()), 10u);
    EXPECT_TRUE(std::equal(data.begin(), data.end(), back.begin()));
    EXPECT_EQ(file->readAll(back.data(), back.size()), 0u);
}

//----------------------------------------------------------------------------------------------------------------------

class Volume : public temp_dir_test { };


TEST_F(Volume, TracksPositionAndResetsLazily)
{
    raw_file::open_flags flags;
    flags.read = true;
    flags.write = true;
    flags.create = true;

    std::unique_ptr<volume> vol(volume::open(path("v"), flags));
    std::vector<uint8_t> data = sequence(8);
    vol->write(data.data(), data.size());
    EXPECT_EQ(vol->position(), 8u);

    EXPECT_EQ(vol->seekToEnd(), 8u);
    EXPECT_EQ(vol->syncState(), volume::NEEDS_RESET);

    vol->resolvePendingReset();
    EXPECT_EQ(vol->syncState(), volume::SYNCHRONIZED);
    EXPECT_EQ(vol->position(), 0u);

    uint8_t first[3] = {};
    EXPECT_EQ(vol->read(first, sizeof(first)), 3u);
    EXPECT_EQ(first[0], 0);
    EXPECT_EQ(first[2], 2);
    EXPECT_EQ(vol->position(), 3u);

    // already synchronized: no seek back to zero
    vol->resolvePendingReset();
    EXPECT_EQ(vol->position(), 3u);
}


TEST_F(Volume, SeekToClearsPendingReset)
{
    raw_file::open_flags flags;
    flags.read = true;
    flags.write = true;
    flags.create = true;

    std::unique_ptr<volume> vol(volume::open(path("v"), flags));
    std::vector<uint8_t> data = sequence(8);
    vol->write(data.data(), data.size());

    vol->markNeedsReset();
    vol->seekTo(5);
    EXPECT_EQ(vol->syncState(), volume::SYNCHRONIZED);
    EXPECT_EQ(vol->position(), 5u);

    uint8_t byte = 0;
    EXPECT_EQ(vol->read(&byte, 1), 1u);
    EXPECT_EQ(byte, 5);
}


TEST(Ownership, VolumesAndSplitFilesAreNotCopyable)
{
    EXPECT_FALSE(std::is_copy_constructible<volume>::value);
    EXPECT_FALSE(std::is_copy_assignable<volume>::value);
    EXPECT_FALSE(std::is_copy_constructible<split_file>::value);
    EXPECT_FALSE(std::is_copy_assignable<split_file>::value);
}


TEST_F(Volume, ReadAndWriteAdvanceCallerCursor)
{
    raw_file::open_flags flags;
    flags.read = true;
    flags.write = true;
    flags.create = true;

    std::unique_ptr<raw_file> file(raw_file::open(path("v"), flags));
    std::vector<uint8_t> data = sequence(12);
    uint64_t cursor = 5;
    file->writeAll(data.data(), data.size(), &cursor);
    EXPECT_EQ(cursor, 17u);

    EXPECT_EQ(file->seek(0, SEEK_SET), 0);
    std::vector<uint8_t> back(32);
    cursor = 0;
    EXPECT_EQ(file->readAll(back.data(), back.size(), &cursor), 12u);
    EXPECT_EQ(cursor, 12u);
}
