
#include "libsplitfile.h"

#include "split_file.hpp"
#include "syscall_checker.hpp"

#include <cerrno>
#include <iostream>
#include <stdexcept>

//----------------------------------------------------------------------------------------------------------------------

#define catch_exceptions(fnn,rt)  catch (const errors::syscall_result_failed &err)  { std::cerr << fnn << ": syscall_result_failed: " << err.what() << std::endl; \
                                  errno = err.errorCode(); return rt; } \
                                  catch (const std::invalid_argument &err)  { std::cerr << fnn << ": invalid_argument: " << err.what() << std::endl; \
                                  errno = EINVAL; return rt; } \
                                  catch (const std::overflow_error &err)  { std::cerr << fnn << ": overflow_error: " << err.what() << std::endl; \
                                  errno = EOVERFLOW; return rt; } \
                                  catch (const std::exception &err)  { std::cerr << fnn << ": " << err.what() << std::endl; \
                                  errno = EIO; return rt; }

//----------------------------------------------------------------------------------------------------------------------

using namespace splitfile;

//----------------------------------------------------------------------------------------------------------------------

struct SPLITFILE
{
	split_file *file;
};

//----------------------------------------------------------------------------------------------------------------------

static SPLITFILE *wrap(split_file *file)
{
	SPLITFILE *sf = new SPLITFILE();
	sf->file = file;
	return sf;
}


static bool checkHandle(const char *fnn, SPLITFILE *sf)
{
	if (sf == nullptr || sf->file == nullptr) {
		std::cerr << fnn << ": invalid_argument: null handle" << std::endl;
		errno = EINVAL;
		return false;
	}
	return true;
}


extern "C"
SPLITFILE *sfopen(const char *path, uint64_t volsize)
{
	try {
		return wrap(split_file::open(path, volsize));
	}
	catch_exceptions("sfopen", nullptr);
}


extern "C"
SPLITFILE *sfcreate(const char *path, uint64_t volsize)
{
	try {
		return wrap(split_file::create(path, volsize));
	}
	catch_exceptions("sfcreate", nullptr);
}


extern "C"
SPLITFILE *sfopen_flags(const char *path, uint64_t volsize, int flags)
{
	try {
		open_options options;
		options.read((flags & SF_READ) != 0)
		       .write((flags & SF_WRITE) != 0)
		       .append((flags & SF_APPEND) != 0)
		       .truncate((flags & SF_TRUNCATE) != 0)
		       .create((flags & SF_CREATE) != 0)
		       .createNew((flags & SF_CREATE_NEW) != 0);

		return wrap(options.open(path, volsize));
	}
	catch_exceptions("sfopen_flags", nullptr);
}


extern "C"
int64_t sfread(SPLITFILE *sf, void *buf, size_t len)
{
	if (!checkHandle("sfread", sf)) return -1;

	try {
		return int64_t(sf->file->read(buf, len));
	}
	catch_exceptions("sfread", -1);
}


extern "C"
int64_t sfwrite(SPLITFILE *sf, const void *buf, size_t len)
{
	if (!checkHandle("sfwrite", sf)) return -1;

	try {
		return int64_t(sf->file->write(buf, len));
	}
	catch_exceptions("sfwrite", -1);
}


extern "C"
int64_t sfseek(SPLITFILE *sf, int64_t offset, int whence)
{
	if (!checkHandle("sfseek", sf)) return -1;

	try {
		split_file::seek_origin origin;
		switch (whence) {
			case SEEK_SET: origin = split_file::BEGIN;   break;
			case SEEK_CUR: origin = split_file::CURRENT; break;
			case SEEK_END: origin = split_file::END;     break;
			default:
				throw std::invalid_argument("unknown whence");
		}

		return int64_t(sf->file->seek(offset, origin));
	}
	catch_exceptions("sfseek", -1);
}


extern "C"
int64_t sflength(SPLITFILE *sf)
{
	if (!checkHandle("sflength", sf)) return -1;

	try {
		return int64_t(sf->file->length());
	}
	catch_exceptions("sflength", -1);
}


extern "C"
int sfflush(SPLITFILE *sf)
{
	if (!checkHandle("sfflush", sf)) return -1;

	try {
		sf->file->flush();
		return 0;
	}
	catch_exceptions("sfflush", -1);
}


extern "C"
int sfclose(SPLITFILE *sf)
{
	if (!checkHandle("sfclose", sf)) return -1;

	delete sf->file;  // this will also close every volume
	delete sf;
	return 0;
}
