#ifndef SPLITFILE_LIBSPLITFILE_H
#define SPLITFILE_LIBSPLITFILE_H

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct SPLITFILE SPLITFILE;

/* flags for sfopen_flags() */
enum {
	SF_READ       = 1 << 0,
	SF_WRITE      = 1 << 1,
	SF_APPEND     = 1 << 2,
	SF_TRUNCATE   = 1 << 3,
	SF_CREATE     = 1 << 4,
	SF_CREATE_NEW = 1 << 5
};

/* Every call reports failure with NULL or -1, sets errno
 * and prints the reason to stderr.
 * */
SPLITFILE *sfopen (const char *path, uint64_t volsize);
SPLITFILE *sfcreate (const char *path, uint64_t volsize);
SPLITFILE *sfopen_flags (const char *path, uint64_t volsize, int flags);

int64_t sfread (SPLITFILE *sf, void *buf, size_t len);
int64_t sfwrite (SPLITFILE *sf, const void *buf, size_t len);

/* whence is SEEK_SET, SEEK_CUR or SEEK_END */
int64_t sfseek (SPLITFILE *sf, int64_t offset, int whence);
int64_t sflength (SPLITFILE *sf);

int sfflush (SPLITFILE *sf);
int sfclose (SPLITFILE *sf);

#ifdef __cplusplus
}
#endif

#endif    /* SPLITFILE_LIBSPLITFILE_H */
