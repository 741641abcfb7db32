#ifndef _SPLITFILE_API_COMMON_H
#define _SPLITFILE_API_COMMON_H

#include <stddef.h>

namespace splitfile
{

// Access to a single volume
enum class OpenMode
{
  ReadOnly,
  ReadWrite
};

// Open semantics of the whole multi-volume stream
enum class StreamMode
{
  Read,           // existing volumes, read only
  WriteTruncate,  // create volume 0 if absent, drop previous content
  WriteAppend,    // create volume 0 if absent, start at the end
  ReadWrite,      // existing volumes, read and write
  WriteCreateNew  // volume 0 must not exist
};

enum class SeekOrigin
{
  Begin,
  Current,
  End
};

const size_t UnboundedHandleCache = 0;

}

#endif
