#ifndef _SPLITFILE_API_IFILE_H
#define _SPLITFILE_API_IFILE_H

#include <cstdint>
#include <memory>
#include "splitfile/Common.hpp"
#include "splitfile/Defs.hpp"
#include "splitfile/IStorage.hpp"

namespace splitfile
{

// Operation set of an ordinary file handle.
// Code written against IFile works with a SplitFile and with a single plain storage alike.
class IFile
{
public:
  virtual bool isOpen() const = 0;
  virtual void close() = 0;

  // Returns new position. Target position before the beginning throws InvalidSeek.
  virtual uint64_t seek(int64_t offset, SeekOrigin origin) = 0;
  virtual uint64_t position() const = 0;
  // On return inOutSize holds the number of bytes read, less than requested only at the end
  virtual void read(size_t & inOutSize, void * buffer) = 0;
  virtual void write(size_t size, void const * buffer) = 0;
  virtual void flush() = 0;
  // Cuts the file at the current position
  virtual void truncate() = 0;
  virtual uint64_t size() = 0;

  virtual ~IFile() {}
};

SPLITFILE_API_DECL std::unique_ptr<IFile> OpenStorageFile(std::unique_ptr<IStorage> && storage, OpenMode openMode);

}

#endif
