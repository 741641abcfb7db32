#ifndef _SPLITFILE_API_ISTORAGE_H
#define _SPLITFILE_API_ISTORAGE_H

#include <cstdint>
#include "splitfile/Common.hpp"

namespace splitfile
{

// Open handle to a single volume
class IStorage
{
public:
  virtual uint64_t size() const = 0;
  virtual size_t read(uint64_t position, size_t size, void *) const = 0; // short only at the end of storage
  virtual void write(uint64_t position, size_t size, void const *) = 0;
  virtual void resize(uint64_t size) = 0; // fill with zeros on increase
  virtual void flush() = 0;

  virtual ~IStorage() {}
};

}

#endif
