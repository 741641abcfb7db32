#ifndef _SPLITFILE_API_IVOLUME_STORE_H
#define _SPLITFILE_API_IVOLUME_STORE_H

#include <memory>
#include <string>
#include "splitfile/Common.hpp"
#include "splitfile/IStorage.hpp"

namespace splitfile
{

// Addressable set of named volumes.
// Errors are reported as SplitFileError with VolumeNotFound, PermissionDenied or StorageFailure.
class IVolumeStore
{
public:
  // 'create' is honored only together with OpenMode::ReadWrite
  virtual std::unique_ptr<IStorage> open(std::string const & name, OpenMode openMode, bool create) = 0;
  virtual bool exists(std::string const & name) const = 0;
  virtual void remove(std::string const & name) = 0; // no-op for missing volume

  virtual ~IVolumeStore() {}
};

}

#endif
