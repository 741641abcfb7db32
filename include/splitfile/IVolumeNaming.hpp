#ifndef _SPLITFILE_API_IVOLUME_NAMING_H
#define _SPLITFILE_API_IVOLUME_NAMING_H

#include <cstdint>
#include <string>
#include "splitfile/Defs.hpp"

namespace splitfile
{

// Must be deterministic and injective over index for a fixed base
class IVolumeNaming
{
public:
  virtual std::string nameFor(std::string const & baseIdentifier, uint64_t index) const = 0;

  virtual ~IVolumeNaming() {}
};

// "base", "base.2", "base.3", ...
class SPLITFILE_API_DECL SuffixVolumeNaming: public IVolumeNaming
{
public:
  std::string nameFor(std::string const & baseIdentifier, uint64_t index) const override;
};

}

#endif
