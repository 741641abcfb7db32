#include "splitfile/IVolumeNaming.hpp"
#include <boost/lexical_cast.hpp>

namespace splitfile
{

std::string SuffixVolumeNaming::nameFor(std::string const & baseIdentifier, uint64_t index) const
{
  if (index == 0)
    return baseIdentifier;
  // Volumes are numbered from 1 in names, first one has no suffix
  return baseIdentifier + "." + boost::lexical_cast<std::string>(index + 1);
}

}
