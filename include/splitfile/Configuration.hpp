#ifndef _SPLITFILE_API_CONFIGURATION_H
#define _SPLITFILE_API_CONFIGURATION_H

#include <cstdint>
#include <string>
#include <boost/property_tree/ptree_fwd.hpp>
#include "splitfile/Common.hpp"
#include "splitfile/Defs.hpp"

namespace splitfile
{

struct SPLITFILE_API_DECL Configuration
{
  uint64_t maxVolumeSize = 0;
  StreamMode mode = StreamMode::Read;
  std::string baseIdentifier;
  size_t handleCacheLimit = UnboundedHandleCache; // 0 keeps every touched volume open
  bool read = false; // adds read access to WriteTruncate, WriteAppend and WriteCreateNew

  // Throws SplitFileError(InvalidConfiguration)
  void validate() const;

  // Keys: max_volume_size, mode, base_identifier, handle_cache_limit (optional), read (optional)
  static Configuration fromPropertyTree(boost::property_tree::ptree const &);
};

SPLITFILE_API_DECL StreamMode ParseStreamMode(std::string const & text);
SPLITFILE_API_DECL const char * ToString(StreamMode);

inline bool HasReadAccess(StreamMode mode)
{
  return mode == StreamMode::Read || mode == StreamMode::ReadWrite;
}

inline bool HasWriteAccess(StreamMode mode)
{
  return mode != StreamMode::Read;
}

inline bool HasReadAccess(Configuration const & configuration)
{
  return configuration.read || HasReadAccess(configuration.mode);
}

}

#endif
