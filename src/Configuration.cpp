#include "splitfile/Configuration.hpp"
#include <algorithm>
#include <cctype>
#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>
#include "util/Assert.hpp"

namespace splitfile
{

namespace
{
  struct ModeName
  {
    StreamMode mode;
    const char * name;
  };

  const ModeName ModeNames[] = {
    { StreamMode::Read,           "read" },
    { StreamMode::WriteTruncate,  "write-truncate" },
    { StreamMode::WriteAppend,    "write-append" },
    { StreamMode::ReadWrite,      "read-write" },
    { StreamMode::WriteCreateNew, "write-create-new" }
  };

  uint64_t ParseUnsigned(boost::property_tree::ptree const & tree, const char * key)
  {
    std::string const text = tree.get<std::string>(key);
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }))
      ThrowSplitFileError(ErrorCode::InvalidConfiguration,
        (std::string("Option '") + key + "' must be a non-negative integer, got '" + text + "'").c_str());
    try
    {
      return boost::lexical_cast<uint64_t>(text);
    }
    catch (boost::bad_lexical_cast const &)
    {
      ThrowSplitFileError(ErrorCode::InvalidConfiguration,
        (std::string("Option '") + key + "' is out of range: '" + text + "'").c_str());
    }
  }

  void RequireKey(boost::property_tree::ptree const & tree, const char * key)
  {
    if (!tree.get_child_optional(key))
      ThrowSplitFileError(ErrorCode::InvalidConfiguration,
        (std::string("Option '") + key + "' is required").c_str());
  }
}

void Configuration::validate() const
{
  if (maxVolumeSize == 0)
    ThrowSplitFileError(ErrorCode::InvalidConfiguration, "Maximum volume size must be positive");
  if (baseIdentifier.empty())
    ThrowSplitFileError(ErrorCode::InvalidConfiguration, "Base identifier must not be empty");
  bool const knownMode = std::any_of(std::begin(ModeNames), std::end(ModeNames),
    [this](ModeName const & item) { return item.mode == mode; });
  if (!knownMode)
    ThrowSplitFileError(ErrorCode::InvalidConfiguration, "Unknown stream mode");
}

Configuration Configuration::fromPropertyTree(boost::property_tree::ptree const & tree)
{
  RequireKey(tree, "max_volume_size");
  RequireKey(tree, "mode");
  RequireKey(tree, "base_identifier");

  Configuration configuration;
  configuration.maxVolumeSize = ParseUnsigned(tree, "max_volume_size");
  configuration.mode = ParseStreamMode(tree.get<std::string>("mode"));
  configuration.baseIdentifier = tree.get<std::string>("base_identifier");
  if (tree.get_child_optional("handle_cache_limit"))
    configuration.handleCacheLimit = size_t(ParseUnsigned(tree, "handle_cache_limit"));
  if (tree.get_child_optional("read"))
  {
    boost::optional<bool> const read = tree.get_optional<bool>("read");
    if (!read)
      ThrowSplitFileError(ErrorCode::InvalidConfiguration,
        ("Option 'read' must be true or false, got '" + tree.get<std::string>("read") + "'").c_str());
    configuration.read = *read;
  }
  configuration.validate();
  return configuration;
}

StreamMode ParseStreamMode(std::string const & text)
{
  for (ModeName const & item : ModeNames)
    if (text == item.name)
      return item.mode;
  ThrowSplitFileError(ErrorCode::InvalidConfiguration, ("Unknown stream mode '" + text + "'").c_str());
}

const char * ToString(StreamMode mode)
{
  for (ModeName const & item : ModeNames)
    if (item.mode == mode)
      return item.name;
  return "unknown";
}

}
