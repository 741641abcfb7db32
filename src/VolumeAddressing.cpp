#include "VolumeAddressing.hpp"
#include <algorithm>
#include "util/Arithmetic.hpp"
#include "util/Assert.hpp"

namespace splitfile
{

VolumeAddressing::VolumeAddressing(uint64_t maxVolumeSize)
  : m_maxVolumeSize(maxVolumeSize)
{
  if (m_maxVolumeSize == 0)
    ThrowSplitFileError(ErrorCode::InvalidConfiguration, "Maximum volume size must be positive");
}

VolumeLocation VolumeAddressing::locate(uint64_t position) const
{
  return VolumeLocation{ position / m_maxVolumeSize, position % m_maxVolumeSize };
}

uint64_t VolumeAddressing::position(VolumeLocation const & location) const
{
  SPLITFILE_ASSERT(location.offset < m_maxVolumeSize);
  return util::CheckedAdd(util::CheckedMultiply(location.index, m_maxVolumeSize), location.offset);
}

std::vector<VolumeRange> VolumeAddressing::plan(uint64_t position, uint64_t length) const
{
  util::CheckedAdd(position, length);

  std::vector<VolumeRange> ranges;
  if (length == 0)
    return ranges;

  ranges.reserve(size_t(volumesTouched(position, length)));
  VolumeLocation location = locate(position);
  for (uint64_t remaining = length; remaining > 0; )
  {
    uint64_t const rangeLength = std::min(remaining, m_maxVolumeSize - location.offset);
    ranges.push_back(VolumeRange{ location.index, location.offset, rangeLength });
    remaining -= rangeLength;
    ++location.index;
    location.offset = 0;
  }
  return ranges;
}

uint64_t VolumeAddressing::volumesTouched(uint64_t position, uint64_t length) const
{
  if (length == 0)
    return 0;
  uint64_t const last = util::CheckedAdd(position, length - 1);
  return last / m_maxVolumeSize - position / m_maxVolumeSize + 1;
}

uint64_t VolumeAddressing::logicalLength(std::vector<VolumeDescriptor> const & descriptors) const
{
  uint64_t length = 0;
  for (size_t i = 0; i < descriptors.size(); ++i)
  {
    VolumeDescriptor const & descriptor = descriptors[i];
    if (descriptor.index != i)
      ThrowSplitFileError(ErrorCode::VolumeChainBroken,
        ("Volume chain has a gap before \"" + descriptor.name + "\"").c_str());
    if (!descriptor.size)
      ThrowSplitFileError(ErrorCode::VolumeChainBroken,
        ("Size of volume \"" + descriptor.name + "\" isn't known").c_str());
    if (*descriptor.size > m_maxVolumeSize)
      ThrowSplitFileError(ErrorCode::VolumeChainBroken,
        ("Volume \"" + descriptor.name + "\" exceeds maximum volume size").c_str());
    if (i + 1 < descriptors.size() && *descriptor.size != m_maxVolumeSize)
      ThrowSplitFileError(ErrorCode::VolumeChainBroken,
        ("Volume \"" + descriptor.name + "\" is short but isn't the last one").c_str());
    length = util::CheckedAdd(length, *descriptor.size);
  }
  return length;
}

}
