#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <boost/optional.hpp>

namespace splitfile
{

struct VolumeLocation
{
  uint64_t index;
  uint64_t offset;

  bool operator==(VolumeLocation const & rhs) const
  {
    return index == rhs.index && offset == rhs.offset;
  }
};

// Part of a logical byte range that falls into one volume
struct VolumeRange
{
  uint64_t index;
  uint64_t offset;
  uint64_t length;
};

struct VolumeDescriptor
{
  VolumeDescriptor(uint64_t index, std::string const & name)
    : index(index)
    , name(name)
  {}

  uint64_t index;
  std::string name;
  boost::optional<uint64_t> size; // empty until the volume is probed
};

// Logical to physical address translation. No I/O, no state besides volume size limit.
class VolumeAddressing
{
public:
  // Throws InvalidConfiguration for zero size
  explicit VolumeAddressing(uint64_t maxVolumeSize);

  uint64_t maxVolumeSize() const { return m_maxVolumeSize; }

  VolumeLocation locate(uint64_t position) const;
  uint64_t position(VolumeLocation const & location) const;

  // Minimal ordered decomposition of [position, position + length).
  // Empty iff length == 0.
  std::vector<VolumeRange> plan(uint64_t position, uint64_t length) const;
  uint64_t volumesTouched(uint64_t position, uint64_t length) const;

  // Sum of volume sizes. Throws VolumeChainBroken if the chain isn't dense,
  // any size is unknown, or any volume except the last isn't full.
  uint64_t logicalLength(std::vector<VolumeDescriptor> const & descriptors) const;

private:
  uint64_t m_maxVolumeSize;
};

}
