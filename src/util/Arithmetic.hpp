#pragma once

#include <cstdint>
#include <limits>
#include "util/Assert.hpp"

namespace splitfile { namespace util {

inline uint64_t CheckedAdd(uint64_t x, uint64_t y)
{
  if (y > std::numeric_limits<uint64_t>::max() - x)
    ThrowSplitFileError(ErrorCode::StorageLimitReached, "Logical size limit reached");
  return x + y;
}

inline uint64_t CheckedMultiply(uint64_t x, uint64_t y)
{
  if (x != 0 && y > std::numeric_limits<uint64_t>::max() / x)
    ThrowSplitFileError(ErrorCode::StorageLimitReached, "Logical size limit reached");
  return x * y;
}

// Position 'offset' bytes away from 'base', throws InvalidSeek before the beginning
inline uint64_t SeekTarget(uint64_t base, int64_t offset)
{
  if (offset >= 0)
    return CheckedAdd(base, uint64_t(offset));
  uint64_t const distance = uint64_t(-(offset + 1)) + 1;
  if (distance > base)
    ThrowSplitFileError(ErrorCode::InvalidSeek, "Can't seek before the beginning of the file");
  return base - distance;
}

}}
