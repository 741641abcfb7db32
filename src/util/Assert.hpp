#pragma once

#include "splitfile/SplitFileError.hpp"

namespace splitfile
{

[[noreturn]]
inline void ThrowSplitFileError(ErrorCode code, const char * description)
{
  throw SplitFileError(code, description);
}

}

#define SPLITFILE_STRINGIFY_IMPL(s) #s
#define SPLITFILE_STRINGIFY(s) SPLITFILE_STRINGIFY_IMPL(s)

#define SPLITFILE_ASSERT(expression) \
  (void)((!!(expression)) || (::splitfile::ThrowSplitFileError(::splitfile::ErrorCode::InternalExpectationFail, \
    "Internal expectation fail at " __FILE__ " (" SPLITFILE_STRINGIFY(__LINE__) ")"), false))

#define SPLITFILE_CHAIN_ASSERT(expression, description) \
  (void)((!!(expression)) || (::splitfile::ThrowSplitFileError(::splitfile::ErrorCode::VolumeChainBroken, \
    description), false))
