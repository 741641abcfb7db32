#include "splitfile/SplitFileError.hpp"
#include <string>

namespace splitfile
{

const char * ToString(ErrorCode code)
{
  switch (code)
  {
  case ErrorCode::InvalidConfiguration:         return "InvalidConfiguration";
  case ErrorCode::VolumeNotFound:               return "VolumeNotFound";
  case ErrorCode::PermissionDenied:             return "PermissionDenied";
  case ErrorCode::AlreadyExists:                return "AlreadyExists";
  case ErrorCode::StorageFailure:               return "StorageFailure";
  case ErrorCode::VolumeChainBroken:            return "VolumeChainBroken";
  case ErrorCode::OperationRequiresOpenedFile:  return "OperationRequiresOpenedFile";
  case ErrorCode::OperationRequiresWriteAccess: return "OperationRequiresWriteAccess";
  case ErrorCode::OperationRequiresReadAccess:  return "OperationRequiresReadAccess";
  case ErrorCode::InvalidSeek:                  return "InvalidSeek";
  case ErrorCode::StorageLimitReached:          return "StorageLimitReached";
  case ErrorCode::InternalExpectationFail:      return "InternalExpectationFail";
  }
  return "Unknown";
}

class SplitFileError::Impl
{
public:
  ErrorCode code;
  std::string message;
};

SplitFileError::SplitFileError(ErrorCode code, const char * msg)
  : m_impl(new Impl)
{
  m_impl->message = msg;
  m_impl->code = code;
}

SplitFileError::SplitFileError(SplitFileError && src)
  : m_impl(src.m_impl)
{
  src.m_impl = nullptr;
}

SplitFileError::SplitFileError(SplitFileError const & src)
  : m_impl(new Impl(*src.m_impl))
{
}

SplitFileError::~SplitFileError()
{
  delete m_impl;
}

SplitFileError & SplitFileError::operator=(SplitFileError const & src)
{
  if (this != &src)
  {
    Impl * copy = new Impl(*src.m_impl);
    delete m_impl;
    m_impl = copy;
  }
  return *this;
}

SplitFileError & SplitFileError::operator=(SplitFileError && src)
{
  if (this != &src)
  {
    delete m_impl;
    m_impl = src.m_impl;
    src.m_impl = nullptr;
  }
  return *this;
}

ErrorCode SplitFileError::code() const
{
  return m_impl->code;
}

const char * SplitFileError::message() const
{
  return m_impl->message.c_str();
}

}
