#ifndef _SPLITFILE_API_SPLIT_FILE_ERROR_H
#define _SPLITFILE_API_SPLIT_FILE_ERROR_H

#include "splitfile/Defs.hpp"

namespace splitfile
{

enum class ErrorCode
{
  InvalidConfiguration,
  VolumeNotFound,
  PermissionDenied,
  AlreadyExists,
  StorageFailure,
  VolumeChainBroken,
  OperationRequiresOpenedFile,
  OperationRequiresWriteAccess,
  OperationRequiresReadAccess,
  InvalidSeek,
  StorageLimitReached,
  InternalExpectationFail
};

SPLITFILE_API_DECL const char * ToString(ErrorCode code);

class SPLITFILE_API_DECL SplitFileError
{
public:
  SplitFileError(ErrorCode code, const char * msg);
  SplitFileError(SplitFileError const &);
  SplitFileError(SplitFileError &&);
  ~SplitFileError();

  SplitFileError & operator=(SplitFileError const &);
  SplitFileError & operator=(SplitFileError &&);

  ErrorCode code() const;
  const char * message() const;

private:
  class Impl;
  Impl * m_impl;
};

}

#endif
