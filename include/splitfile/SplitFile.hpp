#ifndef _SPLITFILE_API_SPLIT_FILE_H
#define _SPLITFILE_API_SPLIT_FILE_H

#include <cstdint>
#include <memory>
#include "splitfile/Common.hpp"
#include "splitfile/Configuration.hpp"
#include "splitfile/Defs.hpp"
#include "splitfile/IFile.hpp"
#include "splitfile/IVolumeNaming.hpp"
#include "splitfile/IVolumeStore.hpp"

namespace splitfile
{

// Single logical file stored as a dense sequence of volumes,
// each one at most Configuration::maxVolumeSize bytes long.
// Only the last volume may be shorter than the limit.
//
// Not thread safe. Concurrent writers to the same set of volumes are not supported.
class SPLITFILE_API_DECL SplitFile: public IFile
{
public:
  SplitFile();
  // Null naming means SuffixVolumeNaming
  SplitFile(Configuration const & configuration,
    std::shared_ptr<IVolumeStore> const & store,
    std::shared_ptr<IVolumeNaming const> const & naming = std::shared_ptr<IVolumeNaming const>());
  SplitFile(SplitFile &&);
  ~SplitFile();

  SplitFile & operator=(SplitFile &&);

  SplitFile(SplitFile const &) = delete;
  void operator=(SplitFile const &) = delete;

  bool isOpen() const override;
  void close() override;

  uint64_t seek(int64_t offset, SeekOrigin origin) override;
  uint64_t seek(uint64_t position);
  uint64_t position() const override;
  void read(size_t & inOutSize, void * buffer) override;
  void write(size_t size, void const * buffer) override;
  void flush() override;
  void truncate() override;
  uint64_t size() override;

  Configuration const & configuration() const;
  uint64_t volumeCount() const;
  size_t openHandleCount() const;

private:
  class Impl;
  Impl * m_impl;
};

// Volumes are files "baseName", "baseName.2", "baseName.3", ...
// 'read' adds read access to the write-only modes.
SPLITFILE_API_DECL SplitFile OpenSplitFile(const char * baseName, uint64_t maxVolumeSize, StreamMode mode,
  size_t handleCacheLimit = UnboundedHandleCache, bool read = false);

}

#endif
