#pragma once

#include <cstdint>
#include <memory>
#include <vector>
#include "splitfile/Configuration.hpp"
#include "splitfile/IVolumeNaming.hpp"
#include "splitfile/IVolumeStore.hpp"
#include "splitfile/SplitFile.hpp"
#include "VolumeAddressing.hpp"
#include "VolumeCache.hpp"

namespace splitfile
{

class SplitFile::Impl
{
public:
  Impl(Configuration const & configuration,
    std::shared_ptr<IVolumeStore> const & store,
    std::shared_ptr<IVolumeNaming const> const & naming);
  ~Impl();

  Impl(Impl const &) = delete;
  void operator=(Impl const &) = delete;

  bool isOpen() const { return m_isOpen; }
  void close();

  uint64_t seek(int64_t offset, SeekOrigin origin);
  uint64_t position() const { return m_position; }
  void read(size_t & inOutSize, void * buffer);
  void write(size_t size, void const * buffer);
  void flush();
  void truncate();
  uint64_t size();

  Configuration const & configuration() const { return m_configuration; }
  uint64_t volumeCount() const { return m_volumes.size(); }
  size_t openHandleCount() const { return m_cache.openCount(); }

private:
  Configuration const m_configuration;
  std::shared_ptr<IVolumeStore> const m_store;
  std::shared_ptr<IVolumeNaming const> const m_naming;
  VolumeAddressing const m_addressing;
  std::vector<VolumeDescriptor> m_volumes; // dense, index == position in vector
  VolumeCache m_cache;
  uint64_t m_length; // sum of m_volumes sizes, kept in step with every size change
  uint64_t m_position;
  bool m_isOpen;

  void open();
  void removeVolumesFrom(uint64_t index);
  void probeTrailingVolumes();
  uint64_t logicalLength() const;

  std::string volumeName(uint64_t index) const;
  IStorage & openVolume(uint64_t index);
  IStorage & createVolume(uint64_t index);
  IStorage & volumeForWrite(uint64_t index);
  void fillGap(uint64_t position);
  void setVolumeSize(uint64_t index, uint64_t size);

  void requiresReadAccess() const;
  void requiresWriteAccess() const;
};

}
