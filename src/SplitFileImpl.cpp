#include "SplitFileImpl.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include "util/Arithmetic.hpp"
#include "util/Assert.hpp"

namespace splitfile
{

namespace
{
  Configuration const & Validated(Configuration const & configuration)
  {
    configuration.validate();
    return configuration;
  }
}

SplitFile::Impl::Impl(Configuration const & configuration,
    std::shared_ptr<IVolumeStore> const & store,
    std::shared_ptr<IVolumeNaming const> const & naming)
  : m_configuration(Validated(configuration))
  , m_store(store)
  , m_naming(naming)
  , m_addressing(m_configuration.maxVolumeSize)
  , m_cache(m_configuration.handleCacheLimit)
  , m_length(0)
  , m_position(0)
  , m_isOpen(false)
{
  if (!m_store)
    ThrowSplitFileError(ErrorCode::InvalidConfiguration, "Volume store isn't set");
  SPLITFILE_ASSERT(m_naming);

  open();
  m_isOpen = true;

  BOOST_LOG_TRIVIAL(info) << "SplitFile: Opened \"" << m_configuration.baseIdentifier << "\" as "
    << ToString(m_configuration.mode) << (m_configuration.read ? " with read access" : "") << ", " << m_volumes.size() << " volume(s), position " << m_position;
}

SplitFile::Impl::~Impl()
{
  try
  {
    close();
  }
  catch (SplitFileError const & e)
  {
    BOOST_LOG_TRIVIAL(warning) << "SplitFile: Error while closing \"" << m_configuration.baseIdentifier
      << "\": " << e.message();
  }
}

void SplitFile::Impl::open()
{
  switch (m_configuration.mode)
  {
  case StreamMode::WriteTruncate:
    removeVolumesFrom(1);
    createVolume(0);
    break;
  case StreamMode::WriteCreateNew:
    if (m_store->exists(volumeName(0)))
      ThrowSplitFileError(ErrorCode::AlreadyExists,
        ("Volume \"" + volumeName(0) + "\" already exists").c_str());
    createVolume(0);
    break;
  case StreamMode::WriteAppend:
    if (m_store->exists(volumeName(0)))
      probeTrailingVolumes();
    else
      createVolume(0);
    logicalLength(); // validates chain
    m_position = m_length;
    break;
  case StreamMode::Read:
  case StreamMode::ReadWrite:
    probeTrailingVolumes();
    logicalLength(); // validates chain
    break;
  }
}

void SplitFile::Impl::close()
{
  if (!m_isOpen)
    return;
  m_isOpen = false;
  BOOST_LOG_TRIVIAL(info) << "SplitFile: Closing \"" << m_configuration.baseIdentifier << "\", "
    << m_volumes.size() << " volume(s)";
  m_cache.releaseAll();
}

void SplitFile::Impl::removeVolumesFrom(uint64_t index)
{
  for (;; ++index)
  {
    std::string const name = volumeName(index);
    if (!m_store->exists(name))
      break;
    BOOST_LOG_TRIVIAL(debug) << "SplitFile: Removing stale volume \"" << name << "\"";
    m_store->remove(name);
  }
}

void SplitFile::Impl::probeTrailingVolumes()
{
  for (uint64_t index = m_volumes.size();; ++index)
  {
    std::string const name = volumeName(index);
    // Missing volume 0 is reported by the store on open
    if (index > 0 && !m_store->exists(name))
      break;
    m_volumes.emplace_back(index, name);
    try
    {
      uint64_t const size = openVolume(index).size();
      m_length = util::CheckedAdd(m_length, size);
      m_volumes.back().size = size;
    }
    catch (SplitFileError const &)
    {
      m_volumes.pop_back();
      throw;
    }
    BOOST_LOG_TRIVIAL(trace) << "SplitFile: Probed volume \"" << name << "\", " << *m_volumes.back().size << " bytes";
  }
}

uint64_t SplitFile::Impl::logicalLength() const
{
  return m_addressing.logicalLength(m_volumes);
}

std::string SplitFile::Impl::volumeName(uint64_t index) const
{
  return m_naming->nameFor(m_configuration.baseIdentifier, index);
}

IStorage & SplitFile::Impl::openVolume(uint64_t index)
{
  SPLITFILE_ASSERT(index < m_volumes.size());
  OpenMode const openMode = HasWriteAccess(m_configuration.mode) ? OpenMode::ReadWrite : OpenMode::ReadOnly;
  std::string const & name = m_volumes[index].name;
  return m_cache.acquire(index,
    [this, &name, openMode]{
      return m_store->open(name, openMode, false);
    });
}

IStorage & SplitFile::Impl::createVolume(uint64_t index)
{
  SPLITFILE_ASSERT(index == m_volumes.size());
  std::string const name = volumeName(index);
  BOOST_LOG_TRIVIAL(debug) << "SplitFile: Creating volume " << index << " \"" << name << "\"";

  IStorage & storage = m_cache.acquire(index,
    [this, &name]{
      return m_store->open(name, OpenMode::ReadWrite, true);
    });
  if (storage.size() != 0)
    storage.resize(0);

  m_volumes.emplace_back(index, name);
  m_volumes.back().size = uint64_t(0);
  return storage;
}

IStorage & SplitFile::Impl::volumeForWrite(uint64_t index)
{
  if (index < m_volumes.size())
    return openVolume(index);

  SPLITFILE_CHAIN_ASSERT(index == m_volumes.size(),
    "Volume can be created only at the frontier");
  SPLITFILE_CHAIN_ASSERT(*m_volumes.back().size == m_addressing.maxVolumeSize(),
    "Volume can't be created while the previous one is short");
  return createVolume(index);
}

void SplitFile::Impl::fillGap(uint64_t position)
{
  // Space between the current end and 'position' is zero-filled by the store on resize
  uint64_t const maxSize = m_addressing.maxVolumeSize();
  VolumeLocation const location = m_addressing.locate(position);
  BOOST_LOG_TRIVIAL(debug) << "SplitFile: Zero-filling \"" << m_configuration.baseIdentifier
    << "\" up to position " << position;

  for (uint64_t index = m_volumes.size() - 1; index < location.index; ++index)
  {
    IStorage & storage = volumeForWrite(index);
    if (*m_volumes[index].size < maxSize)
    {
      storage.resize(maxSize);
      setVolumeSize(index, maxSize);
    }
  }

  if (location.offset > 0)
  {
    IStorage & storage = volumeForWrite(location.index);
    if (*m_volumes[location.index].size < location.offset)
    {
      storage.resize(location.offset);
      setVolumeSize(location.index, location.offset);
    }
  }
}

uint64_t SplitFile::Impl::seek(int64_t offset, SeekOrigin origin)
{
  uint64_t base = 0;
  switch (origin)
  {
  case SeekOrigin::Begin:
    base = 0;
    break;
  case SeekOrigin::Current:
    base = m_position;
    break;
  case SeekOrigin::End:
    base = size();
    break;
  }

  m_position = util::SeekTarget(base, offset);
  return m_position;
}

void SplitFile::Impl::read(size_t & inOutSize, void * buffer)
{
  requiresReadAccess();

  size_t const requested = inOutSize;
  inOutSize = 0;
  if (requested == 0 || m_position >= m_length)
    return;

  uint64_t const available = std::min(uint64_t(requested), m_length - m_position);
  char * out = static_cast<char *>(buffer);
  size_t done = 0;
  for (VolumeRange const & range : m_addressing.plan(m_position, available))
  {
    IStorage * storage;
    try
    {
      storage = &openVolume(range.index);
    }
    catch (SplitFileError const & e)
    {
      if (e.code() != ErrorCode::VolumeNotFound)
        throw;
      BOOST_LOG_TRIVIAL(warning) << "SplitFile: Volume \"" << m_volumes[range.index].name << "\" disappeared, "
        << "read stops at position " << m_position + done;
      break;
    }
    size_t const bytesRead = storage->read(range.offset, size_t(range.length), out + done);
    BOOST_LOG_TRIVIAL(trace) << "SplitFile: Read " << bytesRead << " bytes from volume " << range.index
      << " at offset " << range.offset;
    done += bytesRead;
    if (bytesRead < range.length)
      break;
  }

  m_position += done;
  inOutSize = done;
}

void SplitFile::Impl::write(size_t size, void const * buffer)
{
  requiresWriteAccess();
  if (size == 0)
    return;
  util::CheckedAdd(m_position, size);

  if (m_position > m_length)
    fillGap(m_position);

  uint64_t const maxSize = m_addressing.maxVolumeSize();
  char const * in = static_cast<char const *>(buffer);
  for (VolumeRange const & range : m_addressing.plan(m_position, size))
  {
    try
    {
      IStorage & storage = volumeForWrite(range.index);
      storage.write(range.offset, size_t(range.length), in);
    }
    catch (SplitFileError const & e)
    {
      BOOST_LOG_TRIVIAL(error) << "SplitFile: Write to volume " << range.index << " of \""
        << m_configuration.baseIdentifier << "\" failed: " << e.message();
      throw;
    }
    BOOST_LOG_TRIVIAL(trace) << "SplitFile: Wrote " << range.length << " bytes to volume " << range.index
      << " at offset " << range.offset;

    uint64_t const previousSize = *m_volumes[range.index].size;
    setVolumeSize(range.index, std::min(std::max(previousSize, range.offset + range.length), maxSize));
    in += range.length;
  }

  m_position += size;
}

void SplitFile::Impl::flush()
{
  m_cache.flushAll();
}

void SplitFile::Impl::truncate()
{
  requiresWriteAccess();

  if (m_position >= m_length)
    return;

  uint64_t keepCount = 1;
  uint64_t lastSize = 0;
  if (m_position > 0)
  {
    VolumeLocation const last = m_addressing.locate(m_position - 1);
    keepCount = last.index + 1;
    lastSize = last.offset + 1;
  }

  // Remove from the end so that the chain stays dense on failure
  while (m_volumes.size() > keepCount)
  {
    VolumeDescriptor const & descriptor = m_volumes.back();
    BOOST_LOG_TRIVIAL(debug) << "SplitFile: Removing volume " << descriptor.index << " \"" << descriptor.name << "\"";
    m_cache.release(descriptor.index);
    m_store->remove(descriptor.name);
    m_length -= *descriptor.size;
    m_volumes.pop_back();
  }

  BOOST_LOG_TRIVIAL(debug) << "SplitFile: Truncating volume " << keepCount - 1 << " to " << lastSize << " bytes";
  openVolume(keepCount - 1).resize(lastSize);
  setVolumeSize(keepCount - 1, lastSize);
}

uint64_t SplitFile::Impl::size()
{
  probeTrailingVolumes();
  // Full chain check, trailing volumes could have appeared since open
  logicalLength();
  return m_length;
}

void SplitFile::Impl::setVolumeSize(uint64_t index, uint64_t size)
{
  VolumeDescriptor & descriptor = m_volumes[index];
  m_length = m_length - *descriptor.size + size;
  descriptor.size = size;
}

void SplitFile::Impl::requiresReadAccess() const
{
  if (!HasReadAccess(m_configuration))
    ThrowSplitFileError(ErrorCode::OperationRequiresReadAccess, "Can't read: file is opened as write-only");
}

void SplitFile::Impl::requiresWriteAccess() const
{
  if (!HasWriteAccess(m_configuration.mode))
    ThrowSplitFileError(ErrorCode::OperationRequiresWriteAccess, "Can't write: file is opened as read-only");
}

}
