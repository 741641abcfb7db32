#include "SplitFileImpl.hpp"
#include <limits>
#include "splitfile/FileStorage.hpp"
#include "splitfile/SplitFileError.hpp"

namespace splitfile
{

SplitFile::SplitFile()
  : m_impl(nullptr)
{}

SplitFile::SplitFile(Configuration const & configuration,
    std::shared_ptr<IVolumeStore> const & store,
    std::shared_ptr<IVolumeNaming const> const & naming)
  : m_impl(new Impl(configuration, store,
      naming ? naming : std::shared_ptr<IVolumeNaming const>(std::make_shared<SuffixVolumeNaming>())))
{}

SplitFile::SplitFile(SplitFile && src)
  : m_impl(src.m_impl)
{
  src.m_impl = nullptr;
}

SplitFile::~SplitFile()
{
  delete m_impl;
}

SplitFile & SplitFile::operator=(SplitFile && src)
{
  if (this != &src)
  {
    // Close explicitly to let errors propagate, destructor would only log them
    close();
    m_impl = src.m_impl;
    src.m_impl = nullptr;
  }
  return *this;
}

bool SplitFile::isOpen() const
{
  return m_impl != nullptr && m_impl->isOpen();
}

void SplitFile::close()
{
  if (m_impl)
  {
    std::unique_ptr<Impl> impl(m_impl);
    m_impl = nullptr;
    impl->close();
  }
}

[[noreturn]]
inline void ThrowNotOpened()
{
  throw SplitFileError(ErrorCode::OperationRequiresOpenedFile, "Split file isn't opened");
}

uint64_t SplitFile::seek(int64_t offset, SeekOrigin origin)
{
  if (!isOpen())
    ThrowNotOpened();

  return m_impl->seek(offset, origin);
}

uint64_t SplitFile::seek(uint64_t position)
{
  if (!isOpen())
    ThrowNotOpened();

  if (position > uint64_t(std::numeric_limits<int64_t>::max()))
  {
    m_impl->seek(std::numeric_limits<int64_t>::max(), SeekOrigin::Begin);
    return m_impl->seek(int64_t(position - uint64_t(std::numeric_limits<int64_t>::max())), SeekOrigin::Current);
  }
  return m_impl->seek(int64_t(position), SeekOrigin::Begin);
}

uint64_t SplitFile::position() const
{
  if (!isOpen())
    ThrowNotOpened();

  return m_impl->position();
}

void SplitFile::read(size_t & inOutSize, void * buffer)
{
  if (!isOpen())
    ThrowNotOpened();

  m_impl->read(inOutSize, buffer);
}

void SplitFile::write(size_t size, void const * buffer)
{
  if (!isOpen())
    ThrowNotOpened();

  m_impl->write(size, buffer);
}

void SplitFile::flush()
{
  if (!isOpen())
    ThrowNotOpened();

  m_impl->flush();
}

void SplitFile::truncate()
{
  if (!isOpen())
    ThrowNotOpened();

  m_impl->truncate();
}

uint64_t SplitFile::size()
{
  if (!isOpen())
    ThrowNotOpened();

  return m_impl->size();
}

Configuration const & SplitFile::configuration() const
{
  if (!isOpen())
    ThrowNotOpened();

  return m_impl->configuration();
}

uint64_t SplitFile::volumeCount() const
{
  if (!isOpen())
    ThrowNotOpened();

  return m_impl->volumeCount();
}

size_t SplitFile::openHandleCount() const
{
  if (!isOpen())
    ThrowNotOpened();

  return m_impl->openHandleCount();
}

SplitFile OpenSplitFile(const char * baseName, uint64_t maxVolumeSize, StreamMode mode, size_t handleCacheLimit,
  bool read)
{
  Configuration configuration;
  configuration.maxVolumeSize = maxVolumeSize;
  configuration.mode = mode;
  configuration.baseIdentifier = baseName;
  configuration.handleCacheLimit = handleCacheLimit;
  configuration.read = read;
  return SplitFile(configuration, OpenFileVolumeStore());
}

}
