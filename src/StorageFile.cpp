#include "splitfile/IFile.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include "splitfile/SplitFileError.hpp"
#include "util/Arithmetic.hpp"
#include "util/Assert.hpp"

namespace splitfile
{

// IFile over a single storage unit
class StorageFile: public IFile
{
public:
  StorageFile(std::unique_ptr<IStorage> && storage, OpenMode openMode)
    : m_storage(std::move(storage))
    , m_openMode(openMode)
    , m_position(0)
  {
    if (!m_storage)
      ThrowSplitFileError(ErrorCode::InvalidConfiguration, "Storage isn't set");
  }

  ~StorageFile()
  {
    try
    {
      close();
    }
    catch (SplitFileError const & e)
    {
      BOOST_LOG_TRIVIAL(warning) << "StorageFile: Error while closing: " << e.message();
    }
  }

  bool isOpen() const override { return bool(m_storage); }

  void close() override
  {
    if (!m_storage)
      return;
    std::unique_ptr<IStorage> storage(std::move(m_storage));
    if (m_openMode == OpenMode::ReadWrite)
      storage->flush();
  }

  uint64_t seek(int64_t offset, SeekOrigin origin) override
  {
    requiresOpenedFile();
    uint64_t base = 0;
    switch (origin)
    {
    case SeekOrigin::Begin:
      break;
    case SeekOrigin::Current:
      base = m_position;
      break;
    case SeekOrigin::End:
      base = m_storage->size();
      break;
    }
    m_position = util::SeekTarget(base, offset);
    return m_position;
  }

  uint64_t position() const override
  {
    requiresOpenedFile();
    return m_position;
  }

  void read(size_t & inOutSize, void * buffer) override
  {
    requiresOpenedFile();
    uint64_t const fileSize = m_storage->size();
    size_t const availableSize = m_position < fileSize
      ? size_t(std::min(uint64_t(inOutSize), fileSize - m_position))
      : 0;
    inOutSize = 0;
    if (availableSize == 0)
      return;
    inOutSize = m_storage->read(m_position, availableSize, buffer);
    m_position += inOutSize;
  }

  void write(size_t size, void const * buffer) override
  {
    requiresOpenedFile();
    if (m_openMode == OpenMode::ReadOnly)
      ThrowSplitFileError(ErrorCode::OperationRequiresWriteAccess, "Can't write: file is opened as read-only");
    if (size == 0)
      return;
    uint64_t const end = util::CheckedAdd(m_position, size);
    if (m_position > m_storage->size())
      m_storage->resize(m_position); // zero-fills the gap
    m_storage->write(m_position, size, buffer);
    m_position = end;
  }

  void flush() override
  {
    requiresOpenedFile();
    m_storage->flush();
  }

  void truncate() override
  {
    requiresOpenedFile();
    if (m_openMode == OpenMode::ReadOnly)
      ThrowSplitFileError(ErrorCode::OperationRequiresWriteAccess, "Can't truncate: file is opened as read-only");
    if (m_position < m_storage->size())
      m_storage->resize(m_position);
  }

  uint64_t size() override
  {
    requiresOpenedFile();
    return m_storage->size();
  }

private:
  std::unique_ptr<IStorage> m_storage;
  OpenMode const m_openMode;
  uint64_t m_position;

  void requiresOpenedFile() const
  {
    if (!m_storage)
      ThrowSplitFileError(ErrorCode::OperationRequiresOpenedFile, "File isn't opened");
  }
};

std::unique_ptr<IFile> OpenStorageFile(std::unique_ptr<IStorage> && storage, OpenMode openMode)
{
  return std::unique_ptr<IFile>(new StorageFile(std::move(storage), openMode));
}

}
