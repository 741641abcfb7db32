#include "splitfile/FileStorage.hpp"
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/log/trivial.hpp>
#include "util/Assert.hpp"

namespace splitfile
{

namespace fs = boost::filesystem;

namespace
{
  ErrorCode ErrorCodeFromSystem(boost::system::error_code const & ec)
  {
    if (ec == boost::system::errc::no_such_file_or_directory)
      return ErrorCode::VolumeNotFound;
    if (ec == boost::system::errc::permission_denied
      || ec == boost::system::errc::operation_not_permitted
      || ec == boost::system::errc::read_only_file_system)
      return ErrorCode::PermissionDenied;
    return ErrorCode::StorageFailure;
  }

  [[noreturn]]
  void ThrowStorageError(ErrorCode code, fs::path const & fileName, std::string const & what)
  {
    std::string const message = "\"" + fileName.string() + "\": " + what;
    BOOST_LOG_TRIVIAL(error) << "FileStorage: " << message;
    ThrowSplitFileError(code, message.c_str());
  }
}

class FileStorage: public IStorage
{
public:
  FileStorage(fs::path const & fileName, OpenMode openMode, bool create)
    : m_fileName(fs::absolute(fileName)) // Reopen on truncate shouldn't rely on current directory
    , m_openMode(openMode)
  {
    boost::system::error_code ec;
    bool const exists = fs::exists(m_fileName, ec);
    if (ec && ec != boost::system::errc::no_such_file_or_directory)
      ThrowStorageError(ErrorCodeFromSystem(ec), m_fileName, ec.message());
    if (!exists)
    {
      if (!create || m_openMode != OpenMode::ReadWrite)
        ThrowStorageError(ErrorCode::VolumeNotFound, m_fileName, "volume not found");
      open(true);
    }
    else
      open(false);

    try
    {
      m_stream.seekg(0, std::ios_base::end);
      m_size = uint64_t(m_stream.tellg());
    }
    catch (std::ios_base::failure const & e)
    {
      ThrowStorageError(ErrorCode::StorageFailure, m_fileName, e.what());
    }
  }

  uint64_t size() const override { return m_size; }

  size_t read(uint64_t position, size_t size, void * data) const override
  {
    if (position >= m_size)
      return 0;
    size_t const available = size_t(std::min(uint64_t(size), m_size - position));
    reopenIfClosed();
    try
    {
      m_stream.seekg(position);
      m_stream.read(reinterpret_cast<char *>(data), available);
    }
    catch (std::ios_base::failure const & e)
    {
      ThrowStorageError(ErrorCode::StorageFailure, m_fileName, e.what());
    }
    return available;
  }

  void write(uint64_t position, size_t size, void const * data) override
  {
    requiresReadWriteMode();
    reopenIfClosed();
    try
    {
      m_stream.seekp(position);
      m_stream.write(reinterpret_cast<const char *>(data), size);
    }
    catch (std::ios_base::failure const & e)
    {
      ThrowStorageError(ErrorCode::StorageFailure, m_fileName, e.what());
    }
    m_size = std::max(m_size, position + size);
  }

  void resize(uint64_t size) override
  {
    requiresReadWriteMode();
    reopenIfClosed();
    try
    {
      if (size > m_size)
      {
        m_stream.seekp(size - 1);
        char zeroChar = 0;
        m_stream.write(&zeroChar, 1);
      }
      else if (size < m_size)
      {
        m_stream.close();
        boost::system::error_code ec;
        fs::resize_file(m_fileName, size, ec);
        // Stream stays closed on failure and is reopened by the next call
        if (ec)
          ThrowStorageError(ErrorCodeFromSystem(ec), m_fileName, "can't shrink volume: " + ec.message());
        open(false);
      }
    }
    catch (std::ios_base::failure const & e)
    {
      ThrowStorageError(ErrorCode::StorageFailure, m_fileName, e.what());
    }
    m_size = size;
  }

  void flush() override
  {
    if (m_openMode != OpenMode::ReadWrite || !m_stream.is_open())
      return;
    try
    {
      m_stream.flush();
    }
    catch (std::ios_base::failure const & e)
    {
      ThrowStorageError(ErrorCode::StorageFailure, m_fileName, e.what());
    }
  }

private:
  fs::path const m_fileName;
  OpenMode const m_openMode;
  mutable fs::fstream m_stream;
  uint64_t m_size;

  void open(bool create) const
  {
    std::ios_base::openmode openmode = std::ios_base::binary | std::ios_base::in;
    if (m_openMode == OpenMode::ReadWrite)
    {
      openmode |= std::ios_base::out;
      if (create)
        openmode |= std::ios_base::trunc;
    }
    m_stream.exceptions(std::fstream::goodbit);
    m_stream.clear();
    errno = 0;
    m_stream.open(m_fileName, openmode);
    if (!m_stream.is_open())
    {
      int const error = errno;
      ThrowStorageError(
        ErrorCodeFromSystem(boost::system::error_code(error, boost::system::generic_category())),
        m_fileName, "can't open volume");
    }
    m_stream.exceptions(std::fstream::failbit | std::fstream::badbit);
  }

  void reopenIfClosed() const
  {
    if (!m_stream.is_open())
    {
      BOOST_LOG_TRIVIAL(debug) << "FileStorage: Reopening \"" << m_fileName.string() << "\"";
      open(false);
    }
  }

  void requiresReadWriteMode() const
  {
    if (m_openMode != OpenMode::ReadWrite)
      ThrowStorageError(ErrorCode::PermissionDenied, m_fileName, "volume is opened as read-only");
  }
};

class FileVolumeStore: public IVolumeStore
{
public:
  std::unique_ptr<IStorage> open(std::string const & name, OpenMode openMode, bool create) override
  {
    return std::unique_ptr<IStorage>(new FileStorage(name, openMode, create));
  }

  bool exists(std::string const & name) const override
  {
    boost::system::error_code ec;
    bool const result = fs::is_regular_file(name, ec);
    if (ec && ec != boost::system::errc::no_such_file_or_directory)
      ThrowStorageError(ErrorCodeFromSystem(ec), name, ec.message());
    return result;
  }

  void remove(std::string const & name) override
  {
    boost::system::error_code ec;
    fs::remove(name, ec);
    if (ec && ec != boost::system::errc::no_such_file_or_directory)
      ThrowStorageError(ErrorCodeFromSystem(ec), name, ec.message());
  }
};

std::shared_ptr<IVolumeStore> OpenFileVolumeStore()
{
  return std::make_shared<FileVolumeStore>();
}

std::unique_ptr<IStorage> OpenFileStorage(const char * fileName, OpenMode openMode, bool create)
{
  return std::unique_ptr<IStorage>(new FileStorage(fileName, openMode, create));
}

}
