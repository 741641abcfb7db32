#include <gtest/gtest.h>
#include <iterator>
#include <memory>
#include <string>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/log/core.hpp>
#include "splitfile/Logging.hpp"
#include "splitfile/SplitFile.hpp"
#include "StorageInMemory.hpp"
#include "TestUtils.hpp"

namespace fs = boost::filesystem;

namespace
{

std::string ReadText(fs::path const & fileName)
{
  fs::ifstream file(fileName);
  return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

}

TEST(Logging, FileSink)
{
  fs::path const logFile = fs::temp_directory_path() / fs::unique_path("splitfile-%%%%-%%%%.log");
  splitfile::InitFileLogging(logFile.string(), boost::log::trivial::debug);

  auto store = std::make_shared<VolumeStoreInMemory>();
  splitfile::Configuration configuration;
  configuration.maxVolumeSize = 2;
  configuration.mode = splitfile::StreamMode::WriteTruncate;
  configuration.baseIdentifier = "logged.bin";
  {
    splitfile::SplitFile file(configuration, store);
    auto const data = MakeSequence(3);
    file.write(data.size(), data.data());
  }

  boost::log::core::get()->remove_all_sinks();
  splitfile::SetLogLevel(boost::log::trivial::info);

  std::string const text = ReadText(logFile);
  fs::remove(logFile);

  EXPECT_NE(std::string::npos, text.find("[info] SplitFile: Opened \"logged.bin\" as write-truncate")) << text;
  EXPECT_NE(std::string::npos, text.find("[debug] SplitFile: Creating volume 1 \"logged.bin.2\"")) << text;
  EXPECT_NE(std::string::npos, text.find("[info] SplitFile: Closing \"logged.bin\"")) << text;
  // Below the threshold
  EXPECT_EQ(std::string::npos, text.find("[trace]")) << text;
}
