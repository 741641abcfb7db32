#include "splitfile/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace splitfile
{

namespace logging = boost::log;

void SetLogLevel(logging::trivial::severity_level minLevel)
{
  logging::core::get()->set_filter(logging::trivial::severity >= minLevel);
}

void InitFileLogging(std::string const & fileName, logging::trivial::severity_level minLevel)
{
  namespace expr = logging::expressions;
  namespace keywords = logging::keywords;

  logging::add_file_log(
    keywords::file_name = fileName,
    keywords::open_mode = std::ios_base::out | std::ios_base::app,
    keywords::auto_flush = true,
    keywords::format = (
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << logging::trivial::severity << "] "
        << expr::smessage));
  logging::add_common_attributes();
  SetLogLevel(minLevel);
}

}
