#ifndef _SPLITFILE_API_LOGGING_H
#define _SPLITFILE_API_LOGGING_H

#include <string>
#include <boost/log/trivial.hpp>
#include "splitfile/Defs.hpp"

namespace splitfile
{

// Library messages go through the Boost.Log trivial logger
SPLITFILE_API_DECL void SetLogLevel(boost::log::trivial::severity_level minLevel);

// Adds synchronous text file sink, "<timestamp> [<severity>] <message>" per line
SPLITFILE_API_DECL void InitFileLogging(std::string const & fileName,
  boost::log::trivial::severity_level minLevel = boost::log::trivial::info);

}

#endif
