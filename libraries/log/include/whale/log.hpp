#pragma once
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/attributes/mutable_constant.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <filesystem>
#include <string>

#define LOG(LEVEL)                                                                         \
BOOST_LOG_SEV(::boost::log::trivial::logger::get(), boost::log::trivial::LEVEL)            \
  << boost::log::add_value("Line", __LINE__)                                               \
  << boost::log::add_value("File", std::filesystem::path(__FILE__).filename().string())    \

namespace whale {

/**
 * Installs the console sink and, when a log directory is given, a rotating file sink.
 *
 * Records below filter_level are dropped. filter_level must name a Boost.Log
 * trivial severity ("trace", "debug", "info", "warning", "error", "fatal").
 */
void initialize_logging(
   const std::string& application_name,
   const std::string& instance_id = {},
   const std::string& filter_level = "info",
   const std::filesystem::path& log_directory = {},
   bool color = true,
   bool datetime = true );

} // whale
