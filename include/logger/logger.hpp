#ifndef STREAMCORPUS_LOGGER_HPP
#define STREAMCORPUS_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace streamcorpus {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

// Routes BOOST_LOG_TRIVIAL records to a freshly truncated log file
void init_logging(const std::string& log_file = "streamcorpus.log",
                  severity_level min_level = boost::log::trivial::info);

// Routes BOOST_LOG_TRIVIAL records to stderr
void init_console_logging(severity_level min_level = boost::log::trivial::info);

// Drops records below the given severity
void set_log_level(severity_level level);

void enable_logging();
void disable_logging();

} // namespace logging
} // namespace streamcorpus

#endif // STREAMCORPUS_LOGGER_HPP
