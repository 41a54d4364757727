#ifndef KEYSHIELD_LOGGER_HPP
#define KEYSHIELD_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <ostream>
#include <string>

namespace keyshield {
namespace logging {

enum class severity_level {
    trace,
    debug,
    info,
    warning,
    error,
    fatal
};

const char* to_string(severity_level level);
std::ostream& operator<<(std::ostream& strm, severity_level level);

using logger_type = boost::log::sources::severity_logger_mt<severity_level>;

BOOST_LOG_GLOBAL_LOGGER(global_logger, ::keyshield::logging::logger_type)

// Route records to a file, replacing any previously installed sink.
void init_logging(const std::string& log_file = "keyshield.log",
                  severity_level min_level = severity_level::info);

// Route records to std::clog, replacing any previously installed sink.
void init_console_logging(severity_level min_level = severity_level::info);

} // namespace logging
} // namespace keyshield

#define KEYSHIELD_LOG_TRACE BOOST_LOG_SEV(keyshield::logging::global_logger::get(), keyshield::logging::severity_level::trace)
#define KEYSHIELD_LOG_DEBUG BOOST_LOG_SEV(keyshield::logging::global_logger::get(), keyshield::logging::severity_level::debug)
#define KEYSHIELD_LOG_INFO  BOOST_LOG_SEV(keyshield::logging::global_logger::get(), keyshield::logging::severity_level::info)
#define KEYSHIELD_LOG_WARN  BOOST_LOG_SEV(keyshield::logging::global_logger::get(), keyshield::logging::severity_level::warning)
#define KEYSHIELD_LOG_ERROR BOOST_LOG_SEV(keyshield::logging::global_logger::get(), keyshield::logging::severity_level::error)
#define KEYSHIELD_LOG_FATAL BOOST_LOG_SEV(keyshield::logging::global_logger::get(), keyshield::logging::severity_level::fatal)

#endif // KEYSHIELD_LOGGER_HPP
