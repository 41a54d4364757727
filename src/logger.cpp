#include "logger.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>

namespace keyshield {
namespace logging {

namespace expr = boost::log::expressions;

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

const char* to_string(severity_level level) {
    switch (level) {
        case severity_level::trace:   return "TRACE";
        case severity_level::debug:   return "DEBUG";
        case severity_level::info:    return "INFO";
        case severity_level::warning: return "WARNING";
        case severity_level::error:   return "ERROR";
        case severity_level::fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& strm, severity_level level) {
    strm << to_string(level);
    return strm;
}

BOOST_LOG_GLOBAL_LOGGER_INIT(global_logger, logger_type) {
    logger_type logger;
    logger.add_attribute("TimeStamp", boost::log::attributes::local_clock());
    logger.add_attribute("ThreadID", boost::log::attributes::current_thread_id());
    return logger;
}

template <typename Sink>
static void install_sink(const boost::shared_ptr<Sink>& sink, severity_level min_level) {
    sink->set_formatter(
        expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << " [" << expr::attr<severity_level>("Severity") << "] "
            << expr::smessage
    );
    sink->set_filter(severity >= min_level);

    auto core = boost::log::core::get();
    core->remove_all_sinks();
    core->add_sink(sink);
}

void init_logging(const std::string& log_file, severity_level min_level) {
    auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    backend->set_file_name_pattern(log_path.string());
    backend->set_open_mode(std::ios::out | std::ios::app);
    backend->auto_flush(true);

    using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
    install_sink(boost::make_shared<text_sink>(backend), min_level);
}

void init_console_logging(severity_level min_level) {
    auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    backend->auto_flush(true);

    using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
    install_sink(boost::make_shared<text_sink>(backend), min_level);
}

} // namespace logging
} // namespace keyshield
