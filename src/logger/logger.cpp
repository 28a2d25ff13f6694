#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace randomfs::logging {

void init_logging(const std::string& log_file, severity_level min_level) {
    namespace logging = boost::log;
    namespace sinks = boost::log::sinks;
    namespace expr = boost::log::expressions;

    try {
        // Clear any existing sinks
        logging::core::get()->remove_all_sinks();

        // Create and configure text file sink backend
        auto backend = boost::make_shared<sinks::text_file_backend>();

        std::filesystem::path log_path = std::filesystem::absolute(log_file);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        backend->set_file_name_pattern(log_path.string());
        backend->set_open_mode(std::ios::out | std::ios::app);
        backend->auto_flush(true);

        using text_sink = sinks::synchronous_sink<sinks::text_file_backend>;
        auto sink = boost::make_shared<text_sink>(backend);

        sink->set_formatter(
            expr::stream
                << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                << " [" << logging::trivial::severity << "]"
                << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "] "
                << expr::smessage
        );

        logging::core::get()->add_sink(sink);
        logging::add_common_attributes();

        set_log_level(min_level);
        enable_logging();
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void set_log_level(severity_level min_level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

void enable_logging() {
    boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
    boost::log::core::get()->set_logging_enabled(false);
}

severity_level severity_from_string(const std::string& name) {
    severity_level level;
    if (!boost::log::trivial::from_string(name.c_str(), name.size(), level)) {
        throw std::invalid_argument("Unknown log level: " + name);
    }
    return level;
}

} // namespace randomfs::logging
