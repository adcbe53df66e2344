#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <filesystem>
#include <iostream>

namespace rcopy::logging {

LogConfig config_for_flags(bool quiet, bool debug) {
    LogConfig config;
    if (quiet) {
        config.min_level = boost::log::trivial::warning;
    } else if (debug) {
        config.min_level = boost::log::trivial::debug;
    } else {
        config.min_level = boost::log::trivial::info;
    }
    return config;
}

void init_logging(const LogConfig& config) {
    namespace expr = boost::log::expressions;
    namespace keywords = boost::log::keywords;

    try {
        // Clear any existing sinks
        boost::log::core::get()->remove_all_sinks();
        boost::log::core::get()->reset_filter();

        auto format = (
            expr::stream
                << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                << " [" << boost::log::trivial::severity << "] "
                << expr::smessage
        );
        auto filter = boost::log::trivial::severity >= config.min_level;

        if (config.console) {
            auto console_sink = boost::log::add_console_log(
                std::clog,
                keywords::format = format,
                keywords::auto_flush = true
            );
            console_sink->set_filter(filter);
        }

        if (!config.log_file.empty()) {
            std::filesystem::path log_path = std::filesystem::absolute(config.log_file);
            auto file_sink = boost::log::add_file_log(
                keywords::file_name = log_path.string(),
                keywords::open_mode = std::ios::out | std::ios::app,
                keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
                keywords::format = format,
                keywords::auto_flush = true
            );
            file_sink->set_filter(filter);
        }

        boost::log::add_common_attributes();
        boost::log::core::get()->set_logging_enabled(true);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void shutdown_logging() {
    boost::log::core::get()->flush();
    boost::log::core::get()->remove_all_sinks();
}

} // namespace rcopy::logging
