#include <crdt-kit/logging.hpp>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <iostream>
#include <string>

namespace crdt_kit::logging {

namespace {

constexpr auto format = "[%TimeStamp%] [%Severity%] %Message%";

auto to_severity(level lvl) -> boost::log::trivial::severity_level {
    switch (lvl) {
        case level::trace:   return boost::log::trivial::trace;
        case level::debug:   return boost::log::trivial::debug;
        case level::info:    return boost::log::trivial::info;
        case level::warning: return boost::log::trivial::warning;
        case level::error:   return boost::log::trivial::error;
    }
    return boost::log::trivial::info;
}

}  // anonymous namespace

void init(level min_level, sink_type t, const std::string& name) {
    auto core = boost::log::core::get();
    core->remove_all_sinks();
    boost::log::add_common_attributes();
    core->set_filter(boost::log::trivial::severity >= to_severity(min_level));

    switch (t) {
        case sink_type::null:
            // Without any sink Boost.Log falls back to stderr
            core->set_logging_enabled(false);
            return;
        case sink_type::file:
            boost::log::add_file_log(boost::log::keywords::file_name = name,
                                     boost::log::keywords::auto_flush = true,
                                     boost::log::keywords::format = format);
            break;
        case sink_type::console:
            boost::log::add_console_log(std::clog,
                                        boost::log::keywords::auto_flush = true,
                                        boost::log::keywords::format = format);
            break;
    }
    core->set_logging_enabled(true);
}

void write(level lvl, std::string_view message) {
    switch (lvl) {
        case level::trace:
            BOOST_LOG_TRIVIAL(trace) << std::string{message};
            break;
        case level::debug:
            BOOST_LOG_TRIVIAL(debug) << std::string{message};
            break;
        case level::info:
            BOOST_LOG_TRIVIAL(info) << std::string{message};
            break;
        case level::warning:
            BOOST_LOG_TRIVIAL(warning) << std::string{message};
            break;
        case level::error:
            BOOST_LOG_TRIVIAL(error) << std::string{message};
            break;
    }
}

}  // namespace crdt_kit::logging
