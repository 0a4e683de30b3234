#ifndef TREEDIFF_CORE_LOGGING_HPP
#define TREEDIFF_CORE_LOGGING_HPP

#include <memory>
#include <sstream>
#include <type_traits>

#include <spdlog/spdlog.h>

#include <treediff/core/dynamic.hpp>

namespace treediff {

// Get the "treediff" logger. If nothing has configured it yet, it's created
// with a color sink on stderr (so that it never mixes with output written to
// stdout) at spdlog's default level.
std::shared_ptr<spdlog::logger>
get_logger();

// (Re)create the "treediff" logger with the given level name ("trace",
// "debug", "info", "warn", "error", "critical" or "off"). If :log_file is
// provided, messages are also written to a rotating log at that path.
void
initialize_logging(string const& level, optional<string> const& log_file);

// Parse a level name as accepted by initialize_logging.
spdlog::level::level_enum
parse_log_level(string const& level);

namespace detail {

template<class Value>
struct arg_logger
{
    arg_logger(char const* name, Value const& value) : name(name), value(value)
    {
    }

    char const* name;
    Value const& value;
};

template<class Value>
std::ostream&
operator<<(std::ostream& stream, arg_logger<Value> arg)
{
    stream << "\n" << dynamic({{arg.name, to_dynamic(arg.value)}});
    return stream;
}

} // namespace detail

// Log a function call at debug level.
#define TREEDIFF_LOG_CALL(args)                                               \
    {                                                                         \
        auto logger = ::treediff::get_logger();                               \
        if (logger->should_log(spdlog::level::debug))                         \
        {                                                                     \
            std::ostringstream stream;                                        \
            stream << __func__ args;                                          \
            logger->debug(stream.str());                                      \
        }                                                                     \
    }

// Log an argument to a function call.
#define TREEDIFF_LOG_ARG(arg)                                                 \
    ::treediff::detail::arg_logger<                                           \
        std::remove_reference<std::remove_const<decltype(arg)>::type>::type>( \
        #arg, arg)

} // namespace treediff

#endif
