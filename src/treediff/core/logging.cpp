#include <treediff/core/logging.hpp>

#include <mutex>
#include <vector>

#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <treediff/core/utilities.hpp>

namespace treediff {

static char const logger_name[] = "treediff";

std::shared_ptr<spdlog::logger>
get_logger()
{
    static std::once_flag created;
    std::call_once(created, [] {
        if (!spdlog::get(logger_name))
            spdlog::stderr_color_mt(logger_name);
    });
    return spdlog::get(logger_name);
}

spdlog::level::level_enum
parse_log_level(string const& level)
{
    auto parsed = spdlog::level::from_str(level);
    // from_str() maps anything it doesn't recognize to 'off', so check that
    // 'off' was actually requested.
    if (parsed == spdlog::level::off && level != "off")
    {
        TREEDIFF_THROW(
            invalid_enum_string()
            << enum_id_info("log_level") << enum_string_info(level));
    }
    return parsed;
}

void
initialize_logging(string const& level, optional<string> const& log_file)
{
    auto parsed_level = parse_log_level(level);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(
        std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>());
    if (log_file)
    {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            *log_file, 262144, 2));
    }
    auto combined_logger = std::make_shared<spdlog::logger>(
        logger_name, begin(sinks), end(sinks));
    combined_logger->set_level(parsed_level);

    // Make sure get_logger() won't create its own logger afterwards.
    get_logger();
    spdlog::drop(logger_name);
    spdlog::register_logger(combined_logger);
}

} // namespace treediff
