#include <modeldiff/utilities/logging.h>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace modeldiff {

char const* const logger_name = "modeldiff";

void
initialize_logging(string const& level)
{
    // Create and register the logger.
    if (!spdlog::get(logger_name))
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(
            std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        auto logger = std::make_shared<spdlog::logger>(
            logger_name, begin(sinks), end(sinks));
        spdlog::register_logger(logger);
    }
    spdlog::get(logger_name)->set_level(spdlog::level::from_str(level));
}

void
ensure_logger_exists()
{
    if (!spdlog::get(logger_name))
    {
        auto logger = std::make_shared<spdlog::logger>(
            logger_name, std::make_shared<spdlog::sinks::null_sink_mt>());
        spdlog::register_logger(logger);
    }
}

std::shared_ptr<spdlog::logger>
get_logger()
{
    auto logger = spdlog::get(logger_name);
    if (!logger)
    {
        ensure_logger_exists();
        logger = spdlog::get(logger_name);
    }
    return logger;
}

} // namespace modeldiff
