#ifndef MODELDIFF_UTILITIES_LOGGING_H
#define MODELDIFF_UTILITIES_LOGGING_H

#include <memory>
#include <sstream>
#include <type_traits>

#include <spdlog/spdlog.h>

#include <modeldiff/core/dynamic.h>

namespace modeldiff {

// All modeldiff logging goes through a single spdlog logger registered under
// this name.
extern char const* const logger_name;

// Create and register the modeldiff logger (writing to stderr) if it doesn't
// already exist, and set its level. :level is one of spdlog's level names
// ("trace", "debug", "info", "warn", "error", "critical", "off").
void
initialize_logging(string const& level = "warn");

// Make sure that the modeldiff logger exists without producing any output.
// This is what library code falls back to when the application never called
// initialize_logging().
void
ensure_logger_exists();

// Get the modeldiff logger, creating a silent one if necessary.
std::shared_ptr<spdlog::logger>
get_logger();

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
    stream << "\n" << dynamic({{arg.name, dynamic(arg.value)}});
    return stream;
}

} // namespace detail

// Create a logger for a function call.
#define MODELDIFF_LOG_CALL(args)                                              \
    {                                                                         \
        auto logger = modeldiff::get_logger();                                \
        if (logger->should_log(spdlog::level::debug))                         \
        {                                                                     \
            std::ostringstream stream;                                        \
            stream << __func__ args;                                          \
            logger->debug(stream.str());                                      \
        }                                                                     \
    }

// Log an argument to a function call.
#define MODELDIFF_LOG_ARG(arg)                                                \
    modeldiff::detail::arg_logger<                                            \
        std::remove_reference<std::remove_const<decltype(arg)>::type>::type>( \
        #arg, arg)

} // namespace modeldiff

#endif
