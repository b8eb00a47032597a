#include <modeldiff/utilities/logging.h>

#include <spdlog/sinks/ostream_sink.h>

#include <modeldiff/utilities/testing.h>

using namespace modeldiff;

static int
add_numbers(int a, int b)
{
    MODELDIFF_LOG_CALL(<< MODELDIFF_LOG_ARG(a) << MODELDIFF_LOG_ARG(b))
    return a + b;
}

TEST_CASE("call logging", "[utilities][logging]")
{
    auto logger = get_logger();
    REQUIRE(logger);
    REQUIRE(logger->name() == logger_name);

    std::ostringstream output;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(output);
    logger->sinks().push_back(sink);
    auto original_level = logger->level();

    // Calls aren't logged unless debug output is enabled.
    logger->set_level(spdlog::level::info);
    REQUIRE(add_numbers(1, 2) == 3);
    REQUIRE(output.str().empty());

    logger->set_level(spdlog::level::debug);
    REQUIRE(add_numbers(3, 4) == 7);
    auto text = output.str();
    REQUIRE(text.find("add_numbers") != string::npos);
    REQUIRE(text.find("a: 3") != string::npos);
    REQUIRE(text.find("b: 4") != string::npos);

    logger->sinks().pop_back();
    logger->set_level(original_level);
}
