#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "drill_link/logging.hpp"

using namespace drill_link;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    drill_link::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("initialize_logger returns the shared instance") {
    const auto logger = get_logger();
    REQUIRE(logger != nullptr);
    REQUIRE(logger->name() == "drill_link");
    REQUIRE(initialize_logger("ignored-after-first-call") == logger);
}

TEST_CASE("set_log_level accepts names in any case and falls back to info") {
    const auto logger = get_logger();

    set_log_level("DEBUG");
    REQUIRE(logger->level() == spdlog::level::debug);

    set_log_level("warn");
    REQUIRE(logger->level() == spdlog::level::warn);

    set_log_level("chatty");
    REQUIRE(logger->level() == spdlog::level::info);

    set_log_level("off");
    REQUIRE(logger->level() == spdlog::level::off);

    set_log_level("warn");
}
