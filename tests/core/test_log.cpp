// impulse_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <impulse/core/log.hpp>
#include <string>

using namespace impulse_core;

TEST_CASE("Log level parsing", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());

    REQUIRE(std::string(log_level_name(spdlog::level::debug)) == "debug");
    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name returns the same logger") {
        auto a = get_logger("impulse_test");
        auto b = get_logger("impulse_test");
        REQUIRE(a == b);
        REQUIRE(a->name() == "impulse_test");
    }

    SECTION("physics logger is registered") {
        auto logger = physics_logger();
        REQUIRE(logger != nullptr);
        REQUIRE(logger->name() == "physics");
        REQUIRE(spdlog::get("physics") != nullptr);
    }

    SECTION("per-logger level") {
        auto logger = get_logger("impulse_level_test");
        set_logger_level("impulse_level_test", spdlog::level::err);
        REQUIRE(logger->level() == spdlog::level::err);
    }
}

TEST_CASE("Global log level", "[core][log]") {
    auto previous = get_global_log_level();

    set_global_log_level(spdlog::level::warn);
    REQUIRE(get_global_log_level() == spdlog::level::warn);
    REQUIRE(physics_logger()->level() == spdlog::level::warn);

    set_global_log_level(previous);
}

TEST_CASE("Structured and scoped logging do not throw", "[core][log]") {
    REQUIRE_NOTHROW(log_structured(spdlog::level::info, "impulse_test", "step",
                                   {{"entities", "3"}, {"pairs", "1"}}));
    REQUIRE_NOTHROW([] { IMPULSE_LOG_SCOPE("scoped"); }());
    REQUIRE_NOTHROW(flush_all_loggers());
}

TEST_CASE("Loggers are recreated after shutdown", "[core][log]") {
    auto before = physics_logger();
    REQUIRE(before != nullptr);

    shutdown_logging();
    REQUIRE(spdlog::get("physics") == nullptr);

    LogConfig config;
    config.level = spdlog::level::warn;
    configure_logging(config);

    auto after = physics_logger();
    REQUIRE(after != nullptr);
    REQUIRE(after != before);
    REQUIRE(after == physics_logger());
    REQUIRE(after->level() == spdlog::level::warn);
    REQUIRE(spdlog::get("physics") == after);
    REQUIRE(core_logger()->name() == "impulse");

    set_global_log_level(spdlog::level::info);
}
