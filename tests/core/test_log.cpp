// sonance_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <sonance/core/log.hpp>

using namespace sonance_core;

TEST_CASE("Log level parsing", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("loud").has_value());

    REQUIRE(std::string(log_level_name(spdlog::level::warn)) == "warn");
    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
}

TEST_CASE("Named loggers", "[core][log]") {
    auto first = audio_logger();
    auto second = get_logger("sonance_audio");
    REQUIRE(first != nullptr);
    REQUIRE(first.get() == second.get());
    REQUIRE(first->name() == "sonance_audio");
    REQUIRE(core_logger()->name() == "sonance_core");

    SECTION("global level applies to registered loggers") {
        auto previous = get_global_log_level();
        set_global_log_level(spdlog::level::err);
        REQUIRE(audio_logger()->level() == spdlog::level::err);
        REQUIRE(get_global_log_level() == spdlog::level::err);
        set_global_log_level(previous);
    }

    SECTION("per-logger level") {
        set_logger_level("sonance_core", spdlog::level::debug);
        REQUIRE(core_logger()->level() == spdlog::level::debug);
        set_logger_level("sonance_core", get_global_log_level());
    }
}
