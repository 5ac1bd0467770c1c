#include <catch2/catch_test_macros.hpp>
#include <trekanten/core/log.h>

#include <spdlog/spdlog.h>
#include <string>

TEST_CASE("Logging system initialization", "[core][log]") {
    SECTION("Initialize logger") {
        REQUIRE_NOTHROW(trekanten::log::init());
        REQUIRE(trekanten::log::get_logger() != nullptr);
    }

    SECTION("Initializing twice reuses the logger") {
        trekanten::log::init(spdlog::level::info);
        auto first = trekanten::log::get_logger();

        REQUIRE_NOTHROW(trekanten::log::init(spdlog::level::debug));
        auto second = trekanten::log::get_logger();

        REQUIRE(first == second);
        REQUIRE(second->level() == spdlog::level::debug);
        REQUIRE(spdlog::get("trekanten") == second);
    }

    SECTION("Log messages at different levels") {
        trekanten::log::init(spdlog::level::trace);

        REQUIRE_NOTHROW(TREKANTEN_LOG_TRACE("Trace message"));
        REQUIRE_NOTHROW(TREKANTEN_LOG_DEBUG("Debug message"));
        REQUIRE_NOTHROW(TREKANTEN_LOG_INFO("Info message"));
        REQUIRE_NOTHROW(TREKANTEN_LOG_WARN("Warning message"));
        REQUIRE_NOTHROW(TREKANTEN_LOG_ERROR("Error message"));
        REQUIRE_NOTHROW(TREKANTEN_LOG_CRITICAL("Critical message"));
    }
}

TEST_CASE("Logging with parameters", "[core][log]") {
    trekanten::log::init();

    int value = 42;
    std::string text = "swapchain";

    REQUIRE_NOTHROW(TREKANTEN_LOG_INFO("Integer: {}", value));
    REQUIRE_NOTHROW(TREKANTEN_LOG_INFO("Multiple: {} and {}", value, text));
}
