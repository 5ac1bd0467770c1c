#include <catch2/catch_test_macros.hpp>
#include <trekanten/core/config.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace trekanten::config;

namespace {

std::filesystem::path WriteTempConfig(const std::string& name, const std::string& contents) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << contents;
    return path;
}

} // namespace

TEST_CASE("Config defaults", "[core][config]") {
    AppConfig config;

    REQUIRE(config.window_width == 300);
    REQUIRE(config.window_height == 300);
    REQUIRE(config.window_title == "Trekanten");
    REQUIRE(config.enable_validation);
    REQUIRE_FALSE(config.vsync);
    REQUIRE(config.log_level == spdlog::level::info);
}

TEST_CASE("Config loading", "[core][config]") {
    SECTION("Missing file keeps defaults") {
        AppConfig config = load_from_file("/nonexistent/trekanten/config.json");

        REQUIRE(config.window_width == 300);
        REQUIRE(config.window_title == "Trekanten");
        REQUIRE(config.config_path == std::filesystem::path("/nonexistent/trekanten/config.json"));
    }

    SECTION("All sections are read") {
        auto path = WriteTempConfig("trekanten_config_full.json", R"({
            "window": {"width": 1280, "height": 720, "title": "Quad"},
            "logging": {"level": "debug"},
            "renderer": {"validation": false, "vsync": true},
            "assets": {"shader_dir": "build/shaders"}
        })");

        AppConfig config = load_from_file(path);

        REQUIRE(config.window_width == 1280);
        REQUIRE(config.window_height == 720);
        REQUIRE(config.window_title == "Quad");
        REQUIRE(config.log_level == spdlog::level::debug);
        REQUIRE_FALSE(config.enable_validation);
        REQUIRE(config.vsync);
        REQUIRE(config.shader_dir == std::filesystem::path("build/shaders"));

        std::filesystem::remove(path);
    }

    SECTION("Partial file only overrides what it names") {
        auto path = WriteTempConfig("trekanten_config_partial.json", R"({"renderer": {"vsync": true}})");

        AppConfig config = load_from_file(path);

        REQUIRE(config.vsync);
        REQUIRE(config.window_width == 300);
        REQUIRE(config.enable_validation);

        std::filesystem::remove(path);
    }

    SECTION("Malformed file falls back to defaults") {
        auto path = WriteTempConfig("trekanten_config_broken.json", R"({"window": {"width": "wide")");

        AppConfig config = load_from_file(path);

        REQUIRE(config.window_width == 300);
        REQUIRE(config.window_title == "Trekanten");

        std::filesystem::remove(path);
    }
}

TEST_CASE("Log level parsing", "[core][config]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("DEBUG") == spdlog::level::debug);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    REQUIRE(parse_log_level("whatever") == spdlog::level::info);
}
