#include <catch2/catch_test_macros.hpp>
#include <trekanten/backend/error.h>
#include <trekanten/backend/shader.h>

#include <filesystem>
#include <fstream>
#include <vector>

using namespace trekanten;

namespace {

std::filesystem::path WriteTempWords(const std::string& name, const std::vector<uint32_t>& words) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(words.data()), words.size() * sizeof(uint32_t));
    return path;
}

} // namespace

TEST_CASE("SPIR-V loading", "[backend][shader]") {
    SECTION("Valid header is accepted") {
        auto path = WriteTempWords("trekanten_valid.spv", {kSpirvMagic, 0x00010000, 0, 1, 0});

        auto words = ReadSpirv(path);
        REQUIRE(words.size() == 5);
        REQUIRE(words[0] == kSpirvMagic);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(ReadSpirv("/nonexistent/trekanten/shader.spv"), RenderError);
    }

    SECTION("Empty file") {
        auto path = WriteTempWords("trekanten_empty.spv", {});
        REQUIRE_THROWS_AS(ReadSpirv(path), RenderError);
    }

    SECTION("Size not a multiple of four") {
        auto path = std::filesystem::temp_directory_path() / "trekanten_odd.spv";
        {
            std::ofstream out(path, std::ios::binary);
            out << "abcdef";
        }
        REQUIRE_THROWS_AS(ReadSpirv(path), RenderError);
    }

    SECTION("Wrong magic number") {
        auto path = WriteTempWords("trekanten_magic.spv", {0xdeadbeef, 0});

        try {
            ReadSpirv(path);
            FAIL("ReadSpirv accepted a bad magic number");
        } catch (const RenderError& e) {
            REQUIRE(e.GetKind() == ErrorKind::Pipeline);
        }
    }
}
