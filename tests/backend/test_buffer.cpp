#include <catch2/catch_test_macros.hpp>
#include <trekanten/backend/buffer.h>
#include <trekanten/backend/error.h>

using namespace trekanten;

namespace {

ErrorKind KindOf(VmaMemoryUsage usage, VkDeviceSize bufferSize, size_t size, VkDeviceSize offset) {
    try {
        CheckHostWrite(usage, bufferSize, size, offset);
    } catch (const RenderError& e) {
        return e.GetKind();
    }
    return ErrorKind::Frame;
}

} // namespace

TEST_CASE("Host writes", "[backend][buffer]") {
    SECTION("Writes inside a host visible buffer") {
        REQUIRE_NOTHROW(CheckHostWrite(VMA_MEMORY_USAGE_CPU_TO_GPU, 64, 64, 0));
        REQUIRE_NOTHROW(CheckHostWrite(VMA_MEMORY_USAGE_CPU_ONLY, 64, 16, 48));
    }

    SECTION("Empty write at the end") {
        REQUIRE_NOTHROW(CheckHostWrite(VMA_MEMORY_USAGE_CPU_TO_GPU, 64, 0, 64));
    }

    SECTION("Device local memory is rejected") {
        REQUIRE_THROWS_AS(CheckHostWrite(VMA_MEMORY_USAGE_GPU_ONLY, 64, 4, 0), RenderError);
        REQUIRE(KindOf(VMA_MEMORY_USAGE_GPU_ONLY, 64, 4, 0) == ErrorKind::Memory);
    }

    SECTION("Write starting at the end") {
        REQUIRE(KindOf(VMA_MEMORY_USAGE_CPU_TO_GPU, 64, 1, 64) == ErrorKind::Memory);
    }

    SECTION("Offset past the end") {
        REQUIRE(KindOf(VMA_MEMORY_USAGE_CPU_TO_GPU, 64, 0, 65) == ErrorKind::Memory);
    }

    SECTION("Write running past the end") {
        REQUIRE(KindOf(VMA_MEMORY_USAGE_CPU_TO_GPU, 64, 17, 48) == ErrorKind::Memory);
        REQUIRE(KindOf(VMA_MEMORY_USAGE_CPU_TO_GPU, 64, 65, 0) == ErrorKind::Memory);
    }
}
