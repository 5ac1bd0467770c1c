#include <catch2/catch_test_macros.hpp>
#include <trekanten/backend/error.h>
#include <trekanten/backend/image.h>

using namespace trekanten;

TEST_CASE("Mip level count", "[backend][image]") {
    REQUIRE(MipLevelsFor(Extent2D(1, 1)) == 1);
    REQUIRE(MipLevelsFor(Extent2D(2, 2)) == 2);
    REQUIRE(MipLevelsFor(Extent2D(256, 256)) == 9);
    REQUIRE(MipLevelsFor(Extent2D(512, 300)) == 10);
    REQUIRE(MipLevelsFor(Extent2D(0, 0)) == 1);
}

TEST_CASE("Mip extent halving", "[backend][image]") {
    REQUIRE(NextMipExtent(Extent2D(256, 128)) == Extent2D(128, 64));
    REQUIRE(NextMipExtent(Extent2D(3, 1)) == Extent2D(1, 1));
    REQUIRE(NextMipExtent(Extent2D(1, 1)) == Extent2D(1, 1));
}

TEST_CASE("Layout transition masks", "[backend][image]") {
    SECTION("Undefined to transfer destination") {
        auto masks = TransitionMasksFor(VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);

        REQUIRE(masks.src_access == 0);
        REQUIRE(masks.dst_access == VK_ACCESS_TRANSFER_WRITE_BIT);
        REQUIRE(masks.src_stage == VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT);
        REQUIRE(masks.dst_stage == VK_PIPELINE_STAGE_TRANSFER_BIT);
    }

    SECTION("Transfer destination to shader read") {
        auto masks = TransitionMasksFor(VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);

        REQUIRE(masks.src_access == VK_ACCESS_TRANSFER_WRITE_BIT);
        REQUIRE(masks.dst_access == VK_ACCESS_SHADER_READ_BIT);
        REQUIRE(masks.dst_stage == VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT);
    }

    SECTION("Unsupported transition throws") {
        REQUIRE_THROWS_AS(TransitionMasksFor(VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_PRESENT_SRC_KHR), RenderError);
    }
}
