#include <catch2/catch_test_macros.hpp>
#include <trekanten/backend/error.h>
#include <trekanten/backend/util.h>

using namespace trekanten;

TEST_CASE("Extent conversions", "[backend][util]") {
    SECTION("Extent2D to and from VkExtent2D") {
        VkExtent2D raw{640, 480};
        Extent2D extent(raw);

        REQUIRE(extent.width == 640);
        REQUIRE(extent.height == 480);

        VkExtent2D back = extent;
        REQUIRE(back.width == 640);
        REQUIRE(back.height == 480);
    }

    SECTION("Equality") {
        REQUIRE(Extent2D(1, 2) == Extent2D(1, 2));
        REQUIRE(Extent2D(1, 2) != Extent2D(2, 1));
    }

    SECTION("Empty extents") {
        REQUIRE(Extent2D().IsEmpty());
        REQUIRE(Extent2D(0, 600).IsEmpty());
        REQUIRE(Extent2D(800, 0).IsEmpty());
        REQUIRE_FALSE(Extent2D(1, 1).IsEmpty());
    }

    SECTION("Extent3D from 2D") {
        Extent3D extent = Extent3D::From2D(Extent2D(16, 8), 1);
        VkExtent3D raw = extent;

        REQUIRE(raw.width == 16);
        REQUIRE(raw.height == 8);
        REQUIRE(raw.depth == 1);
    }
}

TEST_CASE("Format mapping", "[backend][util]") {
    SECTION("Known formats map both ways") {
        const VkFormat formats[] = {VK_FORMAT_R8G8B8A8_SRGB, VK_FORMAT_R8G8B8A8_UNORM, VK_FORMAT_B8G8R8A8_SRGB,
                                    VK_FORMAT_B8G8R8A8_UNORM};
        for (VkFormat vk : formats) {
            REQUIRE(Format::FromVk(vk).ToVk() == vk);
        }
    }

    SECTION("Layout and color space are decoded") {
        Format format = Format::FromVk(VK_FORMAT_B8G8R8A8_SRGB);
        REQUIRE(format.component_layout == ComponentLayout::B8G8R8A8);
        REQUIRE(format.color_space == ColorSpace::Srgb);

        REQUIRE(Format{ComponentLayout::R8G8B8A8, ColorSpace::Linear}.ToVk() == VK_FORMAT_R8G8B8A8_UNORM);
    }

    SECTION("Unknown format throws") {
        REQUIRE_THROWS_AS(Format::FromVk(VK_FORMAT_D32_SFLOAT), RenderError);
    }
}
