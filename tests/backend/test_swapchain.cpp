#include <catch2/catch_test_macros.hpp>
#include <trekanten/backend/error.h>
#include <trekanten/backend/swapchain.h>

#include <cstdint>
#include <vector>

using namespace trekanten;

namespace {

VkSurfaceCapabilitiesKHR Capabilities(uint32_t minCount, uint32_t maxCount) {
    VkSurfaceCapabilitiesKHR caps{};
    caps.minImageCount = minCount;
    caps.maxImageCount = maxCount;
    caps.currentExtent = VkExtent2D{UINT32_MAX, UINT32_MAX};
    caps.minImageExtent = VkExtent2D{100, 100};
    caps.maxImageExtent = VkExtent2D{1000, 1000};
    return caps;
}

} // namespace

TEST_CASE("Surface format choice", "[backend][swapchain]") {
    SECTION("Prefers BGRA sRGB") {
        auto chosen = ChooseSurfaceFormat({{VK_FORMAT_R8G8B8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
                                           {VK_FORMAT_B8G8R8A8_SRGB, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR}});

        REQUIRE(chosen.format == VK_FORMAT_B8G8R8A8_SRGB);
    }

    SECTION("Falls back to the first format") {
        auto chosen = ChooseSurfaceFormat({{VK_FORMAT_R8G8B8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR},
                                           {VK_FORMAT_B8G8R8A8_UNORM, VK_COLOR_SPACE_SRGB_NONLINEAR_KHR}});

        REQUIRE(chosen.format == VK_FORMAT_R8G8B8A8_UNORM);
    }

    SECTION("No formats throws") {
        REQUIRE_THROWS_AS(ChooseSurfaceFormat({}), RenderError);
    }
}

TEST_CASE("Present mode choice", "[backend][swapchain]") {
    const std::vector<VkPresentModeKHR> all = {VK_PRESENT_MODE_IMMEDIATE_KHR, VK_PRESENT_MODE_MAILBOX_KHR,
                                               VK_PRESENT_MODE_FIFO_KHR, VK_PRESENT_MODE_FIFO_RELAXED_KHR};

    SECTION("Without vsync") {
        REQUIRE(ChoosePresentMode(all, false) == VK_PRESENT_MODE_MAILBOX_KHR);
        REQUIRE(ChoosePresentMode({VK_PRESENT_MODE_IMMEDIATE_KHR, VK_PRESENT_MODE_FIFO_KHR}, false) ==
                VK_PRESENT_MODE_IMMEDIATE_KHR);
    }

    SECTION("With vsync") {
        REQUIRE(ChoosePresentMode(all, true) == VK_PRESENT_MODE_FIFO_RELAXED_KHR);
        REQUIRE(ChoosePresentMode({VK_PRESENT_MODE_MAILBOX_KHR, VK_PRESENT_MODE_FIFO_KHR}, true) ==
                VK_PRESENT_MODE_FIFO_KHR);
    }

    SECTION("FIFO is the fallback") {
        REQUIRE(ChoosePresentMode({}, false) == VK_PRESENT_MODE_FIFO_KHR);
    }
}

TEST_CASE("Swapchain extent choice", "[backend][swapchain]") {
    SECTION("Surface extent wins when defined") {
        auto caps = Capabilities(2, 8);
        caps.currentExtent = VkExtent2D{640, 480};

        REQUIRE(ChooseExtent(caps, Extent2D(800, 600)) == Extent2D(640, 480));
    }

    SECTION("Requested extent is clamped") {
        auto caps = Capabilities(2, 8);

        REQUIRE(ChooseExtent(caps, Extent2D(800, 600)) == Extent2D(800, 600));
        REQUIRE(ChooseExtent(caps, Extent2D(10, 5000)) == Extent2D(100, 1000));
    }
}

TEST_CASE("Minimized surface yields an empty extent", "[backend][swapchain]") {
    auto caps = Capabilities(2, 8);
    caps.currentExtent = VkExtent2D{0, 0};

    REQUIRE(ChooseExtent(caps, Extent2D(800, 600)).IsEmpty());
}

TEST_CASE("Swapchain result classification", "[backend][swapchain]") {
    SECTION("Success and suboptimal are not errors") {
        REQUIRE(CheckSwapchainResult(VK_SUCCESS, "vkAcquireNextImageKHR") == SwapchainStatus::Optimal);
        REQUIRE(CheckSwapchainResult(VK_SUBOPTIMAL_KHR, "vkAcquireNextImageKHR") == SwapchainStatus::Suboptimal);
    }

    SECTION("Out of date is reported, not thrown") {
        REQUIRE(CheckSwapchainResult(VK_ERROR_OUT_OF_DATE_KHR, "vkQueuePresentKHR") == SwapchainStatus::OutOfDate);
    }

    SECTION("Other failures throw a swapchain error") {
        REQUIRE_THROWS_AS(CheckSwapchainResult(VK_ERROR_SURFACE_LOST_KHR, "vkQueuePresentKHR"), RenderError);

        try {
            CheckSwapchainResult(VK_ERROR_DEVICE_LOST, "vkAcquireNextImageKHR");
            FAIL("device loss was not reported");
        } catch (const RenderError& e) {
            REQUIRE(e.GetKind() == ErrorKind::Swapchain);
            REQUIRE_FALSE(e.IsNeedsResize());
            REQUIRE(e.GetVulkanResult() == VK_ERROR_DEVICE_LOST);
        }
    }
}

TEST_CASE("Swapchain image count", "[backend][swapchain]") {
    REQUIRE(ChooseImageCount(Capabilities(2, 8)) == 3);
    REQUIRE(ChooseImageCount(Capabilities(4, 8)) == 4);
    REQUIRE(ChooseImageCount(Capabilities(1, 2)) == 2);
    REQUIRE(ChooseImageCount(Capabilities(2, 0)) == 3);
}
