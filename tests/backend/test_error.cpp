#include <catch2/catch_test_macros.hpp>
#include <trekanten/backend/error.h>

#include <string>

using namespace trekanten;

TEST_CASE("RenderError messages", "[backend][error]") {
    SECTION("Plain error is prefixed with its kind") {
        RenderError err(ErrorKind::Swapchain, "no formats");

        REQUIRE(std::string(err.what()) == "Swapchain: no formats");
        REQUIRE(err.GetKind() == ErrorKind::Swapchain);
        REQUIRE(err.GetRootKind() == ErrorKind::Swapchain);
        REQUIRE(err.GetVulkanResult() == VK_SUCCESS);
    }

    SECTION("Vulkan error carries the result") {
        RenderError err = RenderError::Vulkan(ErrorKind::Fence, "vkWaitForFences", VK_ERROR_DEVICE_LOST);

        REQUIRE(std::string(err.what()) == "Fence: vkWaitForFences failed (VK_ERROR_DEVICE_LOST)");
        REQUIRE(err.GetVulkanResult() == VK_ERROR_DEVICE_LOST);
    }

    SECTION("NeedsResize is recognised") {
        RenderError err = RenderError::NeedsResize();

        REQUIRE(err.IsNeedsResize());
        REQUIRE(std::string(err.what()) == "NeedsResize: swapchain is out of date");
    }
}

TEST_CASE("RenderError nesting", "[backend][error]") {
    RenderError inner = RenderError::Vulkan(ErrorKind::Memory, "vmaCreateBuffer", VK_ERROR_OUT_OF_DEVICE_MEMORY);
    RenderError middle = RenderError::Wrap(ErrorKind::VertexBuffer, inner);
    RenderError outer = RenderError::Wrap(ErrorKind::Device, middle);

    SECTION("Context lists kinds from outermost to innermost") {
        REQUIRE(outer.GetContext().size() == 3);
        REQUIRE(outer.GetContext()[0] == ErrorKind::Device);
        REQUIRE(outer.GetContext()[1] == ErrorKind::VertexBuffer);
        REQUIRE(outer.GetContext()[2] == ErrorKind::Memory);
        REQUIRE(outer.GetKind() == ErrorKind::Device);
        REQUIRE(outer.GetRootKind() == ErrorKind::Memory);
    }

    SECTION("Message chains every level") {
        REQUIRE(std::string(outer.what()) ==
                "Device: VertexBuffer: Memory: vmaCreateBuffer failed (VK_ERROR_OUT_OF_DEVICE_MEMORY)");
    }

    SECTION("Vulkan result survives wrapping") {
        REQUIRE(outer.GetVulkanResult() == VK_ERROR_OUT_OF_DEVICE_MEMORY);
    }

    SECTION("Swapchain creation failure seen from the device") {
        RenderError err = RenderError::Wrap(
            ErrorKind::Device,
            RenderError::Vulkan(ErrorKind::Swapchain, "vkCreateSwapchainKHR", VK_ERROR_SURFACE_LOST_KHR));

        REQUIRE(std::string(err.what()) == "Device: Swapchain: vkCreateSwapchainKHR failed (VK_ERROR_SURFACE_LOST_KHR)");
        REQUIRE(err.GetRootKind() == ErrorKind::Swapchain);
    }

    SECTION("Wrapped resize is still a resize") {
        RenderError wrapped = RenderError::Wrap(ErrorKind::Frame, RenderError::NeedsResize());
        REQUIRE(wrapped.IsNeedsResize());
        REQUIRE(wrapped.GetKind() == ErrorKind::Frame);
    }
}

TEST_CASE("CheckVk", "[backend][error]") {
    REQUIRE_NOTHROW(CheckVk(VK_SUCCESS, ErrorKind::Queue, "vkQueueSubmit"));
    REQUIRE_THROWS_AS(CheckVk(VK_ERROR_DEVICE_LOST, ErrorKind::Queue, "vkQueueSubmit"), RenderError);

    try {
        CheckVk(VK_TIMEOUT, ErrorKind::Fence, "vkWaitForFences");
        FAIL("CheckVk did not throw");
    } catch (const RenderError& e) {
        REQUIRE(e.GetKind() == ErrorKind::Fence);
        REQUIRE(e.GetVulkanResult() == VK_TIMEOUT);
    }
}

TEST_CASE("Kind names", "[backend][error]") {
    REQUIRE(std::string(ToString(ErrorKind::DescriptorSet)) == "DescriptorSet");
    REQUIRE(std::string(ToString(VK_SUBOPTIMAL_KHR)) == "VK_SUBOPTIMAL_KHR");
}
