#include <catch2/catch_test_macros.hpp>
#include <trekanten/backend/device_selection.h>
#include <trekanten/backend/error.h>

#include <string>
#include <vector>

using namespace trekanten;

namespace {

VkQueueFamilyProperties Family(VkQueueFlags flags, uint32_t count = 1) {
    VkQueueFamilyProperties props{};
    props.queueFlags = flags;
    props.queueCount = count;
    return props;
}

DeviceCandidate Candidate(const std::string& name, VkPhysicalDeviceType type, DeviceSuitability suitability) {
    DeviceCandidate candidate;
    candidate.name = name;
    candidate.type = type;
    candidate.suitability = suitability;
    candidate.score = ScoreDevice(type, suitability);
    return candidate;
}

std::string MessageOf(std::vector<DeviceCandidate> candidates) {
    try {
        SelectBestCandidate(std::move(candidates));
    } catch (const RenderError& e) {
        REQUIRE(e.GetKind() == ErrorKind::DeviceCreation);
        return e.what();
    }
    return {};
}

} // namespace

TEST_CASE("Queue family discovery", "[backend][device_selection]") {
    SECTION("Graphics family that can present is used for both") {
        auto families = FindQueueFamilies({Family(VK_QUEUE_TRANSFER_BIT), Family(VK_QUEUE_GRAPHICS_BIT)},
                                          {false, true});

        REQUIRE(families.graphics.has_value());
        REQUIRE(families.present.has_value());
        REQUIRE(families.graphics->index == 1);
        REQUIRE(families.present->index == 1);
    }

    SECTION("First graphics family wins") {
        auto families = FindQueueFamilies({Family(VK_QUEUE_GRAPHICS_BIT), Family(VK_QUEUE_GRAPHICS_BIT)},
                                          {true, true});

        REQUIRE(families.graphics->index == 0);
    }

    SECTION("Separate present family") {
        auto families = FindQueueFamilies({Family(VK_QUEUE_GRAPHICS_BIT), Family(VK_QUEUE_COMPUTE_BIT)},
                                          {false, true});

        REQUIRE(families.graphics->index == 0);
        REQUIRE(families.present->index == 1);
    }

    SECTION("Empty families are ignored") {
        auto families = FindQueueFamilies({Family(VK_QUEUE_GRAPHICS_BIT, 0)}, {true});

        REQUIRE_FALSE(families.graphics.has_value());
        REQUIRE(families.present.has_value());
    }

    SECTION("No present support") {
        auto families = FindQueueFamilies({Family(VK_QUEUE_GRAPHICS_BIT)}, {false});

        REQUIRE(families.graphics.has_value());
        REQUIRE_FALSE(families.present.has_value());
    }
}

TEST_CASE("Device suitability", "[backend][device_selection]") {
    QueueFamilies complete;
    complete.graphics = QueueFamily{0, Family(VK_QUEUE_GRAPHICS_BIT)};
    complete.present = complete.graphics;

    const std::vector<std::string> swapchain = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

    SECTION("Suitable device") {
        REQUIRE(CheckSuitability(complete, swapchain, RequiredDeviceExtensions()) == DeviceSuitability::Suitable);
    }

    SECTION("Extensions are checked first") {
        REQUIRE(CheckSuitability(QueueFamilies{}, {}, swapchain) == DeviceSuitability::MissingRequiredExtensions);
    }

    SECTION("Missing graphics queue") {
        REQUIRE(CheckSuitability(QueueFamilies{}, swapchain, swapchain) == DeviceSuitability::MissingGraphicsQueue);
    }

    SECTION("Missing present queue") {
        QueueFamilies graphicsOnly;
        graphicsOnly.graphics = complete.graphics;
        REQUIRE(CheckSuitability(graphicsOnly, swapchain, swapchain) == DeviceSuitability::MissingPresentQueue);
    }
}

TEST_CASE("Device scoring", "[backend][device_selection]") {
    REQUIRE(ScoreDevice(VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU, DeviceSuitability::Suitable) == 1100);
    REQUIRE(ScoreDevice(VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU, DeviceSuitability::Suitable) == 1000);
    REQUIRE(ScoreDevice(VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU, DeviceSuitability::MissingPresentQueue) == 100);
    REQUIRE(ScoreDevice(VK_PHYSICAL_DEVICE_TYPE_CPU, DeviceSuitability::MissingGraphicsQueue) == 0);
}

TEST_CASE("Best candidate selection", "[backend][device_selection]") {
    SECTION("Discrete beats integrated") {
        auto best = SelectBestCandidate(
            {Candidate("igpu", VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU, DeviceSuitability::Suitable),
             Candidate("dgpu", VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU, DeviceSuitability::Suitable)});

        REQUIRE(best.name == "dgpu");
    }

    SECTION("Suitable integrated beats unsuitable discrete") {
        auto best = SelectBestCandidate(
            {Candidate("dgpu", VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU, DeviceSuitability::MissingPresentQueue),
             Candidate("igpu", VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU, DeviceSuitability::Suitable)});

        REQUIRE(best.name == "igpu");
    }

    SECTION("Ties keep enumeration order") {
        auto best = SelectBestCandidate(
            {Candidate("first", VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU, DeviceSuitability::Suitable),
             Candidate("second", VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU, DeviceSuitability::Suitable)});

        REQUIRE(best.name == "first");
    }

    SECTION("No devices") {
        REQUIRE_THROWS_AS(SelectBestCandidate({}), RenderError);
        REQUIRE(MessageOf({}) == "DeviceCreation: MissingPhysicalDevice");
    }

    SECTION("Only unsuitable devices report the first device's reason") {
        std::string msg = MessageOf(
            {Candidate("a", VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU, DeviceSuitability::MissingPresentQueue),
             Candidate("b", VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU, DeviceSuitability::MissingGraphicsQueue)});

        REQUIRE(msg == "DeviceCreation: UnsuitableDevice(MissingPresentQueue)");
    }
}

TEST_CASE("Queue create infos", "[backend][device_selection]") {
    const float priority = 1.0f;

    SECTION("Shared family yields one info") {
        QueueFamilies families;
        families.graphics = QueueFamily{2, Family(VK_QUEUE_GRAPHICS_BIT)};
        families.present = families.graphics;

        auto infos = QueueCreateInfos(families, &priority);
        REQUIRE(infos.size() == 1);
        REQUIRE(infos[0].queueFamilyIndex == 2);
        REQUIRE(infos[0].queueCount == 1);
        REQUIRE(infos[0].pQueuePriorities == &priority);
    }

    SECTION("Distinct families yield two infos") {
        QueueFamilies families;
        families.graphics = QueueFamily{0, Family(VK_QUEUE_GRAPHICS_BIT)};
        families.present = QueueFamily{1, Family(VK_QUEUE_COMPUTE_BIT)};

        auto infos = QueueCreateInfos(families, &priority);
        REQUIRE(infos.size() == 2);
        REQUIRE(infos[1].queueFamilyIndex == 1);
    }
}

TEST_CASE("Supported format search", "[backend][device_selection]") {
    auto onlyD24 = [](VkFormat format) {
        VkFormatProperties props{};
        if (format == VK_FORMAT_D24_UNORM_S8_UINT) {
            props.optimalTilingFeatures = VK_FORMAT_FEATURE_DEPTH_STENCIL_ATTACHMENT_BIT;
        }
        return props;
    };

    SECTION("Depth format falls through to the first supported candidate") {
        REQUIRE(FindDepthFormat(onlyD24) == VK_FORMAT_D24_UNORM_S8_UINT);
    }

    SECTION("Linear tiling uses linear features") {
        REQUIRE_THROWS_AS(FindSupportedFormat({VK_FORMAT_D24_UNORM_S8_UINT}, VK_IMAGE_TILING_LINEAR,
                                              VK_FORMAT_FEATURE_DEPTH_STENCIL_ATTACHMENT_BIT, onlyD24),
                          RenderError);
    }

    SECTION("Nothing supported throws") {
        auto none = [](VkFormat) { return VkFormatProperties{}; };
        REQUIRE_THROWS_AS(FindDepthFormat(none), RenderError);
    }
}
