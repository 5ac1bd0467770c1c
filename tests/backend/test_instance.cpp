#include <catch2/catch_test_macros.hpp>
#include <trekanten/backend/error.h>
#include <trekanten/backend/instance.h>

#include <algorithm>
#include <cstdlib>
#include <string>
#include <vector>

using namespace trekanten;

namespace {

bool Has(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

TEST_CASE("Instance extension choice", "[backend][instance]") {
    const std::vector<std::string> available = {"VK_KHR_surface", "VK_KHR_xcb_surface", "VK_KHR_xlib_surface",
                                                VK_EXT_DEBUG_UTILS_EXTENSION_NAME};

    SECTION("Required extensions are kept") {
        auto chosen = ChooseInstanceExtensions({"VK_KHR_surface"}, available, false);

        REQUIRE(chosen == std::vector<std::string>{"VK_KHR_surface"});
    }

    SECTION("Missing required extension throws") {
        REQUIRE_THROWS_AS(ChooseInstanceExtensions({"VK_KHR_wayland_surface"}, available, false), RenderError);

        try {
            ChooseInstanceExtensions({"VK_KHR_wayland_surface"}, available, false);
        } catch (const RenderError& e) {
            REQUIRE(e.GetKind() == ErrorKind::Instance);
            REQUIRE(std::string(e.what()) == "Instance: Missing extension VK_KHR_wayland_surface");
        }
    }

    SECTION("xcb implies xlib") {
        auto chosen = ChooseInstanceExtensions({"VK_KHR_surface", "VK_KHR_xcb_surface"}, available, false);

        REQUIRE(Has(chosen, "VK_KHR_xlib_surface"));
        REQUIRE(chosen.size() == 3);
    }

    SECTION("xlib is not duplicated") {
        auto chosen = ChooseInstanceExtensions({"VK_KHR_xcb_surface", "VK_KHR_xlib_surface"}, available, false);

        REQUIRE(std::count(chosen.begin(), chosen.end(), "VK_KHR_xlib_surface") == 1);
    }

    SECTION("Debug utils only with validation") {
        REQUIRE_FALSE(Has(ChooseInstanceExtensions({"VK_KHR_surface"}, available, false),
                          VK_EXT_DEBUG_UTILS_EXTENSION_NAME));
        REQUIRE(Has(ChooseInstanceExtensions({"VK_KHR_surface"}, available, true), VK_EXT_DEBUG_UTILS_EXTENSION_NAME));
    }

    SECTION("Debug utils skipped when unavailable") {
        auto chosen = ChooseInstanceExtensions({"VK_KHR_surface"}, {"VK_KHR_surface"}, true);

        REQUIRE_FALSE(Has(chosen, VK_EXT_DEBUG_UTILS_EXTENSION_NAME));
    }
}

TEST_CASE("Validation layer choice", "[backend][instance]") {
    const std::vector<std::string> withLayer = {"VK_LAYER_MESA_device_select", kValidationLayerName};

    REQUIRE(ChooseValidationLayers(withLayer, true) == std::vector<std::string>{kValidationLayerName});
    REQUIRE(ChooseValidationLayers(withLayer, false).empty());
    REQUIRE(ChooseValidationLayers({"VK_LAYER_MESA_device_select"}, true).empty());
}

TEST_CASE("Validation can be disabled from the environment", "[backend][instance]") {
    unsetenv(kDisableValidationLayersEnvVar);
    REQUIRE_FALSE(ValidationDisabledByEnvironment());

    setenv(kDisableValidationLayersEnvVar, "1", 1);
    REQUIRE(ValidationDisabledByEnvironment());

    unsetenv(kDisableValidationLayersEnvVar);
}

TEST_CASE("C string conversion", "[backend][instance]") {
    const std::vector<std::string> names = {"a", "bc"};
    auto ptrs = ToCStrings(names);

    REQUIRE(ptrs.size() == 2);
    REQUIRE(std::string(ptrs[0]) == "a");
    REQUIRE(ptrs[1] == names[1].c_str());
}
