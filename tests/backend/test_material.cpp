#include <catch2/catch_test_macros.hpp>
#include <trekanten/backend/error.h>
#include <trekanten/backend/material.h>

#include <array>

using namespace trekanten;

namespace {

struct PosVertex {
    float pos[2];

    static VkVertexInputBindingDescription BindingDescription() {
        return VkVertexInputBindingDescription{0, sizeof(PosVertex), VK_VERTEX_INPUT_RATE_VERTEX};
    }

    static std::array<VkVertexInputAttributeDescription, 1> AttributeDescription() {
        return {VkVertexInputAttributeDescription{0, 0, VK_FORMAT_R32G32_SFLOAT, 0}};
    }
};

ErrorKind KindOf(const MaterialDescriptor::Builder& builder) {
    try {
        builder.Build();
    } catch (const RenderError& e) {
        return e.GetKind();
    }
    return ErrorKind::Frame;
}

} // namespace

TEST_CASE("Material descriptor builder", "[backend][material]") {
    SECTION("Complete builder") {
        MaterialDescriptor desc = MaterialDescriptor::Builder()
                                      .VertexShader("shaders/quad.vert.spv")
                                      .FragmentShader("shaders/quad.frag.spv")
                                      .VertexType<PosVertex>()
                                      .Build();

        const auto& gfx = desc.gfx_pipeline_descriptor;
        REQUIRE(gfx.vertex_shader == std::filesystem::path("shaders/quad.vert.spv"));
        REQUIRE(gfx.fragment_shader == std::filesystem::path("shaders/quad.frag.spv"));
        REQUIRE(gfx.vertex_description == VertexDescriptionOf<PosVertex>());
    }

    SECTION("Missing vertex shader") {
        auto builder = MaterialDescriptor::Builder().FragmentShader("a.frag.spv");

        REQUIRE_THROWS_AS(builder.Build(), RenderError);
        REQUIRE(KindOf(builder) == ErrorKind::Material);
    }

    SECTION("Missing fragment shader") {
        auto builder = MaterialDescriptor::Builder().VertexShader("a.vert.spv");

        REQUIRE_THROWS_AS(builder.Build(), RenderError);
        REQUIRE(KindOf(builder) == ErrorKind::Material);
    }

    SECTION("Equal builders give equal descriptors") {
        auto build = [] {
            return MaterialDescriptor::Builder().VertexShader("v.spv").FragmentShader("f.spv").Build();
        };

        REQUIRE(build().gfx_pipeline_descriptor == build().gfx_pipeline_descriptor);
    }
}
