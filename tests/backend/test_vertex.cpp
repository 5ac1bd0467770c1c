#include <catch2/catch_test_macros.hpp>
#include <trekanten/backend/vertex.h>

#include <array>
#include <cstddef>

using namespace trekanten;

namespace {

struct TestVertex {
    float pos[3];
    float uv[2];

    static VkVertexInputBindingDescription BindingDescription() {
        return VkVertexInputBindingDescription{0, sizeof(TestVertex), VK_VERTEX_INPUT_RATE_VERTEX};
    }

    static std::array<VkVertexInputAttributeDescription, 2> AttributeDescription() {
        return {VkVertexInputAttributeDescription{0, 0, VK_FORMAT_R32G32B32_SFLOAT, offsetof(TestVertex, pos)},
                VkVertexInputAttributeDescription{1, 0, VK_FORMAT_R32G32_SFLOAT, offsetof(TestVertex, uv)}};
    }
};

struct OtherVertex {
    float pos[2];

    static VkVertexInputBindingDescription BindingDescription() {
        return VkVertexInputBindingDescription{0, sizeof(OtherVertex), VK_VERTEX_INPUT_RATE_VERTEX};
    }

    static std::vector<VkVertexInputAttributeDescription> AttributeDescription() {
        return {VkVertexInputAttributeDescription{0, 0, VK_FORMAT_R32G32_SFLOAT, 0}};
    }
};

} // namespace

TEST_CASE("Vertex description from type", "[backend][vertex]") {
    VertexDescription desc = VertexDescriptionOf<TestVertex>();

    REQUIRE(desc.bindings.size() == 1);
    REQUIRE(desc.bindings[0].stride == sizeof(TestVertex));
    REQUIRE(desc.attributes.size() == 2);
    REQUIRE(desc.attributes[1].location == 1);
    REQUIRE(desc.attributes[1].format == VK_FORMAT_R32G32_SFLOAT);
    REQUIRE(desc.attributes[1].offset == offsetof(TestVertex, uv));
}

TEST_CASE("Vertex description equality", "[backend][vertex]") {
    REQUIRE(VertexDescriptionOf<TestVertex>() == VertexDescriptionOf<TestVertex>());
    REQUIRE(VertexDescriptionOf<TestVertex>() != VertexDescriptionOf<OtherVertex>());
    REQUIRE(VertexDescription{} == VertexDescription{});
}
