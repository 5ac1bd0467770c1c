#include <catch2/catch_test_macros.hpp>
#include <trekanten/backend/command.h>
#include <trekanten/backend/error.h>

#include <utility>

using namespace trekanten;

namespace {

CommandBuffer TransferOnly() {
    return CommandBuffer(VK_NULL_HANDLE, VK_NULL_HANDLE, VK_NULL_HANDLE, VK_QUEUE_TRANSFER_BIT);
}

ErrorKind KindOf(CommandBuffer& cmd) {
    try {
        cmd.DrawIndexed(3);
    } catch (const RenderError& e) {
        return e.GetKind();
    }
    return ErrorKind::Frame;
}

} // namespace

TEST_CASE("Command buffer state", "[backend][command]") {
    CommandBuffer cmd = TransferOnly();

    SECTION("Fresh buffer is not started") {
        REQUIRE_FALSE(cmd.IsStarted());
        REQUIRE(cmd.GetQueueFlags() == VK_QUEUE_TRANSFER_BIT);
    }

    SECTION("End without Begin throws") {
        REQUIRE_THROWS_AS(cmd.End(), RenderError);
    }

    SECTION("Move leaves the source empty") {
        CommandBuffer moved = std::move(cmd);

        REQUIRE(moved.GetQueueFlags() == VK_QUEUE_TRANSFER_BIT);
        REQUIRE(cmd.GetRaw() == VK_NULL_HANDLE);
    }
}

TEST_CASE("Graphics commands need a graphics queue", "[backend][command]") {
    CommandBuffer cmd = TransferOnly();

    REQUIRE_THROWS_AS(cmd.EndRenderPass(), RenderError);
    REQUIRE_THROWS_AS(cmd.DrawIndexed(6), RenderError);
    REQUIRE(KindOf(cmd) == ErrorKind::CommandBuffer);
}
