#include <catch2/catch_test_macros.hpp>
#include <trekanten/backend/error.h>
#include <trekanten/renderer/frame_scheduler.h>

using namespace trekanten;

TEST_CASE("Frame index cycles through frames in flight", "[renderer][frame_scheduler]") {
    FrameScheduler scheduler(3);

    REQUIRE(scheduler.FrameIdx() == 0);
    scheduler.Advance();
    REQUIRE(scheduler.FrameIdx() == 1);
    scheduler.Advance();
    REQUIRE(scheduler.FrameIdx() == 0);
}

TEST_CASE("Image bindings", "[renderer][frame_scheduler]") {
    FrameScheduler scheduler(3);

    SECTION("Unbound images report nothing") {
        REQUIRE_FALSE(scheduler.BoundFrame(0).has_value());
        REQUIRE_FALSE(scheduler.BoundFrame(10).has_value());
    }

    SECTION("Binding returns the previous frame") {
        REQUIRE_FALSE(scheduler.BindImage(1).has_value());
        REQUIRE(scheduler.BoundFrame(1) == 0u);

        scheduler.Advance();
        auto previous = scheduler.BindImage(1);
        REQUIRE(previous == 0u);
        REQUIRE(scheduler.BoundFrame(1) == 1u);
    }

    SECTION("Images beyond the initial count grow the table") {
        REQUIRE_FALSE(scheduler.BindImage(5).has_value());
        REQUIRE(scheduler.BoundFrame(5) == 0u);
    }

    SECTION("Reset forgets bindings") {
        scheduler.BindImage(0);
        scheduler.Reset(2);

        REQUIRE_FALSE(scheduler.BoundFrame(0).has_value());
    }
}

TEST_CASE("Submitted frame must be the current one", "[renderer][frame_scheduler]") {
    FrameScheduler scheduler(3);

    SECTION("Current frame passes") {
        REQUIRE_NOTHROW(scheduler.CheckCurrent(0));
        scheduler.Advance();
        REQUIRE_NOTHROW(scheduler.CheckCurrent(1));
    }

    SECTION("Stale frame throws") {
        scheduler.Advance();

        try {
            scheduler.CheckCurrent(0);
            FAIL("stale frame was accepted");
        } catch (const RenderError& e) {
            REQUIRE(e.GetKind() == ErrorKind::Frame);
        }
    }

    SECTION("Out of range frame throws") {
        REQUIRE_THROWS_AS(scheduler.CheckCurrent(kMaxFramesInFlight), RenderError);
    }
}
