#include <toybox/frame_loop.hpp>
#include <toybox/graphics_context.hpp>

#include <catch2/catch_test_macros.hpp>

#include <deque>
#include <vector>

using namespace gtb;

namespace
{
// Records the calls the frame loop makes. Resizing follows the context's rule of ignoring sizes
// with a zero dimension.
struct FakeTarget
{
    std::vector<Extent2u>    resizeCalls;
    int                      inputCalls = 0;
    int                      updateCalls = 0;
    int                      renderCalls = 0;
    bool                     consumeInput = false;
    std::deque<RenderStatus> renderResults;
    std::vector<WGPUColor>   presentedFrames;
    Extent2u                 currentSize;

    bool input(const WindowEvent&)
    {
        ++inputCalls;
        return consumeInput;
    }

    void resize(const Extent2u newSize)
    {
        resizeCalls.push_back(newSize);
        if (!hasZeroArea(newSize))
        {
            currentSize = newSize;
        }
    }

    void update() { ++updateCalls; }

    RenderStatus render()
    {
        ++renderCalls;
        RenderStatus status = RenderStatus::Success;
        if (!renderResults.empty())
        {
            status = renderResults.front();
            renderResults.pop_front();
        }
        if (status == RenderStatus::Success)
        {
            presentedFrames.push_back(CLEAR_COLOR);
        }
        return status;
    }

    Extent2u size() const { return currentSize; }
};

KeyboardInputEvent keyPress(const Key key, const Modifiers modifiers = {})
{
    return KeyboardInputEvent{KeyEvent{
        .key = key,
        .state = KeyState::Pressed,
        .repeat = false,
        .modifiers = modifiers,
    }};
}
} // namespace

static_assert(FrameTarget<FakeTarget>);
static_assert(FrameTarget<GraphicsContext>);

SCENARIO("Rendering a frame after the first resize", "[frame_loop]")
{
    GIVEN("a frame loop that has not seen a resize")
    {
        FakeTarget           target;
        int                  redrawRequests = 0;
        FrameLoop<FakeTarget> loop{target, [&redrawRequests]() { ++redrawRequests; }};

        REQUIRE_FALSE(loop.configured());
        REQUIRE_FALSE(loop.exitRequested());

        WHEN("a resize event arrives")
        {
            loop.handleEvent(ResizedEvent{Extent2u{800, 600}});

            THEN("the loop is configured and the size is forwarded")
            {
                REQUIRE(loop.configured());
                REQUIRE(target.resizeCalls == std::vector<Extent2u>{Extent2u{800, 600}});
                REQUIRE(target.size() == Extent2u{800, 600});
            }

            AND_WHEN("a redraw is requested")
            {
                loop.handleEvent(RedrawRequestedEvent{});

                THEN("exactly one frame is rendered, cleared to the clear color")
                {
                    REQUIRE(redrawRequests == 1);
                    REQUIRE(target.updateCalls == 1);
                    REQUIRE(target.renderCalls == 1);
                    REQUIRE(target.presentedFrames.size() == 1);
                    REQUIRE(target.presentedFrames[0].r == 0.1);
                    REQUIRE(target.presentedFrames[0].g == 0.2);
                    REQUIRE(target.presentedFrames[0].b == 0.3);
                    REQUIRE(target.presentedFrames[0].a == 1.0);
                }

                AND_WHEN("the window is closed")
                {
                    loop.handleEvent(CloseRequestedEvent{});

                    THEN("the loop exits and ignores further events")
                    {
                        REQUIRE(loop.exitRequested());
                        REQUIRE(loop.exitReason() == LoopExit::Requested);

                        loop.handleEvent(RedrawRequestedEvent{});
                        loop.handleEvent(ResizedEvent{Extent2u{1024, 768}});

                        REQUIRE(target.renderCalls == 1);
                        REQUIRE(target.resizeCalls.size() == 1);
                        REQUIRE(redrawRequests == 1);
                    }
                }
            }
        }

        WHEN("a redraw is requested before any resize")
        {
            loop.handleEvent(RedrawRequestedEvent{});

            THEN("the next redraw is requested but nothing is rendered")
            {
                REQUIRE(redrawRequests == 1);
                REQUIRE(target.updateCalls == 0);
                REQUIRE(target.renderCalls == 0);
                REQUIRE_FALSE(loop.configured());
            }
        }

        WHEN("the first resize has a zero dimension")
        {
            loop.handleEvent(ResizedEvent{Extent2u{0, 0}});

            THEN("the loop still counts as configured")
            {
                REQUIRE(loop.configured());
                REQUIRE(target.resizeCalls.size() == 1);
            }
        }
    }
}

TEST_CASE("Escape exits the loop like a close request", "[frame_loop]")
{
    FakeTarget            target;
    FrameLoop<FakeTarget> loop{target, []() {}};

    SECTION("plain escape")
    {
        loop.handleEvent(keyPress(Key::Escape));
        REQUIRE(loop.exitRequested());
        REQUIRE(loop.exitReason() == LoopExit::Requested);
    }

    SECTION("escape with modifiers held")
    {
        loop.handleEvent(keyPress(Key::Escape, Modifiers{.shift = true}));
        REQUIRE(loop.exitReason() == LoopExit::Requested);
    }

    SECTION("repeated escape presses")
    {
        KeyboardInputEvent repeat = keyPress(Key::Escape);
        repeat.event.repeat = true;

        loop.handleEvent(keyPress(Key::Escape));
        loop.handleEvent(repeat);
        loop.handleEvent(repeat);

        REQUIRE(loop.exitReason() == LoopExit::Requested);
        REQUIRE(target.inputCalls == 1);
    }
}

TEST_CASE("Other input does not exit the loop", "[frame_loop]")
{
    FakeTarget            target;
    FrameLoop<FakeTarget> loop{target, []() {}};

    KeyboardInputEvent escapeRelease = keyPress(Key::Escape);
    escapeRelease.event.state = KeyState::Released;

    loop.handleEvent(escapeRelease);
    loop.handleEvent(keyPress(Key::Unknown));
    loop.handleEvent(FocusedEvent{true});

    REQUIRE_FALSE(loop.exitRequested());
    REQUIRE(target.inputCalls == 3);
    REQUIRE(target.resizeCalls.empty());
    REQUIRE(target.renderCalls == 0);
}

TEST_CASE("Events consumed by the input hook skip default handling", "[frame_loop]")
{
    FakeTarget target;
    target.consumeInput = true;
    int                   redrawRequests = 0;
    FrameLoop<FakeTarget> loop{target, [&redrawRequests]() { ++redrawRequests; }};

    loop.handleEvent(ResizedEvent{Extent2u{800, 600}});
    loop.handleEvent(RedrawRequestedEvent{});
    loop.handleEvent(CloseRequestedEvent{});

    REQUIRE(target.inputCalls == 3);
    REQUIRE_FALSE(loop.configured());
    REQUIRE(target.resizeCalls.empty());
    REQUIRE(redrawRequests == 0);
    REQUIRE_FALSE(loop.exitRequested());
}

SCENARIO("Handling render failures", "[frame_loop]")
{
    GIVEN("a configured frame loop")
    {
        FakeTarget            target;
        int                   redrawRequests = 0;
        FrameLoop<FakeTarget> loop{target, [&redrawRequests]() { ++redrawRequests; }};

        loop.handleEvent(ResizedEvent{Extent2u{640, 480}});
        loop.handleEvent(ResizedEvent{Extent2u{0, 480}});
        REQUIRE(target.size() == Extent2u{640, 480});

        WHEN("the surface is lost")
        {
            target.renderResults.push_back(RenderStatus::Lost);
            loop.handleEvent(RedrawRequestedEvent{});

            THEN("the surface is reconfigured with the last valid size")
            {
                REQUIRE(target.resizeCalls.size() == 3);
                REQUIRE(target.resizeCalls.back() == Extent2u{640, 480});
                REQUIRE(target.presentedFrames.empty());
                REQUIRE_FALSE(loop.exitRequested());
            }
        }

        WHEN("the surface is outdated")
        {
            target.renderResults.push_back(RenderStatus::Outdated);
            loop.handleEvent(RedrawRequestedEvent{});

            THEN("the surface is reconfigured with the last valid size")
            {
                REQUIRE(target.resizeCalls.size() == 3);
                REQUIRE(target.resizeCalls.back() == Extent2u{640, 480});
                REQUIRE_FALSE(loop.exitRequested());
            }

            AND_WHEN("the next redraw succeeds")
            {
                loop.handleEvent(RedrawRequestedEvent{});

                THEN("a frame is presented") { REQUIRE(target.presentedFrames.size() == 1); }
            }
        }

        WHEN("acquiring the frame times out")
        {
            target.renderResults.push_back(RenderStatus::Timeout);
            loop.handleEvent(RedrawRequestedEvent{});
            loop.handleEvent(RedrawRequestedEvent{});

            THEN("the frame is skipped and the loop keeps running")
            {
                REQUIRE(target.renderCalls == 2);
                REQUIRE(target.presentedFrames.size() == 1);
                REQUIRE(target.resizeCalls.size() == 2);
                REQUIRE_FALSE(loop.exitRequested());
            }
        }

        WHEN("the GPU runs out of memory")
        {
            target.renderResults.push_back(RenderStatus::OutOfMemory);
            loop.handleEvent(RedrawRequestedEvent{});

            THEN("exit is requested and no further frames are rendered")
            {
                REQUIRE(loop.exitReason() == LoopExit::OutOfMemory);
                REQUIRE(isFatal(*loop.exitReason()));

                loop.handleEvent(RedrawRequestedEvent{});
                loop.handleEvent(CloseRequestedEvent{});

                REQUIRE(target.renderCalls == 1);
                REQUIRE(redrawRequests == 1);
                REQUIRE(loop.exitReason() == LoopExit::OutOfMemory);
            }
        }

        WHEN("the device is lost")
        {
            target.renderResults.push_back(RenderStatus::DeviceLost);
            loop.handleEvent(RedrawRequestedEvent{});

            THEN("exit is requested")
            {
                REQUIRE(loop.exitReason() == LoopExit::DeviceLost);
                REQUIRE(isFatal(*loop.exitReason()));
            }
        }
    }
}
