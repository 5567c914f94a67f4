#pragma once

#include "render_status.hpp"
#include "window_event.hpp"

#include <common/extent.hpp>
#include <common/logger.hpp>

#include <concepts>
#include <functional>
#include <optional>
#include <utility>
#include <variant>

namespace gtb
{
// What the frame loop drives: a surface that can be resized and rendered into, with hooks for
// input and per-frame updates.
template<typename T>
concept FrameTarget = requires(T& target, const WindowEvent& event, const Extent2u size) {
    { target.input(event) } -> std::same_as<bool>;
    target.resize(size);
    target.update();
    { target.render() } -> std::same_as<RenderStatus>;
    { target.size() } -> std::convertible_to<Extent2u>;
};

enum class LoopExit
{
    // Close request or the exit key.
    Requested,
    OutOfMemory,
    DeviceLost,
};

constexpr bool isFatal(const LoopExit exit) noexcept { return exit != LoopExit::Requested; }

constexpr bool isExitKey(const KeyEvent& keyEvent) noexcept
{
    return keyEvent.key == Key::Escape && keyEvent.state == KeyState::Pressed;
}

using RequestRedrawCallback = std::function<void()>;

// Turns window events into resize and render calls on the target.
//
// Rendering is gated on the first resize event: until the window has reported a size, redraw
// requests only schedule the next redraw. Once exit has been requested, all further events are
// dropped.
template<FrameTarget T>
class FrameLoop
{
public:
    FrameLoop(T& target, RequestRedrawCallback&& requestRedraw)
        : mTarget(target),
          mRequestRedraw(std::move(requestRedraw)),
          mConfigured(false),
          mExit()
    {
    }

    FrameLoop(const FrameLoop&) = delete;
    FrameLoop& operator=(const FrameLoop&) = delete;

    void handleEvent(const WindowEvent& event)
    {
        if (mExit)
        {
            return;
        }

        if (mTarget.input(event))
        {
            return;
        }

        if (const auto* const resized = std::get_if<ResizedEvent>(&event))
        {
            mConfigured = true;
            mTarget.resize(resized->size);
        }
        else if (std::holds_alternative<RedrawRequestedEvent>(event))
        {
            redraw();
        }
        else if (std::holds_alternative<CloseRequestedEvent>(event))
        {
            requestExit(LoopExit::Requested);
        }
        else if (const auto* const keyboard = std::get_if<KeyboardInputEvent>(&event))
        {
            if (isExitKey(keyboard->event))
            {
                requestExit(LoopExit::Requested);
            }
        }
    }

    bool                    configured() const noexcept { return mConfigured; }
    bool                    exitRequested() const noexcept { return mExit.has_value(); }
    std::optional<LoopExit> exitReason() const noexcept { return mExit; }

private:
    void redraw()
    {
        if (mRequestRedraw)
        {
            mRequestRedraw();
        }

        if (!mConfigured)
        {
            return;
        }

        mTarget.update();

        const RenderStatus status = mTarget.render();
        switch (status)
        {
        case RenderStatus::Success:
            break;
        case RenderStatus::Lost:
        case RenderStatus::Outdated:
            logDebug("Surface {}, reconfiguring", renderStatusToStr(status));
            mTarget.resize(mTarget.size());
            break;
        case RenderStatus::OutOfMemory:
            logError("Out of memory");
            requestExit(LoopExit::OutOfMemory);
            break;
        case RenderStatus::DeviceLost:
            logError("Device lost");
            requestExit(LoopExit::DeviceLost);
            break;
        case RenderStatus::Timeout:
            logWarn("Surface timeout");
            break;
        }
    }

    void requestExit(const LoopExit reason)
    {
        if (!mExit)
        {
            mExit = reason;
        }
    }

    T&                      mTarget;
    RequestRedrawCallback   mRequestRedraw;
    bool                    mConfigured;
    std::optional<LoopExit> mExit;
};
} // namespace gtb
