#pragma once

#include <common/extent.hpp>

#include <variant>

namespace gtb
{
enum class Key
{
    Escape,
    Unknown,
};

enum class KeyState
{
    Pressed,
    Released,
};

struct Modifiers
{
    bool shift = false;
    bool control = false;
    bool alt = false;
    bool super = false;

    constexpr bool operator==(const Modifiers&) const noexcept = default;
};

struct KeyEvent
{
    Key       key = Key::Unknown;
    KeyState  state = KeyState::Pressed;
    // Set for the pressed events the platform generates while a key is held down.
    bool      repeat = false;
    Modifiers modifiers;
};

// The window's framebuffer changed size, in pixels. Either dimension may be zero, e.g. when the
// window is minimized.
struct ResizedEvent
{
    Extent2u size;
};

struct RedrawRequestedEvent
{
};

struct CloseRequestedEvent
{
};

struct KeyboardInputEvent
{
    KeyEvent event;
};

struct FocusedEvent
{
    bool focused = false;
};

using WindowEvent = std::variant<
    ResizedEvent,
    RedrawRequestedEvent,
    CloseRequestedEvent,
    KeyboardInputEvent,
    FocusedEvent>;
} // namespace gtb
