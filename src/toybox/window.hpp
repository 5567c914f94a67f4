#pragma once

#include "window_event.hpp"

#include <common/extent.hpp>

#include <functional>
#include <string_view>
#include <vector>

struct GLFWwindow;

namespace gtb
{
struct WindowDescriptor
{
    Extent2u         windowSize;
    std::string_view title;
};

using FramebufferSize = Extent2u;

enum class ControlFlow
{
    Continue,
    Exit,
};

using EventCallback = std::function<ControlFlow(const WindowEvent&)>;

class Window
{
public:
    explicit Window(const WindowDescriptor&);
    ~Window();

    // The GLFW callbacks hold a pointer to the window, so it can't be copied or moved.
    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    Window(Window&&) = delete;
    Window& operator=(Window&&) = delete;

    // Size accessors

    // Returns the size of the window in pixels.
    FramebufferSize resolution() const;

    // Run loop

    // Schedules a RedrawRequestedEvent for the next loop iteration.
    void requestRedraw() noexcept { mRedrawRequested = true; }

    // Delivers window events to the callback until the callback returns ControlFlow::Exit. The
    // first events delivered are a ResizedEvent with the current resolution and a redraw request.
    void run(EventCallback&&);

    // Raw access

    GLFWwindow* ptr() const { return mWindow; }

private:
    static void onFramebufferSize(GLFWwindow*, int width, int height);
    static void onWindowClose(GLFWwindow*);
    static void onKey(GLFWwindow*, int key, int scancode, int action, int mods);
    static void onFocus(GLFWwindow*, int focused);

    void pushEvent(const WindowEvent& event) { mPendingEvents.push_back(event); }

    GLFWwindow*              mWindow;
    std::vector<WindowEvent> mPendingEvents;
    bool                     mRedrawRequested;

    static int glfwRefCount;
};
} // namespace gtb
