#include "window.hpp"

#include <common/assert.hpp>
#include <common/logger.hpp>

#include <GLFW/glfw3.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace gtb
{
namespace
{
void onGlfwError(const int errorCode, const char* const description)
{
    logError("GLFW error {}: {}", errorCode, description ? description : "no description");
}

Key toKey(const int glfwKey)
{
    switch (glfwKey)
    {
    case GLFW_KEY_ESCAPE:
        return Key::Escape;
    default:
        return Key::Unknown;
    }
}

Modifiers toModifiers(const int mods)
{
    return Modifiers{
        .shift = (mods & GLFW_MOD_SHIFT) != 0,
        .control = (mods & GLFW_MOD_CONTROL) != 0,
        .alt = (mods & GLFW_MOD_ALT) != 0,
        .super = (mods & GLFW_MOD_SUPER) != 0,
    };
}

Window* windowFromPtr(GLFWwindow* const windowPtr)
{
    Window* const window = static_cast<Window*>(glfwGetWindowUserPointer(windowPtr));
    GTB_ASSERT(window != nullptr);
    return window;
}
} // namespace

int Window::glfwRefCount = 0;

Window::Window(const WindowDescriptor& windowDesc)
    : mWindow(nullptr),
      mPendingEvents(),
      mRedrawRequested(false)
{
    if (glfwRefCount == 0)
    {
        glfwSetErrorCallback(onGlfwError);
        if (!glfwInit())
        {
            throw std::runtime_error("Failed to initialize GLFW.");
        }
        // NOTE: with this hint in place, GLFW assumes that we will manage the API and we can skip
        // calling glfwSwapBuffers.
        glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    }
    glfwRefCount += 1;

    const std::string title(windowDesc.title);
    mWindow = glfwCreateWindow(
        static_cast<int>(windowDesc.windowSize.width),
        static_cast<int>(windowDesc.windowSize.height),
        title.c_str(),
        nullptr,
        nullptr);

    if (!mWindow)
    {
        if (--glfwRefCount == 0)
        {
            glfwTerminate();
        }
        throw std::runtime_error("Failed to create GLFW window.");
    }

    glfwSetWindowUserPointer(mWindow, this);
    glfwSetFramebufferSizeCallback(mWindow, onFramebufferSize);
    glfwSetWindowCloseCallback(mWindow, onWindowClose);
    glfwSetKeyCallback(mWindow, onKey);
    glfwSetWindowFocusCallback(mWindow, onFocus);

    // GLFW does not report the initial size as an event.
    pushEvent(ResizedEvent{resolution()});
    mRedrawRequested = true;

    logDebug("Created window \"{}\"", title);
}

Window::~Window()
{
    if (mWindow)
    {
        glfwDestroyWindow(mWindow);
        mWindow = nullptr;
    }

    if (--glfwRefCount == 0)
    {
        glfwTerminate();
    }
}

FramebufferSize Window::resolution() const
{
    Extent2i result;
    glfwGetFramebufferSize(mWindow, &result.width, &result.height);
    return toExtent2u(result);
}

void Window::run(EventCallback&& onEvent)
{
    std::vector<WindowEvent> events;
    while (true)
    {
        // Block while idle. A pending redraw keeps the loop spinning.
        if (mPendingEvents.empty() && !mRedrawRequested)
        {
            glfwWaitEvents();
        }
        else
        {
            glfwPollEvents();
        }

        if (mRedrawRequested)
        {
            mRedrawRequested = false;
            pushEvent(RedrawRequestedEvent{});
        }

        events.clear();
        std::swap(events, mPendingEvents);

        for (const WindowEvent& event : events)
        {
            if (onEvent(event) == ControlFlow::Exit)
            {
                return;
            }
        }
    }
}

void Window::onFramebufferSize(GLFWwindow* const windowPtr, const int width, const int height)
{
    windowFromPtr(windowPtr)->pushEvent(ResizedEvent{toExtent2u(Extent2i{width, height})});
}

void Window::onWindowClose(GLFWwindow* const windowPtr)
{
    // The event handler decides whether the window closes.
    glfwSetWindowShouldClose(windowPtr, GLFW_FALSE);
    windowFromPtr(windowPtr)->pushEvent(CloseRequestedEvent{});
}

void Window::onKey(
    GLFWwindow* const windowPtr,
    const int         key,
    const int /*scancode*/,
    const int action,
    const int mods)
{
    const KeyEvent keyEvent{
        .key = toKey(key),
        .state = action == GLFW_RELEASE ? KeyState::Released : KeyState::Pressed,
        .repeat = action == GLFW_REPEAT,
        .modifiers = toModifiers(mods),
    };
    windowFromPtr(windowPtr)->pushEvent(KeyboardInputEvent{keyEvent});
}

void Window::onFocus(GLFWwindow* const windowPtr, const int focused)
{
    windowFromPtr(windowPtr)->pushEvent(FocusedEvent{focused == GLFW_TRUE});
}
} // namespace gtb
