#ifdef WHISPERKEYS_USE_GLFW

    #include "glfw_key_source.hpp"

    #define GLFW_INCLUDE_NONE
    #include <GLFW/glfw3.h>
    #include <whisperkeys/logger.hpp>

namespace whisperkeys
{

GlfwKeySource::GlfwKeySource(GLFWwindow* window) : window_(window) {}

GlfwKeySource::~GlfwKeySource()
{
    close();
    detach();
}

bool GlfwKeySource::open()
{
    if (!window_)
    {
        WHISPERKEYS_LOG_ERROR("listener", "GLFW key source has no window");
        return false;
    }

    if (!attached_)
    {
        // Store this pointer for the static callback
        prev_user_ptr_ = glfwGetWindowUserPointer(window_);
        glfwSetWindowUserPointer(window_, this);
        prev_callback_ = glfwSetKeyCallback(window_, key_callback);
        attached_      = true;
    }
    return QueuedKeySource::open();
}

void GlfwKeySource::detach()
{
    if (!attached_ || !window_)
        return;
    glfwSetKeyCallback(window_, prev_callback_);
    glfwSetWindowUserPointer(window_, prev_user_ptr_);
    attached_ = false;
}

// ─── Static callback trampoline ──────────────────────────────────────────────

void GlfwKeySource::key_callback(GLFWwindow* window, int key, int /*scancode*/, int action, int /*mods*/)
{
    auto* source = static_cast<GlfwKeySource*>(glfwGetWindowUserPointer(window));
    if (!source || key == GLFW_KEY_UNKNOWN || !source->is_open())
        return;

    KeyEvent event;
    event.key = key;
    switch (action)
    {
        case GLFW_PRESS:
            event.action = KeyAction::Press;
            break;
        case GLFW_REPEAT:
            event.action = KeyAction::Repeat;
            break;
        default:
            event.action = KeyAction::Release;
            break;
    }
    source->push(event);
}

}   // namespace whisperkeys

#endif   // WHISPERKEYS_USE_GLFW
