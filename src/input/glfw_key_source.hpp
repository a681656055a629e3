#pragma once

#ifdef WHISPERKEYS_USE_GLFW

    #include "queued_key_source.hpp"

struct GLFWwindow;

namespace whisperkeys
{

// Forwards the key callback of a GLFW window into a queue consumed by the key
// listener. GLFW delivers callbacks on the thread that polls events (the main
// thread); the listener thread only waits on the queue.
//
// The window is not owned. attach()/detach() must run on the main thread.
class GlfwKeySource : public QueuedKeySource
{
   public:
    explicit GlfwKeySource(GLFWwindow* window);
    ~GlfwKeySource() override;

    GlfwKeySource(const GlfwKeySource&)            = delete;
    GlfwKeySource& operator=(const GlfwKeySource&) = delete;

    // Installs the key callback on first use.
    bool open() override;

    // Restore the window's previous key callback and user pointer.
    void detach();

    GLFWwindow* window() const { return window_; }

   private:
    static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);

    GLFWwindow* window_        = nullptr;
    bool        attached_      = false;
    void*       prev_user_ptr_ = nullptr;
    void (*prev_callback_)(GLFWwindow*, int, int, int, int) = nullptr;
};

}   // namespace whisperkeys

#endif   // WHISPERKEYS_USE_GLFW
