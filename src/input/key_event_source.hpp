#pragma once

#include <whisperkeys/key.hpp>

namespace whisperkeys
{

// Upstream of the key listener: produces discrete key-down / key-up
// notifications with GLFW-compatible key codes.
//
// wait_event() is called from the listener thread only; close() may be called
// from any thread and must wake a blocked wait_event().
class KeyEventSource
{
   public:
    virtual ~KeyEventSource() = default;

    // Prepare for a new listening session. Returns false if the source
    // cannot deliver events.
    virtual bool open() = 0;

    // Block until an event is available (true) or the source is closed (false).
    virtual bool wait_event(KeyEvent& out) = 0;

    virtual void close() = 0;
};

}   // namespace whisperkeys
