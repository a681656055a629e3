#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>

#include "key_event_source.hpp"

namespace whisperkeys
{

// Key source fed by push() from any thread (a window system callback, a test,
// a replay tool). Events pushed before open() are kept and delivered once the
// listener starts. Events still queued at close(), and events pushed after it,
// are dropped until the next open().
class QueuedKeySource : public KeyEventSource
{
   public:
    QueuedKeySource() = default;
    ~QueuedKeySource() override;

    QueuedKeySource(const QueuedKeySource&)            = delete;
    QueuedKeySource& operator=(const QueuedKeySource&) = delete;

    bool open() override;
    bool wait_event(KeyEvent& out) override;
    void close() override;

    void push(const KeyEvent& event);
    void press(int key) { push(KeyEvent::down(key)); }
    void release(int key) { push(KeyEvent::up(key)); }

    size_t pending() const;
    bool   is_open() const;

   private:
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::deque<KeyEvent>    events_;
    bool                    open_   = false;
    bool                    closed_ = false;
};

}   // namespace whisperkeys
