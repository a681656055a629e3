#include "queued_key_source.hpp"

namespace whisperkeys
{

QueuedKeySource::~QueuedKeySource()
{
    close();
}

bool QueuedKeySource::open()
{
    std::lock_guard lock(mutex_);
    open_   = true;
    closed_ = false;
    return true;
}

bool QueuedKeySource::wait_event(KeyEvent& out)
{
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !open_ || !events_.empty(); });
    if (!open_)
        return false;
    out = events_.front();
    events_.pop_front();
    return true;
}

void QueuedKeySource::close()
{
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
        if (!open_ && events_.empty())
            return;
        open_ = false;
        events_.clear();
    }
    cv_.notify_all();
}

void QueuedKeySource::push(const KeyEvent& event)
{
    {
        std::lock_guard lock(mutex_);
        if (closed_)
            return;
        events_.push_back(event);
    }
    cv_.notify_one();
}

size_t QueuedKeySource::pending() const
{
    std::lock_guard lock(mutex_);
    return events_.size();
}

bool QueuedKeySource::is_open() const
{
    std::lock_guard lock(mutex_);
    return open_;
}

}   // namespace whisperkeys
