#include "dispatch_table.hpp"

#include <exception>
#include <whisperkeys/logger.hpp>

namespace whisperkeys
{

bool DispatchTable::add(const std::string& id, Handler handler)
{
    if (!handler)
        return false;
    std::lock_guard lock(mutex_);
    handlers_[id].push_back(std::move(handler));
    return true;
}

size_t DispatchTable::invoke(const std::string& id) const
{
    std::vector<Handler> handlers;
    {
        std::lock_guard lock(mutex_);
        auto            it = handlers_.find(id);
        if (it == handlers_.end())
            return 0;
        handlers = it->second;
    }

    // Execute outside the lock so a handler may register or trigger others
    for (const auto& handler : handlers)
    {
        try
        {
            handler();
        }
        catch (const std::exception& e)
        {
            WHISPERKEYS_LOG_ERROR("dispatch", "Handler for shortcut '{}' failed: {}", id, e.what());
        }
        catch (...)
        {
            WHISPERKEYS_LOG_ERROR("dispatch",
                                  "Handler for shortcut '{}' failed with a non-standard exception",
                                  id);
        }
    }
    return handlers.size();
}

bool DispatchTable::contains(const std::string& id) const
{
    std::lock_guard lock(mutex_);
    auto            it = handlers_.find(id);
    return it != handlers_.end() && !it->second.empty();
}

size_t DispatchTable::handler_count(const std::string& id) const
{
    std::lock_guard lock(mutex_);
    auto            it = handlers_.find(id);
    return it != handlers_.end() ? it->second.size() : 0;
}

void DispatchTable::remove(const std::string& id)
{
    std::lock_guard lock(mutex_);
    handlers_.erase(id);
}

void DispatchTable::clear()
{
    std::lock_guard lock(mutex_);
    handlers_.clear();
}

}   // namespace whisperkeys
