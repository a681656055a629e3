#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace whisperkeys
{

// Maps shortcut id -> ordered list of action handlers. Independent of the
// shortcut configuration, so handlers registered by id survive reloads and
// hotkey changes.
// Thread-safe: registration and invocation may happen on any thread.
class DispatchTable
{
   public:
    using Handler = std::function<void()>;

    DispatchTable()  = default;
    ~DispatchTable() = default;

    DispatchTable(const DispatchTable&)            = delete;
    DispatchTable& operator=(const DispatchTable&) = delete;

    // Append a handler for `id`. Returns false for an empty handler.
    bool add(const std::string& id, Handler handler);

    // Run every handler for `id` in registration order on the calling thread.
    // The lock is not held while handlers run. A handler that throws is
    // logged with the id; the remaining handlers still run.
    // Returns the number of handlers that were run.
    size_t invoke(const std::string& id) const;

    bool   contains(const std::string& id) const;
    size_t handler_count(const std::string& id) const;

    // Drop all handlers for one id / for every id.
    void remove(const std::string& id);
    void clear();

   private:
    mutable std::mutex                                    mutex_;
    std::unordered_map<std::string, std::vector<Handler>> handlers_;
};

}   // namespace whisperkeys
