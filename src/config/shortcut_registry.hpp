#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "input/hotkey.hpp"

namespace whisperkeys
{

namespace json
{
class Value;
}

// A configurable application action bound to an (optional) hotkey.
struct Shortcut
{
    std::string id;            // stable identity, e.g. "record_toggle"
    std::string name;          // display name
    std::string hotkey;        // user text, e.g. "ctrl+shift+c"; empty = unassigned
    std::string description;
    bool        enabled = true;
    std::string group;         // display category, not used for matching

    bool operator==(const Shortcut&) const = default;
};

struct ShortcutGroupDefaults
{
    std::string           name;
    std::vector<Shortcut> shortcuts;
};

// Built-in bootstrap configuration used when no config file exists.
const std::vector<ShortcutGroupDefaults>& default_shortcut_groups();

// Display title for a group name ("history" -> "History Management").
std::string group_title(const std::string& group);

enum class EditError
{
    None,
    NotFound,
    InvalidId,
    DuplicateId,
    Conflict,
};

// Outcome of a registry write. Conflicts are reported here, never thrown.
struct EditResult
{
    EditError   error = EditError::None;
    std::string conflicting_id;     // set for EditError::Conflict
    std::string conflicting_name;
    std::string message;

    bool ok() const { return error == EditError::None; }
    explicit operator bool() const { return ok(); }

    static EditResult success() { return {}; }
};

struct IoResult
{
    bool        ok = false;
    std::string message;

    explicit operator bool() const { return ok; }
};

struct ImportResult
{
    bool        ok = false;
    std::string message;
    size_t      imported = 0;
    // False if the imported state could not be written to the config path.
    bool saved = false;
    // Merge mode: incoming ids that already existed (existing record kept).
    std::vector<std::string> id_collisions;
    // Merge mode: incoming ids imported disabled because their hotkey was taken.
    std::vector<std::string> disabled_conflicts;

    explicit operator bool() const { return ok; }
};

// Enabled shortcut with a parsed hotkey, as consumed by the key listener.
struct ShortcutBinding
{
    std::string id;
    HotkeySpec  spec;
};

// In-memory store of shortcuts grouped by category, with a derived index
// from normalized hotkey text to the id of the enabled shortcut owning it.
// Thread-safe: every public method holds the registry mutex for its whole
// critical section. load/save/import/export touch the filesystem and belong
// on the UI thread, not on the key listener thread.
class ShortcutRegistry
{
   public:
    ShortcutRegistry();
    explicit ShortcutRegistry(std::string config_path);
    ~ShortcutRegistry() = default;

    ShortcutRegistry(const ShortcutRegistry&)            = delete;
    ShortcutRegistry& operator=(const ShortcutRegistry&) = delete;

    void               set_config_path(std::string path);
    std::string        config_path() const;
    static std::string default_path();

    // Read the config file. Falls back to the defaults on a missing or
    // corrupt file; never fails.
    void load();

    // Write the config file. Returns false (and logs) on I/O failure; the
    // in-memory state stays authoritative either way.
    bool save() const;

    // Replace everything with the built-in defaults and save.
    void reset_to_defaults();

    std::optional<Shortcut>  get(const std::string& id) const;
    std::optional<Shortcut>  get_by_hotkey(const std::string& hotkey) const;
    std::vector<Shortcut>    get_all() const;
    std::vector<Shortcut>    get_group(const std::string& group) const;
    std::vector<std::string> group_names() const;
    size_t                   size() const;

    EditResult set_hotkey(const std::string& id, const std::string& hotkey);
    EditResult set_enabled(const std::string& id, bool enabled);
    EditResult add_shortcut(const std::string& group, Shortcut shortcut);
    bool       remove_shortcut(const std::string& id);

    // Normalized hotkey -> ids (registry order) for every hotkey claimed by
    // two or more enabled shortcuts.
    std::map<std::string, std::vector<std::string>> detect_all_conflicts() const;

    IoResult     export_config(const std::string& path) const;
    ImportResult import_config(const std::string& path, bool merge);

    // Document text in the config file format.
    std::string serialize() const;
    // Replace state from document text. Returns false (state untouched) if
    // the text is not a valid config document.
    bool deserialize(const std::string& text);

    // Snapshot of enabled shortcuts with a usable hotkey, in registry order.
    std::vector<ShortcutBinding> enabled_bindings() const;

    // Bumped on every mutation.
    uint64_t revision() const;

    // Called after each successful mutation, outside the registry lock.
    using ChangeCallback = std::function<void()>;
    void set_on_change(ChangeCallback cb);

   private:
    struct GroupEntry
    {
        std::string              name;
        std::vector<std::string> ids;
    };

    mutable std::mutex                           mutex_;
    std::string                                  config_path_;
    std::unordered_map<std::string, Shortcut>    shortcuts_;
    std::vector<std::string>                     order_;   // insertion order
    std::vector<GroupEntry>                      groups_;
    std::unordered_map<std::string, std::string> hotkey_index_;
    uint64_t                                     revision_ = 0;
    ChangeCallback                               on_change_;

    // All helpers below expect mutex_ to be held.
    void clear_locked();
    void replace_locked(std::vector<Shortcut> shortcuts);
    void load_defaults_locked();
    void insert_locked(Shortcut shortcut);
    void index_locked(const Shortcut& shortcut);
    void unindex_locked(const Shortcut& shortcut);
    std::optional<std::string> owner_locked(const std::string& normalized,
                                            const std::string& except_id) const;
    EditResult  conflict_locked(const std::string& id, const std::string& owner_id) const;
    json::Value groups_to_json_locked() const;

    void notify_change();
};

}   // namespace whisperkeys
