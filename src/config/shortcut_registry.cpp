#include "shortcut_registry.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <system_error>
#include <whisperkeys/logger.hpp>

#include "json.hpp"

namespace whisperkeys
{

namespace
{

// ─── Document helpers ────────────────────────────────────────────────────────

json::Value shortcut_to_json(const Shortcut& sc)
{
    json::Value obj = json::Value::object();
    obj.set("id", sc.id);
    obj.set("name", sc.name);
    obj.set("hotkey", sc.hotkey);
    obj.set("description", sc.description);
    obj.set("enabled", sc.enabled);
    return obj;
}

// Collect shortcuts from a {group: [shortcut...]} object in document order.
// Malformed groups and entries are skipped with a warning. Returns false only
// if the document itself has the wrong shape.
bool shortcuts_from_json(const json::Value& doc, std::vector<Shortcut>& out)
{
    if (!doc.is_object())
        return false;

    for (const auto& [group, entries] : doc.members())
    {
        if (!entries.is_array())
        {
            WHISPERKEYS_LOG_WARN("registry", "Group '{}' is not a list, skipped", group);
            continue;
        }
        for (const auto& entry : entries.items())
        {
            const json::Value* id = entry.find("id");
            if (!entry.is_object() || !id || !id->is_string() || id->as_string().empty())
            {
                WHISPERKEYS_LOG_WARN("registry", "Shortcut without an id in group '{}', skipped",
                                     group);
                continue;
            }
            Shortcut sc;
            sc.id          = id->as_string();
            sc.name        = entry.get_string("name", sc.id);
            sc.hotkey      = entry.get_string("hotkey");
            sc.description = entry.get_string("description");
            sc.enabled     = entry.get_bool("enabled", true);
            sc.group       = group;
            out.push_back(std::move(sc));
        }
    }
    return true;
}

std::optional<std::string> read_file(const std::string& path)
{
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
        return std::nullopt;
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad())
        return std::nullopt;
    return text;
}

bool write_file(const std::string& path, const std::string& text, std::string& error)
{
    std::error_code ec;
    auto            dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            error = "cannot create " + dir.string() + ": " + ec.message();
            return false;
        }
    }

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open())
    {
        error = "cannot open " + path + " for writing";
        return false;
    }
    f << text;
    f.flush();
    if (!f.good())
    {
        error = "write to " + path + " failed";
        return false;
    }
    return true;
}

std::string iso_timestamp_now()
{
    auto        now = std::chrono::system_clock::now();
    std::time_t t   = std::chrono::system_clock::to_time_t(now);
    std::tm     local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &t);
#else
    localtime_r(&t, &local_tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

}   // namespace

// ─── Construction / paths ────────────────────────────────────────────────────

ShortcutRegistry::ShortcutRegistry() : ShortcutRegistry(default_path()) {}

ShortcutRegistry::ShortcutRegistry(std::string config_path)
    : config_path_(std::move(config_path))
{
    std::lock_guard lock(mutex_);
    load_defaults_locked();
}

void ShortcutRegistry::set_config_path(std::string path)
{
    std::lock_guard lock(mutex_);
    config_path_ = std::move(path);
}

std::string ShortcutRegistry::config_path() const
{
    std::lock_guard lock(mutex_);
    return config_path_;
}

std::string ShortcutRegistry::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "shortcuts_config.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "whisperkeys";
    return (dir / "shortcuts_config.json").string();
}

// ─── Persistence ─────────────────────────────────────────────────────────────

void ShortcutRegistry::load()
{
    std::string path = config_path();

    std::vector<Shortcut> loaded;
    bool                  use_defaults = true;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        WHISPERKEYS_LOG_INFO("registry", "No shortcuts config at {}, using defaults", path);
    }
    else if (auto text = read_file(path); !text)
    {
        WHISPERKEYS_LOG_ERROR("registry", "Failed to read shortcuts config {}, using defaults",
                              path);
    }
    else
    {
        json::ParseError err;
        auto             doc = json::parse(*text, &err);
        if (!doc)
        {
            WHISPERKEYS_LOG_ERROR("registry",
                                  "Failed to parse shortcuts config {} (offset {}: {}), using "
                                  "defaults",
                                  path,
                                  err.offset,
                                  err.message);
        }
        else if (!shortcuts_from_json(*doc, loaded))
        {
            WHISPERKEYS_LOG_ERROR("registry",
                                  "Shortcuts config {} is not a group mapping, using defaults",
                                  path);
        }
        else
        {
            use_defaults = false;
        }
    }

    size_t latent = 0;
    {
        std::lock_guard lock(mutex_);
        if (use_defaults)
            load_defaults_locked();
        else
            replace_locked(std::move(loaded));

        std::unordered_map<std::string, int> claims;
        for (const auto& id : order_)
        {
            const Shortcut& sc = shortcuts_.at(id);
            if (!sc.enabled)
                continue;
            std::string norm = normalize_hotkey(sc.hotkey);
            if (!norm.empty() && ++claims[norm] == 2)
                ++latent;
        }
    }

    if (latent > 0)
    {
        WHISPERKEYS_LOG_WARN("registry",
                             "Shortcuts config has {} conflicting hotkey(s); run a conflict check",
                             latent);
    }
    WHISPERKEYS_LOG_DEBUG("registry", "Loaded {} shortcuts", size());
    notify_change();
}

bool ShortcutRegistry::save() const
{
    std::string path;
    std::string text;
    {
        std::lock_guard lock(mutex_);
        path = config_path_;
        text = json::dump(groups_to_json_locked());
    }

    std::string error;
    if (!write_file(path, text, error))
    {
        WHISPERKEYS_LOG_ERROR("registry", "Failed to save shortcuts: {}", error);
        return false;
    }
    WHISPERKEYS_LOG_DEBUG("registry", "Saved shortcuts to {}", path);
    return true;
}

void ShortcutRegistry::reset_to_defaults()
{
    {
        std::lock_guard lock(mutex_);
        load_defaults_locked();
    }
    if (!save())
        WHISPERKEYS_LOG_WARN("registry", "Defaults restored in memory only");
    notify_change();
}

std::string ShortcutRegistry::serialize() const
{
    std::lock_guard lock(mutex_);
    return json::dump(groups_to_json_locked());
}

bool ShortcutRegistry::deserialize(const std::string& text)
{
    auto doc = json::parse(text);
    if (!doc)
        return false;

    std::vector<Shortcut> loaded;
    if (!shortcuts_from_json(*doc, loaded))
        return false;

    {
        std::lock_guard lock(mutex_);
        replace_locked(std::move(loaded));
    }
    notify_change();
    return true;
}

IoResult ShortcutRegistry::export_config(const std::string& path) const
{
    json::Value doc = json::Value::object();
    doc.set("version", "1.0");
    doc.set("exported_at", iso_timestamp_now());
    {
        std::lock_guard lock(mutex_);
        doc.set("shortcuts", groups_to_json_locked());
    }

    std::string error;
    if (!write_file(path, json::dump(doc), error))
    {
        WHISPERKEYS_LOG_ERROR("registry", "Failed to export config: {}", error);
        return {false, "Failed to export: " + error};
    }
    WHISPERKEYS_LOG_INFO("registry", "Configuration exported to {}", path);
    return {true, "Configuration exported to " + path};
}

ImportResult ShortcutRegistry::import_config(const std::string& path, bool merge)
{
    ImportResult result;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        result.message = "File not found: " + path;
        return result;
    }

    auto text = read_file(path);
    if (!text)
    {
        result.message = "Failed to import: cannot read " + path;
        WHISPERKEYS_LOG_ERROR("registry", "{}", result.message);
        return result;
    }

    json::ParseError err;
    auto             doc = json::parse(*text, &err);
    if (!doc)
    {
        result.message = "Invalid JSON format: " + err.message + " at offset "
                         + std::to_string(err.offset);
        return result;
    }

    const json::Value*    body = doc->find("shortcuts");
    std::vector<Shortcut> incoming;
    if (!body || !shortcuts_from_json(*body, incoming))
    {
        result.message = "Invalid configuration file format";
        return result;
    }

    {
        std::lock_guard lock(mutex_);
        if (!merge)
        {
            clear_locked();
        }

        for (auto& sc : incoming)
        {
            if (shortcuts_.count(sc.id))
            {
                // First write wins: the record already present is kept.
                if (merge)
                    result.id_collisions.push_back(sc.id);
                else
                    WHISPERKEYS_LOG_WARN("registry", "Duplicate shortcut id '{}' ignored", sc.id);
                continue;
            }
            if (merge && sc.enabled)
            {
                std::string norm = normalize_hotkey(sc.hotkey);
                if (!norm.empty() && owner_locked(norm, sc.id))
                {
                    sc.enabled = false;
                    result.disabled_conflicts.push_back(sc.id);
                }
            }
            insert_locked(std::move(sc));
            ++result.imported;
        }
        ++revision_;
    }

    for (const auto& id : result.id_collisions)
        WHISPERKEYS_LOG_WARN("registry", "Import kept existing shortcut '{}'", id);
    for (const auto& id : result.disabled_conflicts)
        WHISPERKEYS_LOG_WARN("registry", "Imported shortcut '{}' disabled: hotkey in use", id);

    result.saved = save();
    notify_change();

    if (!result.saved)
    {
        // The import stays in effect for this session.
        result.message = "Configuration imported but could not be saved to " + config_path();
        return result;
    }

    result.ok      = true;
    result.message = "Configuration imported successfully";
    WHISPERKEYS_LOG_INFO("registry",
                         "Imported {} shortcut(s) from {} ({})",
                         result.imported,
                         path,
                         merge ? "merge" : "replace");
    return result;
}

// ─── Queries ─────────────────────────────────────────────────────────────────

std::optional<Shortcut> ShortcutRegistry::get(const std::string& id) const
{
    std::lock_guard lock(mutex_);
    auto            it = shortcuts_.find(id);
    if (it == shortcuts_.end())
        return std::nullopt;
    return it->second;
}

std::optional<Shortcut> ShortcutRegistry::get_by_hotkey(const std::string& hotkey) const
{
    std::string     norm = normalize_hotkey(hotkey);
    std::lock_guard lock(mutex_);
    auto            it = hotkey_index_.find(norm);
    if (it == hotkey_index_.end())
        return std::nullopt;
    return shortcuts_.at(it->second);
}

std::vector<Shortcut> ShortcutRegistry::get_all() const
{
    std::lock_guard       lock(mutex_);
    std::vector<Shortcut> result;
    result.reserve(order_.size());
    for (const auto& id : order_)
        result.push_back(shortcuts_.at(id));
    return result;
}

std::vector<Shortcut> ShortcutRegistry::get_group(const std::string& group) const
{
    std::lock_guard       lock(mutex_);
    std::vector<Shortcut> result;
    for (const auto& g : groups_)
    {
        if (g.name != group)
            continue;
        for (const auto& id : g.ids)
            result.push_back(shortcuts_.at(id));
    }
    return result;
}

std::vector<std::string> ShortcutRegistry::group_names() const
{
    std::lock_guard          lock(mutex_);
    std::vector<std::string> names;
    names.reserve(groups_.size());
    for (const auto& g : groups_)
        names.push_back(g.name);
    return names;
}

size_t ShortcutRegistry::size() const
{
    std::lock_guard lock(mutex_);
    return shortcuts_.size();
}

std::vector<ShortcutBinding> ShortcutRegistry::enabled_bindings() const
{
    std::lock_guard              lock(mutex_);
    std::vector<ShortcutBinding> result;
    for (const auto& id : order_)
    {
        const Shortcut& sc = shortcuts_.at(id);
        if (!sc.enabled || sc.hotkey.empty())
            continue;
        HotkeySpec spec = parse_hotkey(sc.hotkey).spec;
        if (spec.has_key())
            result.push_back({sc.id, spec});
    }
    return result;
}

uint64_t ShortcutRegistry::revision() const
{
    std::lock_guard lock(mutex_);
    return revision_;
}

std::map<std::string, std::vector<std::string>> ShortcutRegistry::detect_all_conflicts() const
{
    std::lock_guard                                 lock(mutex_);
    std::map<std::string, std::vector<std::string>> users;
    for (const auto& id : order_)
    {
        const Shortcut& sc = shortcuts_.at(id);
        if (!sc.enabled || sc.hotkey.empty())
            continue;
        std::string norm = normalize_hotkey(sc.hotkey);
        if (!norm.empty())
            users[norm].push_back(id);
    }

    std::erase_if(users, [](const auto& entry) { return entry.second.size() < 2; });
    return users;
}

// ─── Edits ───────────────────────────────────────────────────────────────────

EditResult ShortcutRegistry::set_hotkey(const std::string& id, const std::string& hotkey)
{
    std::string norm = normalize_hotkey(hotkey);
    {
        std::lock_guard lock(mutex_);
        auto            it = shortcuts_.find(id);
        if (it == shortcuts_.end())
            return {EditError::NotFound, "", "", "Shortcut '" + id + "' not found"};

        if (!norm.empty())
        {
            if (auto owner = owner_locked(norm, id))
                return conflict_locked(id, *owner);
        }

        // Same normalized hotkey: only the text changes, index ownership stays.
        if (normalize_hotkey(it->second.hotkey) == norm)
        {
            it->second.hotkey = hotkey;
        }
        else
        {
            unindex_locked(it->second);
            it->second.hotkey = hotkey;
            index_locked(it->second);
        }
        ++revision_;
    }
    WHISPERKEYS_LOG_DEBUG("registry", "Hotkey of '{}' set to '{}'", id, hotkey);
    notify_change();
    return EditResult::success();
}

EditResult ShortcutRegistry::set_enabled(const std::string& id, bool enabled)
{
    {
        std::lock_guard lock(mutex_);
        auto            it = shortcuts_.find(id);
        if (it == shortcuts_.end())
            return {EditError::NotFound, "", "", "Shortcut '" + id + "' not found"};

        Shortcut& sc = it->second;
        if (sc.enabled == enabled)
            return EditResult::success();

        if (enabled)
        {
            std::string norm = normalize_hotkey(sc.hotkey);
            if (!norm.empty())
            {
                if (auto owner = owner_locked(norm, id))
                    return conflict_locked(id, *owner);
            }
            sc.enabled = true;
            index_locked(sc);
        }
        else
        {
            unindex_locked(sc);
            sc.enabled = false;
        }
        ++revision_;
    }
    notify_change();
    return EditResult::success();
}

EditResult ShortcutRegistry::add_shortcut(const std::string& group, Shortcut shortcut)
{
    {
        std::lock_guard lock(mutex_);
        if (shortcut.id.empty())
            return {EditError::InvalidId, "", "", "Shortcut id must not be empty"};
        if (shortcuts_.count(shortcut.id))
        {
            return {EditError::DuplicateId,
                    "",
                    "",
                    "Shortcut ID '" + shortcut.id + "' already exists"};
        }

        if (shortcut.enabled)
        {
            std::string norm = normalize_hotkey(shortcut.hotkey);
            if (!norm.empty())
            {
                if (auto owner = owner_locked(norm, shortcut.id))
                    return conflict_locked(shortcut.id, *owner);
            }
        }

        shortcut.group = group;
        insert_locked(std::move(shortcut));
        ++revision_;
    }
    notify_change();
    return EditResult::success();
}

bool ShortcutRegistry::remove_shortcut(const std::string& id)
{
    {
        std::lock_guard lock(mutex_);
        auto            it = shortcuts_.find(id);
        if (it == shortcuts_.end())
            return false;

        Shortcut removed = std::move(it->second);
        shortcuts_.erase(it);
        std::erase(order_, id);
        for (auto& g : groups_)
        {
            if (g.name == removed.group)
                std::erase(g.ids, id);
        }
        // The freed hotkey may pass to a shortcut that shared it.
        unindex_locked(removed);
        ++revision_;
    }
    notify_change();
    return true;
}

void ShortcutRegistry::set_on_change(ChangeCallback cb)
{
    std::lock_guard lock(mutex_);
    on_change_ = std::move(cb);
}

// ─── Internals ───────────────────────────────────────────────────────────────

void ShortcutRegistry::clear_locked()
{
    shortcuts_.clear();
    order_.clear();
    groups_.clear();
    hotkey_index_.clear();
}

void ShortcutRegistry::replace_locked(std::vector<Shortcut> shortcuts)
{
    clear_locked();
    for (auto& sc : shortcuts)
    {
        if (shortcuts_.count(sc.id))
        {
            WHISPERKEYS_LOG_WARN("registry", "Duplicate shortcut id '{}' ignored", sc.id);
            continue;
        }
        insert_locked(std::move(sc));
    }
    ++revision_;
}

void ShortcutRegistry::load_defaults_locked()
{
    std::vector<Shortcut> defaults;
    for (const auto& group : default_shortcut_groups())
        defaults.insert(defaults.end(), group.shortcuts.begin(), group.shortcuts.end());
    replace_locked(std::move(defaults));
}

void ShortcutRegistry::insert_locked(Shortcut shortcut)
{
    auto group_it = std::find_if(groups_.begin(),
                                 groups_.end(),
                                 [&](const GroupEntry& g) { return g.name == shortcut.group; });
    if (group_it == groups_.end())
    {
        groups_.push_back({shortcut.group, {}});
        group_it = std::prev(groups_.end());
    }
    group_it->ids.push_back(shortcut.id);
    order_.push_back(shortcut.id);

    index_locked(shortcut);
    std::string id = shortcut.id;
    shortcuts_.emplace(std::move(id), std::move(shortcut));
}

// First enabled claimant keeps the index entry; later claimants are latent
// conflicts reported by detect_all_conflicts().
void ShortcutRegistry::index_locked(const Shortcut& shortcut)
{
    if (!shortcut.enabled)
        return;
    std::string norm = normalize_hotkey(shortcut.hotkey);
    if (norm.empty())
        return;
    hotkey_index_.emplace(norm, shortcut.id);
}

void ShortcutRegistry::unindex_locked(const Shortcut& shortcut)
{
    std::string norm = normalize_hotkey(shortcut.hotkey);
    if (norm.empty())
        return;
    auto it = hotkey_index_.find(norm);
    if (it == hotkey_index_.end() || it->second != shortcut.id)
        return;
    hotkey_index_.erase(it);

    for (const auto& id : order_)
    {
        if (id == shortcut.id)
            continue;
        auto other = shortcuts_.find(id);
        if (other == shortcuts_.end() || !other->second.enabled)
            continue;
        if (normalize_hotkey(other->second.hotkey) == norm)
        {
            hotkey_index_.emplace(norm, id);
            break;
        }
    }
}

std::optional<std::string> ShortcutRegistry::owner_locked(const std::string& normalized,
                                                          const std::string& except_id) const
{
    auto it = hotkey_index_.find(normalized);
    if (it == hotkey_index_.end() || it->second == except_id)
        return std::nullopt;
    return it->second;
}

EditResult ShortcutRegistry::conflict_locked(const std::string& id,
                                             const std::string& owner_id) const
{
    const Shortcut& owner = shortcuts_.at(owner_id);
    EditResult      result;
    result.error            = EditError::Conflict;
    result.conflicting_id   = owner.id;
    result.conflicting_name = owner.name;
    result.message = "Conflicts with '" + owner.name + "' (" + owner.hotkey + ")";
    WHISPERKEYS_LOG_DEBUG("registry", "'{}' conflicts with '{}' on {}", id, owner.id, owner.hotkey);
    return result;
}

json::Value ShortcutRegistry::groups_to_json_locked() const
{
    json::Value doc = json::Value::object();
    for (const auto& g : groups_)
    {
        json::Value list = json::Value::array();
        for (const auto& id : g.ids)
            list.push_back(shortcut_to_json(shortcuts_.at(id)));
        doc.set(g.name, std::move(list));
    }
    return doc;
}

void ShortcutRegistry::notify_change()
{
    ChangeCallback cb;
    {
        std::lock_guard lock(mutex_);
        cb = on_change_;
    }
    if (cb)
        cb();
}

}   // namespace whisperkeys
