#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "config/shortcut_registry.hpp"

using namespace whisperkeys;

namespace
{

// Registry with the built-in defaults; never touches the disk unless a test
// saves explicitly.
ShortcutRegistry make_registry()
{
    return ShortcutRegistry("/nonexistent/whisperkeys_test/shortcuts_config.json");
}

std::vector<std::string> ids_of(const std::vector<Shortcut>& shortcuts)
{
    std::vector<std::string> ids;
    for (const auto& sc : shortcuts)
        ids.push_back(sc.id);
    return ids;
}

const char* kTwoExitShortcuts = R"({
  "application": [
    {"id": "quit_a", "name": "Quit A", "hotkey": "ctrl+q", "enabled": true},
    {"id": "quit_b", "name": "Quit B", "hotkey": "Ctrl+Q", "enabled": true},
    {"id": "quit_c", "name": "Quit C", "hotkey": "ctrl+q", "enabled": false}
  ]
})";

}   // namespace

// ─── Defaults ────────────────────────────────────────────────────────────────

TEST(RegistryDefaults, AllGroupsPresentInOrder)
{
    ShortcutRegistry reg("unused.json");
    std::vector<std::string> expected = {
        "recording", "playback", "navigation", "history", "application", "text_processing"};
    EXPECT_EQ(reg.group_names(), expected);
    EXPECT_EQ(reg.size(), 17u);
}

TEST(RegistryDefaults, RecordToggleOnPause)
{
    ShortcutRegistry reg("unused.json");
    auto             sc = reg.get("record_toggle");
    ASSERT_TRUE(sc.has_value());
    EXPECT_EQ(sc->hotkey, "pause");
    EXPECT_TRUE(sc->enabled);
    EXPECT_EQ(sc->group, "recording");

    auto by_key = reg.get_by_hotkey("Pause");
    ASSERT_TRUE(by_key.has_value());
    EXPECT_EQ(by_key->id, "record_toggle");
}

TEST(RegistryDefaults, DisabledShortcutsAreNotIndexed)
{
    ShortcutRegistry reg("unused.json");
    ASSERT_TRUE(reg.get("exit_app").has_value());
    EXPECT_FALSE(reg.get("exit_app")->enabled);
    EXPECT_FALSE(reg.get_by_hotkey("ctrl+q").has_value());
}

TEST(RegistryDefaults, NoLatentConflicts)
{
    ShortcutRegistry reg("unused.json");
    EXPECT_TRUE(reg.detect_all_conflicts().empty());
}

TEST(RegistryDefaults, EnabledBindingsInRegistryOrder)
{
    ShortcutRegistry reg("unused.json");
    std::vector<std::string> ids;
    for (const auto& b : reg.enabled_bindings())
        ids.push_back(b.id);
    std::vector<std::string> expected = {
        "record_toggle", "copy_last", "show_history", "show_settings", "show_shortcuts"};
    EXPECT_EQ(ids, expected);
}

TEST(RegistryDefaults, GroupTitles)
{
    EXPECT_EQ(group_title("history"), "History Management");
    EXPECT_EQ(group_title("recording"), "Recording Controls");
    EXPECT_EQ(group_title("custom"), "custom");
}

// ─── set_hotkey ──────────────────────────────────────────────────────────────

TEST(RegistrySetHotkey, MovesIndexEntry)
{
    auto reg = make_registry();
    EXPECT_TRUE(reg.set_hotkey("record_toggle", "F9").ok());

    EXPECT_FALSE(reg.get_by_hotkey("pause").has_value());
    auto sc = reg.get_by_hotkey("f9");
    ASSERT_TRUE(sc.has_value());
    EXPECT_EQ(sc->id, "record_toggle");
    EXPECT_EQ(reg.get("record_toggle")->hotkey, "F9");
}

TEST(RegistrySetHotkey, ConflictNamesTheOwner)
{
    auto reg    = make_registry();
    auto result = reg.set_hotkey("show_history", "ctrl+shift+c");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, EditError::Conflict);
    EXPECT_EQ(result.conflicting_id, "copy_last");
    EXPECT_EQ(result.conflicting_name, "Copy Last Transcription");
    EXPECT_NE(result.message.find("Copy Last Transcription"), std::string::npos);

    // Unchanged
    EXPECT_EQ(reg.get("show_history")->hotkey, "ctrl+h");
    EXPECT_EQ(reg.get_by_hotkey("ctrl+shift+c")->id, "copy_last");
}

TEST(RegistrySetHotkey, ConflictDetectedOnNormalizedText)
{
    auto reg = make_registry();
    EXPECT_EQ(reg.set_hotkey("show_history", "Shift + CTRL + C").error, EditError::Conflict);
    EXPECT_EQ(reg.set_hotkey("copy_last", "PAUSE").error, EditError::Conflict);
}

TEST(RegistrySetHotkey, ConflictIsSymmetric)
{
    auto reg = make_registry();
    ASSERT_TRUE(reg.set_hotkey("record_start", "f5").ok());
    ASSERT_TRUE(reg.set_hotkey("record_stop", "f6").ok());
    ASSERT_TRUE(reg.set_enabled("record_start", true).ok());
    ASSERT_TRUE(reg.set_enabled("record_stop", true).ok());

    auto a_to_b = reg.set_hotkey("record_start", "f6");
    auto b_to_a = reg.set_hotkey("record_stop", "f5");
    EXPECT_EQ(a_to_b.conflicting_id, "record_stop");
    EXPECT_EQ(b_to_a.conflicting_id, "record_start");
}

TEST(RegistrySetHotkey, ReassigningOwnHotkeyIsAllowed)
{
    auto reg = make_registry();
    EXPECT_TRUE(reg.set_hotkey("copy_last", "Ctrl+Shift+C").ok());
    EXPECT_EQ(reg.get_by_hotkey("ctrl+shift+c")->id, "copy_last");
}

TEST(RegistrySetHotkey, DisabledOwnerDoesNotConflict)
{
    auto reg = make_registry();
    EXPECT_TRUE(reg.set_hotkey("show_history", "ctrl+q").ok());
    EXPECT_EQ(reg.get_by_hotkey("ctrl+q")->id, "show_history");
}

TEST(RegistrySetHotkey, EmptyClearsHotkey)
{
    auto reg = make_registry();
    EXPECT_TRUE(reg.set_hotkey("record_toggle", "").ok());
    EXPECT_EQ(reg.get("record_toggle")->hotkey, "");
    EXPECT_FALSE(reg.get_by_hotkey("pause").has_value());
    EXPECT_FALSE(reg.get_by_hotkey("").has_value());
}

TEST(RegistrySetHotkey, UnknownId)
{
    auto reg = make_registry();
    EXPECT_EQ(reg.set_hotkey("does_not_exist", "f1").error, EditError::NotFound);
}

// ─── set_enabled ─────────────────────────────────────────────────────────────

TEST(RegistrySetEnabled, DisableFreesHotkey)
{
    auto reg = make_registry();
    ASSERT_TRUE(reg.set_enabled("copy_last", false).ok());
    EXPECT_FALSE(reg.get_by_hotkey("ctrl+shift+c").has_value());
    EXPECT_EQ(reg.get("copy_last")->hotkey, "ctrl+shift+c");
    EXPECT_TRUE(reg.set_hotkey("show_history", "ctrl+shift+c").ok());
}

TEST(RegistrySetEnabled, EnableIndexesHotkey)
{
    auto reg = make_registry();
    ASSERT_TRUE(reg.set_enabled("exit_app", true).ok());
    EXPECT_EQ(reg.get_by_hotkey("ctrl+q")->id, "exit_app");
}

TEST(RegistrySetEnabled, ReEnableRefusedWhenHotkeyTaken)
{
    auto reg = make_registry();
    ASSERT_TRUE(reg.set_hotkey("show_history", "ctrl+q").ok());

    auto result = reg.set_enabled("exit_app", true);
    EXPECT_EQ(result.error, EditError::Conflict);
    EXPECT_EQ(result.conflicting_id, "show_history");
    EXPECT_FALSE(reg.get("exit_app")->enabled);
}

TEST(RegistrySetEnabled, UnknownId)
{
    auto reg = make_registry();
    EXPECT_EQ(reg.set_enabled("nope", true).error, EditError::NotFound);
}

// ─── add / remove ────────────────────────────────────────────────────────────

TEST(RegistryAdd, NewGroupIsAppended)
{
    auto     reg = make_registry();
    Shortcut sc{"insert_date", "Insert Date", "ctrl+alt+d", "Type today's date", true, ""};
    ASSERT_TRUE(reg.add_shortcut("custom", sc).ok());

    EXPECT_EQ(reg.group_names().back(), "custom");
    EXPECT_EQ(reg.get("insert_date")->group, "custom");
    EXPECT_EQ(reg.get_by_hotkey("alt+ctrl+d")->id, "insert_date");
    EXPECT_EQ(ids_of(reg.get_all()).back(), "insert_date");
}

TEST(RegistryAdd, DuplicateId)
{
    auto     reg = make_registry();
    Shortcut sc{"copy_last", "Again", "f3", "", true, ""};
    EXPECT_EQ(reg.add_shortcut("history", sc).error, EditError::DuplicateId);
}

TEST(RegistryAdd, EmptyIdRejected)
{
    auto     reg = make_registry();
    Shortcut sc{"", "Nameless", "f3", "", true, ""};
    EXPECT_EQ(reg.add_shortcut("history", sc).error, EditError::InvalidId);
}

TEST(RegistryAdd, ConflictingEnabledShortcut)
{
    auto     reg = make_registry();
    Shortcut sc{"my_toggle", "Mine", "pause", "", true, ""};
    auto     result = reg.add_shortcut("custom", sc);
    EXPECT_EQ(result.error, EditError::Conflict);
    EXPECT_EQ(result.conflicting_id, "record_toggle");
    EXPECT_FALSE(reg.get("my_toggle").has_value());
}

TEST(RegistryAdd, DisabledShortcutMayShareHotkey)
{
    auto     reg = make_registry();
    Shortcut sc{"my_toggle", "Mine", "pause", "", false, ""};
    EXPECT_TRUE(reg.add_shortcut("custom", sc).ok());
    EXPECT_EQ(reg.get_by_hotkey("pause")->id, "record_toggle");
}

TEST(RegistryRemove, RemovesAndFreesHotkey)
{
    auto reg = make_registry();
    EXPECT_TRUE(reg.remove_shortcut("copy_last"));
    EXPECT_FALSE(reg.get("copy_last").has_value());
    EXPECT_FALSE(reg.get_by_hotkey("ctrl+shift+c").has_value());
    EXPECT_EQ(reg.get_group("history").size(), 2u);
    EXPECT_EQ(reg.size(), 16u);
    EXPECT_FALSE(reg.remove_shortcut("copy_last"));
}

// ─── Conflict audit ──────────────────────────────────────────────────────────

TEST(RegistryConflicts, HandEditedDocumentWithDuplicateHotkeys)
{
    auto reg = make_registry();
    ASSERT_TRUE(reg.deserialize(kTwoExitShortcuts));

    auto conflicts = reg.detect_all_conflicts();
    ASSERT_EQ(conflicts.size(), 1u);
    std::vector<std::string> expected = {"quit_a", "quit_b"};
    EXPECT_EQ(conflicts["ctrl+q"], expected);
}

TEST(RegistryConflicts, FirstInRegistryOrderOwnsIndex)
{
    auto reg = make_registry();
    ASSERT_TRUE(reg.deserialize(kTwoExitShortcuts));
    EXPECT_EQ(reg.get_by_hotkey("ctrl+q")->id, "quit_a");
}

TEST(RegistryConflicts, RemovingOwnerPromotesNextClaimant)
{
    auto reg = make_registry();
    ASSERT_TRUE(reg.deserialize(kTwoExitShortcuts));
    ASSERT_TRUE(reg.remove_shortcut("quit_a"));
    EXPECT_EQ(reg.get_by_hotkey("ctrl+q")->id, "quit_b");
    EXPECT_TRUE(reg.detect_all_conflicts().empty());
}

TEST(RegistryConflicts, DisablingOwnerPromotesNextClaimant)
{
    auto reg = make_registry();
    ASSERT_TRUE(reg.deserialize(kTwoExitShortcuts));
    ASSERT_TRUE(reg.set_enabled("quit_a", false).ok());
    EXPECT_EQ(reg.get_by_hotkey("ctrl+q")->id, "quit_b");
}

TEST(RegistryConflicts, RetypingOwnerHotkeyKeepsOwnership)
{
    auto reg = make_registry();
    ASSERT_TRUE(reg.deserialize(kTwoExitShortcuts));
    uint64_t before = reg.revision();

    ASSERT_TRUE(reg.set_hotkey("quit_a", "Q+Ctrl").ok());
    EXPECT_EQ(reg.get("quit_a")->hotkey, "Q+Ctrl");
    EXPECT_EQ(reg.get_by_hotkey("ctrl+q")->id, "quit_a");
    EXPECT_GT(reg.revision(), before);

    // The latent duplicate still cannot claim it
    auto r = reg.set_hotkey("quit_b", "ctrl+q");
    EXPECT_EQ(r.error, EditError::Conflict);
    EXPECT_EQ(r.conflicting_id, "quit_a");
}

// ─── Document text ───────────────────────────────────────────────────────────

TEST(RegistryDocument, SerializeRoundTrip)
{
    auto reg = make_registry();
    ASSERT_TRUE(reg.set_hotkey("play_pause", "ctrl+space").ok());
    ASSERT_TRUE(reg.set_enabled("play_pause", true).ok());

    auto other = make_registry();
    ASSERT_TRUE(other.deserialize(reg.serialize()));
    EXPECT_EQ(other.get_all(), reg.get_all());
    EXPECT_EQ(other.group_names(), reg.group_names());
}

TEST(RegistryDocument, InvalidTextLeavesStateUntouched)
{
    auto reg    = make_registry();
    auto before = reg.get_all();
    EXPECT_FALSE(reg.deserialize("not json"));
    EXPECT_FALSE(reg.deserialize("[1, 2, 3]"));
    EXPECT_EQ(reg.get_all(), before);
}

TEST(RegistryDocument, EmptyDocumentMeansNoShortcuts)
{
    auto reg = make_registry();
    ASSERT_TRUE(reg.deserialize("{}"));
    EXPECT_EQ(reg.size(), 0u);
    EXPECT_TRUE(reg.enabled_bindings().empty());
}

TEST(RegistryDocument, MissingFieldsDefault)
{
    auto reg = make_registry();
    ASSERT_TRUE(reg.deserialize(R"({"custom": [{"id": "only_id"}, {"name": "no id"}, 42]})"));
    ASSERT_EQ(reg.size(), 1u);
    auto sc = reg.get("only_id");
    ASSERT_TRUE(sc.has_value());
    EXPECT_EQ(sc->name, "only_id");
    EXPECT_EQ(sc->hotkey, "");
    EXPECT_EQ(sc->description, "");
    EXPECT_TRUE(sc->enabled);
    EXPECT_EQ(sc->group, "custom");
}

TEST(RegistryDocument, DuplicateIdKeepsFirst)
{
    auto reg = make_registry();
    ASSERT_TRUE(reg.deserialize(R"({
      "a": [{"id": "x", "hotkey": "f1"}],
      "b": [{"id": "x", "hotkey": "f2"}]
    })"));
    EXPECT_EQ(reg.size(), 1u);
    EXPECT_EQ(reg.get("x")->hotkey, "f1");
    EXPECT_EQ(reg.get("x")->group, "a");
}

// ─── Change tracking ─────────────────────────────────────────────────────────

TEST(RegistryChanges, RevisionBumpsOnMutation)
{
    auto     reg = make_registry();
    uint64_t r0  = reg.revision();
    ASSERT_TRUE(reg.set_hotkey("record_toggle", "f8").ok());
    uint64_t r1 = reg.revision();
    EXPECT_GT(r1, r0);

    // Refused edits do not count
    EXPECT_FALSE(reg.set_hotkey("show_history", "f8").ok());
    EXPECT_EQ(reg.revision(), r1);

    ASSERT_TRUE(reg.set_enabled("record_toggle", false).ok());
    EXPECT_GT(reg.revision(), r1);
}

TEST(RegistryChanges, OnChangeCallback)
{
    auto reg   = make_registry();
    int  calls = 0;
    reg.set_on_change([&] { ++calls; });

    reg.set_hotkey("record_toggle", "f8");
    reg.set_hotkey("show_history", "f8");   // conflict, no notification
    reg.remove_shortcut("copy_last");
    EXPECT_EQ(calls, 2);
}

TEST(RegistryChanges, CallbackMayReadRegistry)
{
    auto        reg = make_registry();
    std::string seen;
    reg.set_on_change([&] { seen = reg.get("record_toggle")->hotkey; });
    reg.set_hotkey("record_toggle", "f7");
    EXPECT_EQ(seen, "f7");
}
