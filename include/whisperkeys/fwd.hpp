#pragma once

namespace whisperkeys
{

class Logger;

struct KeyEvent;
struct HotkeySpec;
struct HotkeyParse;

struct Shortcut;
struct ShortcutBinding;
struct EditResult;
struct IoResult;
struct ImportResult;
class ShortcutRegistry;

class KeyEventSource;
class QueuedKeySource;
class KeyListener;
struct ListenerOptions;

class DispatchTable;
class ShortcutsIntegrator;

}   // namespace whisperkeys
