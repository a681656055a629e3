// Logger Example
// Routes engine diagnostics the way a host application would.
//
// This example shows:
// - Picking the level from WHISPERKEYS_LOG_LEVEL
// - Sending engine categories to stderr and a log file
// - A host sink that only keeps dispatch failures
// - The categories the engine logs under (parser, registry, dispatch)

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <whisperkeys/logger.hpp>

#include "app/dispatch_table.hpp"
#include "config/shortcut_registry.hpp"
#include "input/hotkey.hpp"

using namespace whisperkeys;

int main()
{
    auto& logger = Logger::instance();

    LogLevel level = LogLevel::Debug;
    if (const char* env = std::getenv("WHISPERKEYS_LOG_LEVEL"))
    {
        if (auto parsed = Logger::level_from_string(env))
            level = *parsed;
        else
            std::cerr << "Unknown log level '" << env << "', using debug\n";
    }
    logger.set_level(level);
    logger.add_sink(sinks::stderr_sink());

    const auto log_file = std::filesystem::temp_directory_path() / "whisperkeys_example.log";
    logger.add_sink(sinks::file_sink(log_file.string()));

    // Surface handler failures to the user, e.g. in a tray notification
    logger.add_sink(
        [](const Logger::LogEntry& entry)
        {
            if (entry.category == "dispatch" && entry.level >= LogLevel::Error)
                std::cout << "notify: " << entry.message << "\n";
        });

    // "parser": unknown token dropped
    parse_hotkey("ctrl+hyper+k");

    // "registry": no config file, defaults in effect
    ShortcutRegistry registry("/nonexistent/whisperkeys_example/shortcuts_config.json");
    registry.load();

    // "dispatch": a failing handler is logged and the next one still runs
    DispatchTable dispatch;
    dispatch.add("copy_last", [] { throw std::runtime_error("clipboard unavailable"); });
    dispatch.add("copy_last", [] { std::cout << "copy_last handled\n"; });
    dispatch.invoke("copy_last");

    WHISPERKEYS_LOG_INFO("example", "Log written to {}", log_file.string());
    return 0;
}
