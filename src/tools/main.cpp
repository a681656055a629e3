#include "app/shortcuts_integrator.hpp"
#include "config/shortcut_registry.hpp"
#include "input/hotkey.hpp"

#ifdef WHISPERKEYS_USE_GLFW
    #include "input/glfw_key_source.hpp"

    #define GLFW_INCLUDE_NONE
    #include <GLFW/glfw3.h>
#endif

#include <atomic>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>
#include <whisperkeys/whisperkeys.hpp>

using namespace whisperkeys;

namespace
{

std::atomic<bool> g_running{true};

void signal_handler(int /*sig*/)
{
    g_running.store(false, std::memory_order_relaxed);
}

void print_usage(const char* argv0)
{
    std::cout << "Usage: " << argv0 << " [--config <path>] [--verbose] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  list                      Show all shortcuts by group\n"
              << "  conflicts                 Report hotkeys claimed by several shortcuts\n"
              << "  set <id> <hotkey>         Assign a hotkey (\"\" clears it)\n"
              << "  enable <id>               Enable a shortcut\n"
              << "  disable <id>              Disable a shortcut\n"
              << "  export <path>             Write the configuration to a file\n"
              << "  import <path> [--merge]   Load a configuration file\n"
              << "  reset                     Restore the default shortcuts\n"
              << "  parse <hotkey>            Show how a hotkey is understood\n"
              << "  listen                    Open a window and report shortcuts as they fire\n";
}

int cmd_list(const ShortcutRegistry& registry)
{
    for (const auto& group : registry.group_names())
    {
        std::cout << group_title(group) << "\n";
        for (const auto& sc : registry.get_group(group))
        {
            std::printf("  %-22s %-18s %-9s %s\n",
                        sc.id.c_str(),
                        display_hotkey(sc.hotkey).c_str(),
                        sc.enabled ? "enabled" : "disabled",
                        sc.name.c_str());
        }
    }
    return 0;
}

int cmd_conflicts(const ShortcutRegistry& registry)
{
    auto conflicts = registry.detect_all_conflicts();
    if (conflicts.empty())
    {
        std::cout << "No conflicts\n";
        return 0;
    }
    for (const auto& [hotkey, ids] : conflicts)
    {
        std::cout << display_hotkey(hotkey) << ":";
        for (const auto& id : ids)
            std::cout << " " << id;
        std::cout << "\n";
    }
    return 2;
}

int report_edit(const EditResult& result, const ShortcutRegistry& registry)
{
    if (!result)
    {
        std::cerr << "error: " << result.message << "\n";
        return 1;
    }
    if (!registry.save())
    {
        std::cerr << "error: could not save " << registry.config_path() << "\n";
        return 1;
    }
    return 0;
}

int cmd_parse(const std::string& text)
{
    HotkeyParse parsed = parse_hotkey(text);
    std::cout << "normalized: " << format_hotkey(parsed.spec) << "\n"
              << "display:    " << display_hotkey(text) << "\n";
    for (const auto& warning : parsed.warnings)
        std::cout << "warning:    " << warning << "\n";
    return parsed.clean() ? 0 : 2;
}

int cmd_listen(ShortcutRegistry& registry)
{
#ifdef WHISPERKEYS_USE_GLFW
    if (!glfwInit())
    {
        std::cerr << "error: failed to initialize GLFW\n";
        return 1;
    }
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    GLFWwindow* window = glfwCreateWindow(480, 120, "whisperkeys", nullptr, nullptr);
    if (!window)
    {
        std::cerr << "error: failed to create window\n";
        glfwTerminate();
        return 1;
    }

    int exit_code = 0;
    {
        ShortcutsIntegrator shortcuts(registry);
        shortcuts.initialize();
        for (const auto& sc : shortcuts.get_all_shortcuts())
        {
            std::string id = sc.id;
            shortcuts.register_action_handler(id, [id] { std::cout << "fired: " << id << std::endl; });
        }
        shortcuts.register_action_handler("exit_app",
                                          [] { g_running.store(false, std::memory_order_relaxed); });

        GlfwKeySource source(window);
        if (!shortcuts.start_keyboard_listener(source))
        {
            std::cerr << "error: could not start the keyboard listener\n";
            exit_code = 1;
        }
        else
        {
            std::cout << "Listening; press shortcuts in the window, close it to quit\n";
            while (g_running.load(std::memory_order_relaxed) && !glfwWindowShouldClose(window))
                glfwWaitEventsTimeout(0.1);
            shortcuts.stop_keyboard_listener();
        }
        source.detach();
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    return exit_code;
#else
    (void)registry;
    std::cerr << "error: built without GLFW (configure with -DWHISPERKEYS_USE_GLFW=ON)\n";
    return 1;
#endif
}

}   // namespace

int main(int argc, char* argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string              config_path;
    bool                     verbose = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg(argv[i]);
        if (arg == "--config" && i + 1 < argc)
            config_path = argv[++i];
        else if (arg == "--verbose" || arg == "-v")
            verbose = true;
        else if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return 0;
        }
        else
            args.push_back(std::move(arg));
    }

    if (args.empty())
    {
        print_usage(argv[0]);
        return 1;
    }

    auto& logger = Logger::instance();
    logger.add_sink(sinks::stderr_sink());
    logger.set_level(verbose ? LogLevel::Debug : LogLevel::Warning);

    ShortcutRegistry registry(config_path.empty() ? ShortcutRegistry::default_path()
                                                  : config_path);
    registry.load();
    WHISPERKEYS_LOG_DEBUG("ctl", "Using configuration {}", registry.config_path());

    const std::string& cmd = args[0];
    auto               need = [&](size_t n)
    {
        if (args.size() >= n + 1)
            return true;
        std::cerr << "error: '" << cmd << "' expects " << n << " argument(s)\n";
        return false;
    };

    if (cmd == "list")
        return cmd_list(registry);
    if (cmd == "conflicts")
        return cmd_conflicts(registry);
    if (cmd == "set")
        return need(2) ? report_edit(registry.set_hotkey(args[1], args[2]), registry) : 1;
    if (cmd == "enable")
        return need(1) ? report_edit(registry.set_enabled(args[1], true), registry) : 1;
    if (cmd == "disable")
        return need(1) ? report_edit(registry.set_enabled(args[1], false), registry) : 1;
    if (cmd == "export")
    {
        if (!need(1))
            return 1;
        IoResult result = registry.export_config(args[1]);
        std::cout << result.message << "\n";
        return result ? 0 : 1;
    }
    if (cmd == "import")
    {
        bool merge = std::erase(args, std::string("--merge")) > 0;
        if (!need(1))
            return 1;
        ImportResult result = registry.import_config(args[1], merge);
        std::cout << result.message << "\n";
        for (const auto& id : result.id_collisions)
            std::cout << "  kept existing: " << id << "\n";
        for (const auto& id : result.disabled_conflicts)
            std::cout << "  imported disabled (hotkey in use): " << id << "\n";
        return result ? 0 : 1;
    }
    if (cmd == "reset")
    {
        registry.reset_to_defaults();
        std::cout << "Shortcuts reset to defaults\n";
        return 0;
    }
    if (cmd == "parse")
        return need(1) ? cmd_parse(args[1]) : 1;
    if (cmd == "listen")
        return cmd_listen(registry);

    std::cerr << "error: unknown command '" << cmd << "'\n";
    print_usage(argv[0]);
    return 1;
}
