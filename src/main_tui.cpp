#include "platform_factory.hpp"
#include "app_config.hpp"
#include "app_controller.hpp"
#include "session_store.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>

#include "tui/tui_app.hpp"

// Replace this process with `tmux attach-session -t <target>`.
// Only returns if exec failed.
static int exec_tmux_attach(const std::string& target) {
    const char* args[] = {"tmux", "attach-session", "-t", target.c_str(), nullptr};
    execvp(args[0], const_cast<char* const*>(args));

    std::cerr << "tmxu: failed to exec tmux attach-session: " << std::strerror(errno) << std::endl;
    return 1;
}

int main(int argc, char* argv[]) {
    auto config = tmxu::AppConfig::from_args(argc, argv);
    if (config.show_help) {
        std::cout << tmxu::usage_text(argc > 0 ? argv[0] : "tmxu");
        return 0;
    }

    std::optional<std::string> attach_target;

    try {
        // Create the tmux backend (owned here in main)
        auto data_provider = tmxu::make_session_data_provider();
        auto session_controller = tmxu::make_session_controller();

        if (!data_provider->is_available()) {
            std::cerr << "tmxu: tmux is not installed or not in PATH" << std::endl;
            return 1;
        }

        tmxu::SessionStore store(data_provider.get());
        tmxu::AppController controller(&store, session_controller.get());
        controller.start();

        // TuiApp does not own these - they're managed here
        tmxu::TuiApp app(&controller, config);
        attach_target = app.run();
    } catch (const std::exception& e) {
        // Make sure we restore terminal state before printing error
        if (!isendwin()) {
            endwin();
        }
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Terminal is restored by now; hand the terminal over to tmux
    if (attach_target) {
        return exec_tmux_attach(*attach_target);
    }
    return 0;
}
