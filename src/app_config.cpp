#include "app_config.hpp"
#include <format>

namespace tmxu {

AppConfig AppConfig::from_args(int argc, char* argv[]) {
    AppConfig config;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--no-logo") {
            config.show_logo = false;
        } else if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        }
    }
    return config;
}

std::string usage_text(const std::string& program) {
    return std::format(
        "Usage: {} [--no-logo]\n"
        "Browse, create, rename, kill and attach to tmux sessions.\n"
        "\n"
        "Options:\n"
        "  --no-logo    Do not show the hostname banner\n"
        "  -h, --help   Show this help\n",
        program);
}

} // namespace tmxu
