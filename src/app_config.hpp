#pragma once

#include <string>

namespace tmxu {

struct AppConfig {
    bool show_logo = true;      // Hostname banner above the tree
    bool show_help = false;

    // Parse command line flags. Unknown arguments are ignored.
    static AppConfig from_args(int argc, char* argv[]);
};

[[nodiscard]] std::string usage_text(const std::string& program);

} // namespace tmxu
