#include "session_info.hpp"
#include <cstdlib>
#include <format>

namespace tmxu {

const PaneInfo* active_pane(const WindowInfo& window) {
    for (const auto& pane : window.panes) {
        if (pane.active) return &pane;
    }
    return window.panes.empty() ? nullptr : &window.panes.front();
}

std::string window_summary(const WindowInfo& window) {
    const PaneInfo* pane = active_pane(window);
    if (!pane) return {};
    return std::format("{}  {}", pane->current_command, shorten_path(pane->current_path));
}

std::string shorten_path(const std::string& path, const std::string& home) {
    std::string prefix = home;
    if (prefix.empty()) {
        const char* env_home = std::getenv("HOME");
        if (!env_home) return path;
        prefix = env_home;
    }
    if (prefix.empty() || !path.starts_with(prefix)) {
        return path;
    }
    return "~" + path.substr(prefix.size());
}

char session_label(size_t position) {
    if (position < 26) {
        return static_cast<char>('A' + position);
    }
    return '?';
}

int session_position_for_label(char letter) {
    if (letter >= 'a' && letter <= 'z') {
        letter = static_cast<char>(letter - 'a' + 'A');
    }
    if (letter < 'A' || letter > 'Z') return -1;
    return letter - 'A';
}

} // namespace tmxu
