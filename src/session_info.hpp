#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace tmxu {

struct PaneInfo {
    uint32_t index = 0;             // Unique within its window
    std::string current_command;    // Foreground command running in the pane
    std::string current_path;       // Absolute working directory
    bool active = false;
};

struct WindowInfo {
    uint32_t index = 0;             // Unique within its session
    std::string name;
    bool active = false;

    // Sorted ascending by pane index, never empty for a parsed window
    std::vector<PaneInfo> panes;
};

struct SessionInfo {
    std::string name;               // Natural key, unique across the hierarchy
    std::string id;                 // tmux session id, e.g. "$0"
    bool attached = false;

    // As reported by tmux. Can exceed windows.size() when a window
    // reported no panes; the difference is display drift only.
    uint32_t window_count = 0;
    uint64_t created = 0;           // Unix timestamp

    // Sorted ascending by window index
    std::vector<WindowInfo> windows;
};

// Active pane of a window, falling back to the first pane. nullptr if the
// window has no panes.
[[nodiscard]] const PaneInfo* active_pane(const WindowInfo& window);

// "<command>  <path>" for the window's active pane, with $HOME shortened to ~
[[nodiscard]] std::string window_summary(const WindowInfo& window);

// Replace a leading home directory with "~". Uses $HOME when home is empty.
[[nodiscard]] std::string shorten_path(const std::string& path, const std::string& home = {});

// Label letter for a session position: 0 -> 'A' ... 25 -> 'Z', '?' beyond
[[nodiscard]] char session_label(size_t position);

// Inverse of session_label for 'A'..'Z' (either case); -1 otherwise
[[nodiscard]] int session_position_for_label(char letter);

} // namespace tmxu
