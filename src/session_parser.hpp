#pragma once

#include "session_info.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace tmxu {

// Format string passed to `tmux list-panes -aF`. One output line per pane,
// twelve fields joined by kFieldDelimiter. The field order is what
// parse_sessions() expects and must not change independently of it.
inline constexpr const char* kListPanesFormat =
    "#{session_name}|#{session_id}|#{session_attached}|#{session_windows}|"
    "#{session_created}|#{window_index}|#{window_name}|#{window_active}|"
    "#{pane_index}|#{pane_current_command}|#{pane_current_path}|#{pane_active}";

inline constexpr char kFieldDelimiter = '|';
inline constexpr size_t kFieldCount = 12;

// Build the session hierarchy from list-panes output.
// Never fails: short lines are skipped and unparsable numbers become 0.
// Sessions keep the order of their first appearance; windows and panes are
// sorted by index.
[[nodiscard]] std::vector<SessionInfo> parse_sessions(std::string_view output);

// Helpers exposed for tests
[[nodiscard]] std::vector<std::string_view> split_fields(std::string_view line, char delimiter);
[[nodiscard]] bool parse_flag(std::string_view field);

} // namespace tmxu
