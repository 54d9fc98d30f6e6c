#include "session_parser.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <charconv>
#include <unordered_map>

namespace tmxu {

namespace {

// Field positions within one list-panes line
enum Field : size_t {
    kSessionName = 0,
    kSessionId,
    kSessionAttached,
    kSessionWindows,
    kSessionCreated,
    kWindowIndex,
    kWindowName,
    kWindowActive,
    kPaneIndex,
    kPaneCommand,
    kPanePath,
    kPaneActive,
};

// Whole-field unsigned parse; anything else yields 0
template <typename T>
T parse_number(std::string_view field) {
    T value = 0;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
    if (ec != std::errc{} || ptr != field.data() + field.size()) {
        return 0;
    }
    return value;
}

} // namespace

std::vector<std::string_view> split_fields(std::string_view line, char delimiter) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(delimiter, start);
        if (pos == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

bool parse_flag(std::string_view field) {
    return field != "0";
}

std::vector<SessionInfo> parse_sessions(std::string_view output) {
    std::vector<SessionInfo> sessions;
    std::unordered_map<std::string, size_t> session_positions;

    size_t line_start = 0;
    while (line_start < output.size()) {
        size_t line_end = output.find('\n', line_start);
        if (line_end == std::string_view::npos) line_end = output.size();

        std::string_view line = output.substr(line_start, line_end - line_start);
        line_start = line_end + 1;

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        auto parts = split_fields(line, kFieldDelimiter);
        if (parts.size() < kFieldCount) {
            continue;
        }

        PaneInfo pane;
        pane.index = parse_number<uint32_t>(parts[kPaneIndex]);
        pane.current_command = std::string(parts[kPaneCommand]);
        pane.current_path = std::string(parts[kPanePath]);
        pane.active = parse_flag(trim(parts[kPaneActive]));

        std::string session_name(parts[kSessionName]);
        auto [it, inserted] = session_positions.try_emplace(session_name, sessions.size());
        if (inserted) {
            SessionInfo session;
            session.name = session_name;
            session.id = std::string(parts[kSessionId]);
            session.attached = parse_flag(parts[kSessionAttached]);
            session.window_count = parse_number<uint32_t>(parts[kSessionWindows]);
            session.created = parse_number<uint64_t>(parts[kSessionCreated]);
            sessions.push_back(std::move(session));
        }
        SessionInfo& session = sessions[it->second];

        uint32_t window_index = parse_number<uint32_t>(parts[kWindowIndex]);
        auto window_it = std::find_if(session.windows.begin(), session.windows.end(),
                                      [window_index](const WindowInfo& w) {
                                          return w.index == window_index;
                                      });
        if (window_it != session.windows.end()) {
            window_it->panes.push_back(std::move(pane));
        } else {
            WindowInfo window;
            window.index = window_index;
            window.name = std::string(parts[kWindowName]);
            window.active = parse_flag(parts[kWindowActive]);
            window.panes.push_back(std::move(pane));
            session.windows.push_back(std::move(window));
        }
    }

    for (auto& session : sessions) {
        std::stable_sort(session.windows.begin(), session.windows.end(),
                         [](const WindowInfo& a, const WindowInfo& b) { return a.index < b.index; });
        for (auto& window : session.windows) {
            std::stable_sort(window.panes.begin(), window.panes.end(),
                             [](const PaneInfo& a, const PaneInfo& b) { return a.index < b.index; });
        }
    }

    return sessions;
}

} // namespace tmxu
