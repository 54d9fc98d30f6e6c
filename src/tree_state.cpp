#include "tree_state.hpp"
#include <algorithm>

namespace tmxu {

std::vector<VisibleNode> TreeState::visible_nodes(const std::vector<SessionInfo>& sessions) const {
    std::vector<VisibleNode> nodes;

    for (size_t si = 0; si < sessions.size(); ++si) {
        const auto& session = sessions[si];

        VisibleNode session_node;
        session_node.path = {session.name};
        session_node.kind = TreeNodeKind::Session;
        session_node.depth = 0;
        session_node.position = si;
        session_node.has_children = !session.windows.empty();
        session_node.session = &session;
        bool session_open = is_open(session_node.path);
        nodes.push_back(session_node);

        if (!session_open) continue;

        for (size_t wi = 0; wi < session.windows.size(); ++wi) {
            const auto& window = session.windows[wi];

            VisibleNode window_node;
            window_node.path = {session.name, std::to_string(window.index)};
            window_node.kind = TreeNodeKind::Window;
            window_node.depth = 1;
            window_node.position = wi;
            // A single pane is shown inline on the window row
            window_node.has_children = window.panes.size() > 1;
            window_node.session = &session;
            window_node.window = &window;
            bool window_open = window_node.has_children && is_open(window_node.path);
            nodes.push_back(window_node);

            if (!window_open) continue;

            for (size_t pi = 0; pi < window.panes.size(); ++pi) {
                const auto& pane = window.panes[pi];

                VisibleNode pane_node;
                pane_node.path = {session.name, std::to_string(window.index), std::to_string(pane.index)};
                pane_node.kind = TreeNodeKind::Pane;
                pane_node.depth = 2;
                pane_node.position = pi;
                pane_node.session = &session;
                pane_node.window = &window;
                pane_node.pane = &pane;
                nodes.push_back(std::move(pane_node));
            }
        }
    }

    return nodes;
}

void TreeState::move_relative(const std::vector<SessionInfo>& sessions, int delta) {
    auto visible = visible_nodes(sessions);
    if (visible.empty()) return;

    auto it = std::find_if(visible.begin(), visible.end(),
                           [this](const VisibleNode& node) { return node.path == selected_; });

    int new_pos = 0;
    if (it != visible.end()) {
        int current_pos = static_cast<int>(it - visible.begin());
        new_pos = std::clamp(current_pos + delta, 0, static_cast<int>(visible.size()) - 1);
    }
    selected_ = visible[new_pos].path;
}

void TreeState::move_down(const std::vector<SessionInfo>& sessions) {
    move_relative(sessions, 1);
}

void TreeState::move_up(const std::vector<SessionInfo>& sessions) {
    move_relative(sessions, -1);
}

void TreeState::jump_first(const std::vector<SessionInfo>& sessions) {
    auto visible = visible_nodes(sessions);
    if (!visible.empty()) {
        selected_ = visible.front().path;
    }
}

void TreeState::jump_last(const std::vector<SessionInfo>& sessions) {
    auto visible = visible_nodes(sessions);
    if (!visible.empty()) {
        selected_ = visible.back().path;
    }
}

bool TreeState::resolves(const std::vector<SessionInfo>& sessions, const TreePath& path) {
    if (path.empty() || path.size() > 2) return false;

    auto session = std::find_if(sessions.begin(), sessions.end(),
                                [&](const SessionInfo& s) { return s.name == path[0]; });
    if (session == sessions.end()) return false;
    if (path.size() == 1) return true;

    return std::any_of(session->windows.begin(), session->windows.end(),
                       [&](const WindowInfo& w) { return std::to_string(w.index) == path[1]; });
}

bool TreeState::has_children(const std::vector<SessionInfo>& sessions, const TreePath& path) {
    if (path.empty() || path.size() > 2) return false;

    auto session = std::find_if(sessions.begin(), sessions.end(),
                                [&](const SessionInfo& s) { return s.name == path[0]; });
    if (session == sessions.end()) return false;
    if (path.size() == 1) return !session->windows.empty();

    auto window = std::find_if(session->windows.begin(), session->windows.end(),
                               [&](const WindowInfo& w) { return std::to_string(w.index) == path[1]; });
    return window != session->windows.end() && window->panes.size() > 1;
}

void TreeState::expand(const std::vector<SessionInfo>& sessions) {
    if (!has_children(sessions, selected_)) return;
    opened_.insert(selected_);
}

void TreeState::collapse() {
    if (opened_.erase(selected_) > 0) {
        return;
    }
    // Top-level nodes have no parent: the selection becomes empty
    if (!selected_.empty()) {
        selected_.pop_back();
    }
}

void TreeState::prune(const std::vector<SessionInfo>& sessions) {
    std::erase_if(opened_, [&](const TreePath& path) { return !resolves(sessions, path); });
}

void TreeState::open_and_select(const std::vector<SessionInfo>& sessions, const std::string& session_name) {
    auto it = std::find_if(sessions.begin(), sessions.end(),
                           [&](const SessionInfo& s) { return s.name == session_name; });
    if (it == sessions.end()) return;

    open({it->name});
    if (!it->windows.empty()) {
        selected_ = {it->name, std::to_string(it->windows.front().index)};
    } else {
        selected_ = {it->name};
    }
}

void TreeState::select_window(const std::vector<SessionInfo>& sessions, const std::string& session_name,
                              size_t one_based_position) {
    if (one_based_position == 0) return;

    auto it = std::find_if(sessions.begin(), sessions.end(),
                           [&](const SessionInfo& s) { return s.name == session_name; });
    if (it == sessions.end()) return;
    if (one_based_position > it->windows.size()) return;

    const auto& window = it->windows[one_based_position - 1];
    open({it->name});
    selected_ = {it->name, std::to_string(window.index)};
}

void TreeState::open(const TreePath& path) {
    if (path.empty()) return;
    opened_.insert(path);
}

void TreeState::close(const TreePath& path) {
    opened_.erase(path);
}

void TreeState::select(TreePath path) {
    selected_ = std::move(path);
}

bool TreeState::is_open(const TreePath& path) const {
    return opened_.count(path) > 0;
}

} // namespace tmxu
