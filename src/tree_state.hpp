#pragma once

#include "session_info.hpp"
#include <set>
#include <string>
#include <vector>

namespace tmxu {

// Identifier path into the session tree:
//   {}                              nothing selected
//   {session}                       a session
//   {session, window_index}         a window
//   {session, window_index, pane}   a pane (only for multi-pane windows)
// Paths hold names, never pointers, so they survive a snapshot swap and
// simply stop resolving when their target disappears.
using TreePath = std::vector<std::string>;

enum class TreeNodeKind {
    Session,
    Window,
    Pane
};

// One row of the flattened, expansion-aware tree. The pointers refer into
// the hierarchy passed to visible_nodes() and are only valid while it lives.
struct VisibleNode {
    TreePath path;
    TreeNodeKind kind = TreeNodeKind::Session;
    int depth = 0;
    size_t position = 0;            // Position among siblings
    bool has_children = false;
    const SessionInfo* session = nullptr;
    const WindowInfo* window = nullptr;
    const PaneInfo* pane = nullptr;
};

class TreeState {
public:
    // Depth-first list of rows currently visible
    [[nodiscard]] std::vector<VisibleNode> visible_nodes(const std::vector<SessionInfo>& sessions) const;

    // Relative movement, clamped at both ends. Without a resolvable
    // selection both select the first visible row.
    void move_down(const std::vector<SessionInfo>& sessions);
    void move_up(const std::vector<SessionInfo>& sessions);

    void jump_first(const std::vector<SessionInfo>& sessions);
    void jump_last(const std::vector<SessionInfo>& sessions);

    // Open the selected node if it has children
    void expand(const std::vector<SessionInfo>& sessions);

    // Close the selected node, or select its parent if it is closed or a leaf.
    // On a closed session this clears the selection.
    void collapse();

    // Forget open paths whose session or window no longer exists
    void prune(const std::vector<SessionInfo>& sessions);

    // Open the session and select its first window (or itself if it has none)
    void open_and_select(const std::vector<SessionInfo>& sessions, const std::string& session_name);

    // Select the Nth (1-based, by sorted position) window of a session
    void select_window(const std::vector<SessionInfo>& sessions, const std::string& session_name,
                       size_t one_based_position);

    void open(const TreePath& path);
    void close(const TreePath& path);
    void select(TreePath path);
    [[nodiscard]] bool is_open(const TreePath& path) const;

    [[nodiscard]] const TreePath& current_selection() const { return selected_; }
    [[nodiscard]] const std::set<TreePath>& opened() const { return opened_; }

private:
    [[nodiscard]] static bool has_children(const std::vector<SessionInfo>& sessions, const TreePath& path);
    [[nodiscard]] static bool resolves(const std::vector<SessionInfo>& sessions, const TreePath& path);
    void move_relative(const std::vector<SessionInfo>& sessions, int delta);

    TreePath selected_;
    std::set<TreePath> opened_;
};

} // namespace tmxu
