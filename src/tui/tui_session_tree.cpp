#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../session_info.hpp"
#include <format>

namespace tmxu {

void TuiApp::render_session_tree() {
    if (!tree_win_) return;

    const auto& vm = controller_->view_model();
    if (vm.sessions().empty()) {
        render_empty_state();
        return;
    }

    int max_y = getmaxy(tree_win_);
    visible_tree_rows_ = max_y;

    auto visible = vm.tree.visible_nodes(vm.sessions());
    scroll_to_selection(visible);

    const auto& selected = vm.tree.current_selection();
    int row = 0;
    for (size_t i = tree_scroll_offset_; i < visible.size() && row < max_y; ++i) {
        render_tree_row(visible[i], row, visible[i].path == selected);
        row++;
    }

    // Scroll indicators
    int max_x = getmaxx(tree_win_);
    if (tree_scroll_offset_ > 0) {
        wattron(tree_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
        mvwprintw(tree_win_, 0, max_x - 4, "^^^");
        wattroff(tree_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
    }
    if (tree_scroll_offset_ + max_y < static_cast<int>(visible.size())) {
        wattron(tree_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
        mvwprintw(tree_win_, max_y - 1, max_x - 4, "vvv");
        wattroff(tree_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
    }
}

void TuiApp::render_empty_state() {
    wattron(tree_win_, COLOR_PAIR(COLOR_PAIR_DIM) | A_DIM);
    mvwprintw(tree_win_, 1, 2, "No tmux sessions found.");
    wattroff(tree_win_, COLOR_PAIR(COLOR_PAIR_DIM) | A_DIM);

    wattron(tree_win_, COLOR_PAIR(COLOR_PAIR_FLASH));
    mvwprintw(tree_win_, 3, 2, "Press n to create a new session.");
    wattroff(tree_win_, COLOR_PAIR(COLOR_PAIR_FLASH));
}

void TuiApp::render_tree_row(const VisibleNode& node, int row, bool is_selected) {
    int max_x = getmaxx(tree_win_) - 1;
    const auto& tree = controller_->view_model().tree;

    // The whole row takes the highlight when selected
    auto attr = [is_selected](int pair, attr_t extra = A_NORMAL) -> attr_t {
        if (is_selected) return COLOR_PAIR(COLOR_PAIR_SELECTED) | A_BOLD;
        return COLOR_PAIR(pair) | extra;
    };

    if (is_selected) {
        wattron(tree_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
        mvwhline(tree_win_, row, 0, ' ', max_x + 1);
        wattroff(tree_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
    }

    int col = 0;
    print_clipped(tree_win_, row, col, max_x, is_selected ? ">> " : "   ", attr(COLOR_PAIR_DEFAULT));
    col += node.depth * 2;

    // Expand/collapse indicator
    std::string marker = "  ";
    if (node.has_children) {
        marker = tree.is_open(node.path) ? "- " : "+ ";
    }
    print_clipped(tree_win_, row, col, max_x, marker, attr(COLOR_PAIR_TREE_MARKER, A_BOLD));

    switch (node.kind) {
        case TreeNodeKind::Session: {
            const auto& session = *node.session;
            print_clipped(tree_win_, row, col, max_x,
                          std::format("[{}] ", session_label(node.position)),
                          attr(COLOR_PAIR_LABEL, A_BOLD));
            print_clipped(tree_win_, row, col, max_x, session.attached ? "* " : "  ",
                          attr(COLOR_PAIR_ATTACHED));
            print_clipped(tree_win_, row, col, max_x, session.name, attr(COLOR_PAIR_SESSION_NAME, A_BOLD));
            print_clipped(tree_win_, row, col, max_x, std::format("  ({} win)", session.window_count),
                          attr(COLOR_PAIR_DIM, A_DIM));
            if (session.attached) {
                print_clipped(tree_win_, row, col, max_x, "  [attached]", attr(COLOR_PAIR_ATTACHED));
            }
            break;
        }

        case TreeNodeKind::Window: {
            const auto& window = *node.window;
            print_clipped(tree_win_, row, col, max_x, std::format("[{}] ", node.position + 1),
                          attr(COLOR_PAIR_LABEL));
            print_clipped(tree_win_, row, col, max_x, window.name, attr(COLOR_PAIR_WINDOW_NAME));
            print_clipped(tree_win_, row, col, max_x, "  " + window_summary(window),
                          attr(COLOR_PAIR_DIM, A_DIM));
            break;
        }

        case TreeNodeKind::Pane: {
            const auto& pane = *node.pane;
            print_clipped(tree_win_, row, col, max_x,
                          std::format("{}pane {}: {}  {}", pane.active ? "* " : "  ", pane.index,
                                      pane.current_command, shorten_path(pane.current_path)),
                          attr(COLOR_PAIR_DIM, A_DIM));
            break;
        }
    }
}

} // namespace tmxu
