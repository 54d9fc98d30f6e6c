#include <catch2/catch.hpp>

#include "session_info.hpp"

using namespace tmxu;

TEST_CASE("shorten_path replaces the home prefix", "[session_info]") {
    REQUIRE(shorten_path("/home/user/code", "/home/user") == "~/code");
    REQUIRE(shorten_path("/home/user", "/home/user") == "~");
    REQUIRE(shorten_path("/tmp/foo", "/home/user") == "/tmp/foo");
}

TEST_CASE("active_pane falls back to the first pane", "[session_info]") {
    WindowInfo window;
    REQUIRE(active_pane(window) == nullptr);
    REQUIRE(window_summary(window).empty());

    window.panes.push_back({0, "zsh", "/srv", false});
    window.panes.push_back({1, "htop", "/var", false});
    REQUIRE(active_pane(window)->index == 0);

    window.panes[1].active = true;
    REQUIRE(active_pane(window)->index == 1);
    REQUIRE(window_summary(window) == "htop  /var");
}

TEST_CASE("Session labels map positions to letters", "[session_info]") {
    REQUIRE(session_label(0) == 'A');
    REQUIRE(session_label(25) == 'Z');
    REQUIRE(session_label(26) == '?');

    REQUIRE(session_position_for_label('A') == 0);
    REQUIRE(session_position_for_label('a') == 0);
    REQUIRE(session_position_for_label('Z') == 25);
    REQUIRE(session_position_for_label('z') == 25);
    REQUIRE(session_position_for_label('1') == -1);
}
