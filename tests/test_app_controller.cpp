#include <catch2/catch.hpp>

#include "app_controller.hpp"
#include "fakes.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace tmxu;

namespace {

struct ControllerFixture {
    ControllerFixture()
        : store(&provider)
        , app(&store, &sessions, [this] { return now; })
    {
        provider.output = kSampleOutput;
        app.start();
    }

    Action press(char c) { return app.handle_key(KeyEvent::character(c)); }
    Action press(KeyCode code) { return app.handle_key(KeyEvent::special(code)); }

    void type(const std::string& text) {
        for (char c : text) (void)press(c);
    }

    const TreePath& selection() const { return app.view_model().tree.current_selection(); }

    // Cancelling a dialog must leave both of these untouched
    void require_unchanged(const TreePath& selected, const std::shared_ptr<const SessionSnapshot>& data) const {
        REQUIRE(selection() == selected);
        REQUIRE(app.view_model().data == data);
        REQUIRE(app.view_model().data->sessions.size() == 2);
    }

    std::chrono::steady_clock::time_point now{};
    FakeSessionDataProvider provider;
    FakeSessionController sessions;
    SessionStore store;
    AppController app;
};

} // namespace

TEST_CASE("Startup focuses the first session", "[controller]") {
    ControllerFixture f;
    REQUIRE(f.provider.query_count == 1);
    REQUIRE(f.app.view_model().sessions().size() == 2);
    REQUIRE(f.selection() == TreePath{"dev", "0"});
    REQUIRE(f.app.view_model().tree.is_open({"dev"}));
    REQUIRE(f.app.view_model().is_normal_mode());
}

TEST_CASE("Startup with a failing provider", "[controller]") {
    FakeSessionDataProvider provider;
    provider.error = "tmux error: boom";
    FakeSessionController sessions;
    SessionStore store(&provider);
    AppController app(&store, &sessions);

    app.start();
    REQUIRE(app.view_model().sessions().empty());
    REQUIRE(app.view_model().flash);
    REQUIRE(app.view_model().flash->text == "Refresh failed: tmux error: boom");
    REQUIRE(app.handle_key(KeyEvent::special(KeyCode::Enter)).type == ActionType::None);
}

TEST_CASE("Null dependencies are rejected", "[controller]") {
    FakeSessionDataProvider provider;
    FakeSessionController sessions;
    SessionStore store(&provider);
    REQUIRE_THROWS_AS(AppController(nullptr, &sessions), std::invalid_argument);
    REQUIRE_THROWS_AS(AppController(&store, nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(SessionStore(nullptr), std::invalid_argument);
}

TEST_CASE("Quit keys", "[controller]") {
    ControllerFixture f;
    REQUIRE(f.press('q').type == ActionType::Quit);
    REQUIRE(f.press(KeyCode::Esc).type == ActionType::Quit);
    REQUIRE(f.app.handle_key(KeyEvent::control('c')).type == ActionType::Quit);
    REQUIRE(f.app.handle_key(KeyEvent::control('x')).type == ActionType::None);
}

TEST_CASE("Refresh key", "[controller]") {
    ControllerFixture f;
    REQUIRE(f.press('R').type == ActionType::Refresh);
}

TEST_CASE("Navigation keys move the cursor", "[controller]") {
    ControllerFixture f;

    REQUIRE(f.press('j').type == ActionType::None);
    REQUIRE(f.selection() == TreePath{"dev", "1"});
    (void)f.press(KeyCode::Down);
    REQUIRE(f.selection() == TreePath{"scratch"});
    (void)f.press('k');
    REQUIRE(f.selection() == TreePath{"dev", "1"});
    (void)f.press('G');
    REQUIRE(f.selection() == TreePath{"scratch"});
    (void)f.press('l');
    REQUIRE(f.app.view_model().tree.is_open({"scratch"}));
    (void)f.press('g');
    REQUIRE(f.selection() == TreePath{"dev"});
    (void)f.press('h');
    REQUIRE_FALSE(f.app.view_model().tree.is_open({"dev"}));
}

TEST_CASE("Enter attaches to the selection", "[controller]") {
    ControllerFixture f;

    auto action = f.press(KeyCode::Enter);
    REQUIRE(action.type == ActionType::Attach);
    REQUIRE(action.target == "dev:0");

    (void)f.press('g');
    action = f.press(KeyCode::Enter);
    REQUIRE(action.target == "dev");

    SECTION("PaneRowsAttachToTheirWindow") {
        (void)f.press('b');
        (void)f.press(' ');
        (void)f.press('j');
        REQUIRE(f.selection() == TreePath{"scratch", "0", "0"});
        action = f.press(KeyCode::Enter);
        REQUIRE(action.target == "scratch:0");
    }
}

TEST_CASE("Letter keys jump between sessions", "[controller]") {
    ControllerFixture f;

    SECTION("LowercaseSelects") {
        REQUIRE(f.press('b').type == ActionType::None);
        REQUIRE(f.selection() == TreePath{"scratch", "0"});
    }

    SECTION("UppercaseSelectsAndAttaches") {
        auto action = f.press('B');
        REQUIRE(action.type == ActionType::Attach);
        REQUIRE(action.target == "scratch:0");
    }

    SECTION("OutOfRangeKeepsSelection") {
        REQUIRE(f.press('z').type == ActionType::None);
        REQUIRE(f.selection() == TreePath{"dev", "0"});

        auto action = f.press('Z');
        REQUIRE(action.type == ActionType::Attach);
        REQUIRE(action.target == "dev:0");
    }
}

TEST_CASE("Digit keys jump to windows by position", "[controller]") {
    ControllerFixture f;

    (void)f.press('2');
    REQUIRE(f.selection() == TreePath{"dev", "1"});
    (void)f.press('1');
    REQUIRE(f.selection() == TreePath{"dev", "0"});
    (void)f.press('9');
    REQUIRE(f.selection() == TreePath{"dev", "0"});
}

TEST_CASE("Creating a session", "[controller]") {
    ControllerFixture f;
    const TreePath selected_before = f.selection();
    const auto data_before = f.app.view_model().data;
    (void)f.press('n');
    REQUIRE(std::holds_alternative<CreateSessionMode>(f.app.view_model().mode));

    SECTION("Success") {
        f.type("fooo");
        (void)f.press(KeyCode::Backspace);
        auto action = f.press(KeyCode::Enter);
        REQUIRE(action.type == ActionType::Refresh);
        REQUIRE(f.sessions.created == std::vector<std::string>{"foo"});
        REQUIRE(f.app.view_model().is_normal_mode());
        REQUIRE(f.app.view_model().flash->text == "Created session 'foo'");
    }

    SECTION("NameIsTrimmed") {
        f.type("  foo ");
        (void)f.press(KeyCode::Enter);
        REQUIRE(f.sessions.created == std::vector<std::string>{"foo"});
    }

    SECTION("EmptyNameIsIgnored") {
        f.type("   ");
        REQUIRE(f.press(KeyCode::Enter).type == ActionType::None);
        REQUIRE(f.sessions.created.empty());
        REQUIRE(f.app.view_model().is_normal_mode());
    }

    SECTION("EscapeCancels") {
        f.type("foo");
        REQUIRE(f.press(KeyCode::Esc).type == ActionType::None);
        REQUIRE(f.sessions.created.empty());
        REQUIRE(f.app.view_model().is_normal_mode());
        f.require_unchanged(selected_before, data_before);
    }

    SECTION("QuitKeysAreInput") {
        REQUIRE(f.press('q').type == ActionType::None);
        REQUIRE(std::get<CreateSessionMode>(f.app.view_model().mode).input == "q");
    }

    SECTION("Failure") {
        f.sessions.failure = "Failed to create session: duplicate session: foo";
        f.type("foo");
        REQUIRE(f.press(KeyCode::Enter).type == ActionType::None);
        REQUIRE(f.app.view_model().is_normal_mode());
        REQUIRE(f.app.view_model().flash->text ==
                "Error: Failed to create session: duplicate session: foo");
        REQUIRE(f.store.get_recent_errors().size() == 1);
    }
}

TEST_CASE("Renaming a session", "[controller]") {
    ControllerFixture f;
    const TreePath selected_before = f.selection();
    const auto data_before = f.app.view_model().data;
    (void)f.press('r');

    const auto* mode = std::get_if<RenameSessionMode>(&f.app.view_model().mode);
    REQUIRE(mode);
    REQUIRE(mode->target == "dev");
    REQUIRE(mode->input == "dev");

    SECTION("Success") {
        f.type("2");
        REQUIRE(f.press(KeyCode::Enter).type == ActionType::Refresh);
        REQUIRE(f.sessions.renamed.size() == 1);
        REQUIRE(f.sessions.renamed[0].first == "dev");
        REQUIRE(f.sessions.renamed[0].second == "dev2");
        REQUIRE(f.app.view_model().flash->text == "Renamed 'dev' -> 'dev2'");
    }

    SECTION("SameNameIsNoOp") {
        REQUIRE(f.press(KeyCode::Enter).type == ActionType::None);
        REQUIRE(f.sessions.renamed.empty());
        REQUIRE(f.app.view_model().is_normal_mode());
        f.require_unchanged(selected_before, data_before);
    }

    SECTION("EscapeCancels") {
        f.type("other");
        REQUIRE(f.press(KeyCode::Esc).type == ActionType::None);
        REQUIRE(f.sessions.renamed.empty());
        REQUIRE(f.app.view_model().is_normal_mode());
        f.require_unchanged(selected_before, data_before);
    }

    SECTION("Failure") {
        f.sessions.failure = "Failed to rename session: no such session";
        f.type("x");
        REQUIRE(f.press(KeyCode::Enter).type == ActionType::None);
        REQUIRE(f.app.view_model().flash->text == "Error: Failed to rename session: no such session");
    }
}

TEST_CASE("Killing a session", "[controller]") {
    ControllerFixture f;
    const TreePath selected_before = f.selection();
    const auto data_before = f.app.view_model().data;
    (void)f.press('d');

    const auto* mode = std::get_if<ConfirmKillMode>(&f.app.view_model().mode);
    REQUIRE(mode);
    REQUIRE(mode->target == "dev");

    SECTION("ConfirmWithY") {
        REQUIRE(f.press('y').type == ActionType::Refresh);
        REQUIRE(f.sessions.killed == std::vector<std::string>{"dev"});
        REQUIRE(f.app.view_model().flash->text == "Killed session 'dev'");
    }

    SECTION("ConfirmWithUppercaseY") {
        REQUIRE(f.press('Y').type == ActionType::Refresh);
        REQUIRE(f.sessions.killed.size() == 1);
    }

    SECTION("AnyOtherKeyCancels") {
        REQUIRE(f.press('x').type == ActionType::None);
        REQUIRE(f.sessions.killed.empty());
        REQUIRE(f.app.view_model().is_normal_mode());
        f.require_unchanged(selected_before, data_before);
    }

    SECTION("EnterCancels") {
        REQUIRE(f.press(KeyCode::Enter).type == ActionType::None);
        REQUIRE(f.sessions.killed.empty());
        f.require_unchanged(selected_before, data_before);
    }
}

TEST_CASE("Declining the kill prompt on a session row", "[controller]") {
    ControllerFixture f;
    (void)f.press('g');
    REQUIRE(f.selection() == TreePath{"dev"});
    const auto data_before = f.app.view_model().data;

    (void)f.press('d');
    REQUIRE(std::get<ConfirmKillMode>(f.app.view_model().mode).target == "dev");

    REQUIRE(f.press('x').type == ActionType::None);
    REQUIRE(f.app.view_model().is_normal_mode());
    REQUIRE(f.sessions.killed.empty());
    f.require_unchanged(TreePath{"dev"}, data_before);
    REQUIRE_FALSE(f.app.view_model().flash);
}

TEST_CASE("Reload forgets expansion of vanished sessions", "[controller]") {
    ControllerFixture f;
    REQUIRE(f.app.view_model().tree.is_open({"dev"}));

    f.provider.output = "scratch|$1|0|1|1700000001|0|vim|1|0|vim|/tmp|1\n";
    f.app.reload();
    REQUIRE_FALSE(f.app.view_model().tree.is_open({"dev"}));

    // Recreated under the same name: shown closed
    f.provider.output = kSampleOutput;
    f.app.reload();
    auto visible = f.app.view_model().tree.visible_nodes(f.app.view_model().sessions());
    REQUIRE(visible.size() == 2);

    SECTION("FailedReloadKeepsExpansion") {
        (void)f.press('g');
        (void)f.press('l');
        REQUIRE(f.app.view_model().tree.is_open({"dev"}));
        f.provider.error = "tmux error: gone";
        f.app.reload();
        REQUIRE(f.app.view_model().tree.is_open({"dev"}));
    }
}

TEST_CASE("Commands need a selection", "[controller]") {
    FakeSessionDataProvider provider;
    FakeSessionController sessions;
    SessionStore store(&provider);
    AppController app(&store, &sessions);
    app.start();

    (void)app.handle_key(KeyEvent::character('d'));
    REQUIRE(app.view_model().is_normal_mode());
    (void)app.handle_key(KeyEvent::character('r'));
    REQUIRE(app.view_model().is_normal_mode());
    (void)app.handle_key(KeyEvent::character('n'));
    REQUIRE(std::holds_alternative<CreateSessionMode>(app.view_model().mode));
}
