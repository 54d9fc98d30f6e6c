#pragma once

#include "../session_store.hpp"
#include "../tree_state.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace tmxu {

// Interaction modes. Normal is the resting state; every other mode returns
// to Normal on completion, cancellation or error.
struct NormalMode {};

struct CreateSessionMode {
    std::string input;
};

struct RenameSessionMode {
    std::string target;
    std::string input;
};

struct ConfirmKillMode {
    std::string target;
};

using Mode = std::variant<NormalMode, CreateSessionMode, RenameSessionMode, ConfirmKillMode>;

// Transient status line message
struct FlashMessage {
    std::string text;
    std::chrono::steady_clock::time_point created;
};

// Everything the renderer reads
struct AppViewModel {
    std::shared_ptr<const SessionSnapshot> data;
    TreeState tree;
    Mode mode;
    std::optional<FlashMessage> flash;

    [[nodiscard]] const std::vector<SessionInfo>& sessions() const { return data->sessions; }
    [[nodiscard]] bool is_normal_mode() const { return std::holds_alternative<NormalMode>(mode); }
};

} // namespace tmxu
