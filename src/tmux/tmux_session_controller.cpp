#include "tmux_session_controller.hpp"
#include "command_runner.hpp"
#include "../string_utils.hpp"
#include <format>

namespace tmxu {

TmuxSessionController::TmuxSessionController(std::string tmux_binary)
    : tmux_binary_(std::move(tmux_binary))
{
}

CommandResult TmuxSessionController::run_tmux(const std::vector<std::string>& args,
                                              const char* failure_prefix) const {
    CommandResult result;

    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(tmux_binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    auto output = CommandRunner::run(argv);
    if (!output.spawned) {
        result.error_message = std::format("{}: {}", failure_prefix, output.error_message);
        return result;
    }
    if (output.exit_code != 0) {
        result.error_message = std::format("{}: {}", failure_prefix, trim_copy(output.stderr_text));
        return result;
    }

    result.success = true;
    return result;
}

CommandResult TmuxSessionController::create_session(const std::string& name) {
    return run_tmux({"new-session", "-d", "-s", name}, "Failed to create session");
}

CommandResult TmuxSessionController::rename_session(const std::string& old_name, const std::string& new_name) {
    return run_tmux({"rename-session", "-t", old_name, new_name}, "Failed to rename session");
}

CommandResult TmuxSessionController::kill_session(const std::string& name) {
    return run_tmux({"kill-session", "-t", name}, "Failed to kill session");
}

} // namespace tmxu
