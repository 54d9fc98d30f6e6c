#include "tmux_session_data_provider.hpp"
#include "command_runner.hpp"
#include "../string_utils.hpp"
#include "../session_parser.hpp"
#include <format>

namespace tmxu {

TmuxSessionDataProvider::TmuxSessionDataProvider(std::string tmux_binary)
    : tmux_binary_(std::move(tmux_binary))
{
}

bool TmuxSessionDataProvider::is_idle_server_message(const std::string& stderr_text) {
    return stderr_text.find("no server running") != std::string::npos ||
           stderr_text.find("no sessions") != std::string::npos;
}

SessionQueryResult TmuxSessionDataProvider::list_sessions() {
    SessionQueryResult result;

    auto output = CommandRunner::run({tmux_binary_, "list-panes", "-aF", kListPanesFormat});
    if (!output.spawned) {
        result.error_message = std::format("Failed to run tmux list-panes: {}", output.error_message);
        return result;
    }

    if (output.exit_code != 0) {
        if (is_idle_server_message(output.stderr_text)) {
            result.success = true;
            return result;
        }
        result.error_message = std::format("tmux error: {}", trim_copy(output.stderr_text));
        return result;
    }

    result.success = true;
    result.sessions = parse_sessions(output.stdout_text);
    return result;
}

bool TmuxSessionDataProvider::is_available() {
    // Only whether tmux runs; a server need not be up
    return CommandRunner::run({tmux_binary_, "list-sessions"}).spawned;
}

} // namespace tmxu
