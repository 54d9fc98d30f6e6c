#pragma once

#include "../interfaces/i_session_controller.hpp"
#include <string>
#include <vector>

namespace tmxu {

class TmuxSessionController : public ISessionController {
public:
    explicit TmuxSessionController(std::string tmux_binary = "tmux");
    ~TmuxSessionController() override = default;

    CommandResult create_session(const std::string& name) override;
    CommandResult rename_session(const std::string& old_name, const std::string& new_name) override;
    CommandResult kill_session(const std::string& name) override;

private:
    CommandResult run_tmux(const std::vector<std::string>& args, const char* failure_prefix) const;

    std::string tmux_binary_;
};

} // namespace tmxu
