#pragma once

#include "../interfaces/i_session_data_provider.hpp"
#include <string>

namespace tmxu {

class TmuxSessionDataProvider : public ISessionDataProvider {
public:
    explicit TmuxSessionDataProvider(std::string tmux_binary = "tmux");
    ~TmuxSessionDataProvider() override = default;

    SessionQueryResult list_sessions() override;
    [[nodiscard]] bool is_available() override;

    // stderr from an idle server is not an error
    [[nodiscard]] static bool is_idle_server_message(const std::string& stderr_text);

private:
    std::string tmux_binary_;
};

} // namespace tmxu
