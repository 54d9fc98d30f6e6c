#pragma once

#include "../session_info.hpp"
#include <string>
#include <vector>

namespace tmxu {

struct SessionQueryResult {
    bool success = false;
    std::vector<SessionInfo> sessions;
    std::string error_message;
};

class ISessionDataProvider {
public:
    virtual ~ISessionDataProvider() = default;

    // One bulk query for every session, window and pane. An idle server
    // ("no server running", "no sessions") is a success with no sessions.
    virtual SessionQueryResult list_sessions() = 0;

    // Whether the multiplexer binary can be run at all
    [[nodiscard]] virtual bool is_available() = 0;
};

} // namespace tmxu
