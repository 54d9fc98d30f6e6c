#pragma once

#include "interfaces/i_session_controller.hpp"
#include "interfaces/i_session_data_provider.hpp"
#include "session_parser.hpp"
#include <string>
#include <utility>
#include <vector>

// Serves canned list-panes output through the real parser
class FakeSessionDataProvider : public tmxu::ISessionDataProvider {
public:
    tmxu::SessionQueryResult list_sessions() override {
        ++query_count;
        tmxu::SessionQueryResult result;
        if (!error.empty()) {
            result.error_message = error;
            return result;
        }
        result.success = true;
        result.sessions = tmxu::parse_sessions(output);
        return result;
    }

    bool is_available() override { return true; }

    std::string output;
    std::string error;
    int query_count = 0;
};

class FakeSessionController : public tmxu::ISessionController {
public:
    tmxu::CommandResult create_session(const std::string& name) override {
        created.push_back(name);
        return next_result();
    }

    tmxu::CommandResult rename_session(const std::string& old_name, const std::string& new_name) override {
        renamed.emplace_back(old_name, new_name);
        return next_result();
    }

    tmxu::CommandResult kill_session(const std::string& name) override {
        killed.push_back(name);
        return next_result();
    }

    std::string failure;  // Non-empty makes every call fail with this message
    std::vector<std::string> created;
    std::vector<std::pair<std::string, std::string>> renamed;
    std::vector<std::string> killed;

private:
    tmxu::CommandResult next_result() const {
        tmxu::CommandResult result;
        result.success = failure.empty();
        result.error_message = failure;
        return result;
    }
};

// Two sessions: "dev" with windows 0 and 1, "scratch" with one window of two panes
inline constexpr const char* kSampleOutput =
    "dev|$0|1|2|1700000000|0|zsh|1|0|zsh|/home/user|1\n"
    "dev|$0|1|2|1700000000|1|make|0|0|make|/home/user/project|1\n"
    "scratch|$1|0|1|1700000001|0|vim|1|0|vim|/tmp|1\n"
    "scratch|$1|0|1|1700000001|0|vim|1|1|bash|/tmp|0\n";
