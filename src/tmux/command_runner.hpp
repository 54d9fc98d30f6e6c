#pragma once

#include <string>
#include <vector>

namespace tmxu {

struct CommandOutput {
    bool spawned = false;       // false if fork/exec itself failed
    int exit_code = -1;         // -1 when terminated by a signal
    std::string stdout_text;
    std::string stderr_text;
    std::string error_message;  // Set when !spawned

    [[nodiscard]] bool succeeded() const { return spawned && exit_code == 0; }
};

// Runs a program found via PATH with the given argv (no shell involved),
// blocking until it exits. Stdin is /dev/null.
class CommandRunner {
public:
    [[nodiscard]] static CommandOutput run(const std::vector<std::string>& argv);

private:
    static void drain(int stdout_fd, int stderr_fd, std::string& out, std::string& err);
};

} // namespace tmxu
