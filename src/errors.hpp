#pragma once

#include <chrono>
#include <string>

namespace tmxu {

// Timestamped error kept for the status bar
struct ErrorRecord {
    std::chrono::steady_clock::time_point timestamp;
    std::string message;
};

// Outcome of a tmux command that produces no data
struct CommandResult {
    bool success = false;
    std::string error_message;  // Trimmed stderr-like text when !success
};

} // namespace tmxu
