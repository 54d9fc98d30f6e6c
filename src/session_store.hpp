#pragma once

#include "session_info.hpp"
#include "errors.hpp"
#include "interfaces/i_session_data_provider.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace tmxu {

// Immutable view of one refresh. Replaced wholesale, never patched.
struct SessionSnapshot {
    std::vector<SessionInfo> sessions;

    // Timestamp of this snapshot
    std::chrono::steady_clock::time_point timestamp;

    [[nodiscard]] const SessionInfo* find_session(const std::string& name) const;
};

class SessionStore {
public:
    // Non-owning: provider must outlive the store
    explicit SessionStore(ISessionDataProvider* provider);

    // Query the provider and swap in a new snapshot on success. On failure
    // the previous snapshot stays current and the error is recorded.
    CommandResult refresh();

    // Current snapshot, never null
    [[nodiscard]] std::shared_ptr<const SessionSnapshot> get_snapshot() const;

    // Errors from the last 10 seconds, oldest first
    void record_error(const std::string& message);
    [[nodiscard]] std::vector<ErrorRecord> get_recent_errors() const;
    void clear_errors();

private:
    ISessionDataProvider* provider_ = nullptr;
    std::shared_ptr<const SessionSnapshot> current_snapshot_;

    std::vector<ErrorRecord> recent_errors_;
    static constexpr size_t kMaxErrors = 10;
    static constexpr std::chrono::seconds kErrorWindow{10};
};

} // namespace tmxu
