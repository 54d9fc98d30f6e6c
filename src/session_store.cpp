#include "session_store.hpp"
#include <stdexcept>

namespace tmxu {

const SessionInfo* SessionSnapshot::find_session(const std::string& name) const {
    for (const auto& session : sessions) {
        if (session.name == name) return &session;
    }
    return nullptr;
}

SessionStore::SessionStore(ISessionDataProvider* provider)
    : provider_(provider)
{
    if (!provider_) {
        throw std::invalid_argument("SessionStore requires a data provider");
    }

    // Create initial empty snapshot
    auto empty = std::make_shared<SessionSnapshot>();
    empty->timestamp = std::chrono::steady_clock::now();
    current_snapshot_ = std::move(empty);
}

CommandResult SessionStore::refresh() {
    CommandResult result;

    auto query = provider_->list_sessions();
    if (!query.success) {
        result.error_message = query.error_message;
        record_error(query.error_message);
        return result;
    }

    auto new_snapshot = std::make_shared<SessionSnapshot>();
    new_snapshot->timestamp = std::chrono::steady_clock::now();
    new_snapshot->sessions = std::move(query.sessions);
    current_snapshot_ = std::move(new_snapshot);

    result.success = true;
    return result;
}

std::shared_ptr<const SessionSnapshot> SessionStore::get_snapshot() const {
    return current_snapshot_;
}

void SessionStore::record_error(const std::string& message) {
    recent_errors_.push_back({std::chrono::steady_clock::now(), message});
    if (recent_errors_.size() > kMaxErrors) {
        recent_errors_.erase(recent_errors_.begin());
    }
}

std::vector<ErrorRecord> SessionStore::get_recent_errors() const {
    auto cutoff = std::chrono::steady_clock::now() - kErrorWindow;
    std::vector<ErrorRecord> result;
    for (const auto& err : recent_errors_) {
        if (err.timestamp > cutoff) {
            result.push_back(err);
        }
    }
    return result;
}

void SessionStore::clear_errors() {
    recent_errors_.clear();
}

} // namespace tmxu
