#pragma once

#include <chrono>
#include <optional>

namespace tmxu {

struct FlashMessage;

// Time-based housekeeping. Evaluated once per loop iteration, so actual
// resolution is bounded by the input poll timeout.
class SessionClock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    static constexpr std::chrono::seconds kFlashLifetime{3};
    static constexpr std::chrono::seconds kAutoRefreshInterval{2};

    explicit SessionClock(TimePoint last_refresh = std::chrono::steady_clock::now());

    // Clears an expired flash. Returns true if an auto-refresh is due.
    [[nodiscard]] bool tick(TimePoint now, std::optional<FlashMessage>& flash) const;

    [[nodiscard]] static bool is_expired(const FlashMessage& flash, TimePoint now);
    [[nodiscard]] bool refresh_due(TimePoint now) const;

    // Called for every refresh attempt, successful or not
    void mark_refreshed(TimePoint now) { last_refresh_ = now; }
    [[nodiscard]] TimePoint last_refresh() const { return last_refresh_; }

private:
    TimePoint last_refresh_;
};

} // namespace tmxu
