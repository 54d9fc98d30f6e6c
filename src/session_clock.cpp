#include "session_clock.hpp"
#include "viewmodels/app_view_model.hpp"

namespace tmxu {

SessionClock::SessionClock(TimePoint last_refresh)
    : last_refresh_(last_refresh)
{
}

bool SessionClock::is_expired(const FlashMessage& flash, TimePoint now) {
    return now - flash.created >= kFlashLifetime;
}

bool SessionClock::refresh_due(TimePoint now) const {
    return now - last_refresh_ >= kAutoRefreshInterval;
}

bool SessionClock::tick(TimePoint now, std::optional<FlashMessage>& flash) const {
    if (flash && is_expired(*flash, now)) {
        flash.reset();
    }
    return refresh_due(now);
}

} // namespace tmxu
