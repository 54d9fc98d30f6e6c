#include "../platform_factory.hpp"

#include "tmux_session_data_provider.hpp"
#include "tmux_session_controller.hpp"

namespace tmxu {

std::unique_ptr<ISessionDataProvider> make_session_data_provider() {
    return std::make_unique<TmuxSessionDataProvider>();
}

std::unique_ptr<ISessionController> make_session_controller() {
    return std::make_unique<TmuxSessionController>();
}

} // namespace tmxu
