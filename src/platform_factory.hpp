#pragma once

#include "interfaces/i_session_data_provider.hpp"
#include "interfaces/i_session_controller.hpp"
#include <memory>

namespace tmxu {

// Factory functions for the multiplexer backend.
// Current build provides tmux implementations.
std::unique_ptr<ISessionDataProvider> make_session_data_provider();
std::unique_ptr<ISessionController> make_session_controller();

} // namespace tmxu
