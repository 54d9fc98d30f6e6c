#pragma once

#include <string>
#include <string_view>

namespace tmxu {

// Strip leading and trailing ASCII whitespace
[[nodiscard]] std::string_view trim(std::string_view s);
[[nodiscard]] std::string trim_copy(std::string_view s);

} // namespace tmxu
