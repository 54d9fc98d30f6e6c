#include "string_utils.hpp"

namespace tmxu {

std::string_view trim(std::string_view s) {
    constexpr std::string_view whitespace = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(whitespace);
    if (start == std::string_view::npos) return {};
    size_t end = s.find_last_not_of(whitespace);
    return s.substr(start, end - start + 1);
}

std::string trim_copy(std::string_view s) {
    return std::string(trim(s));
}

} // namespace tmxu
