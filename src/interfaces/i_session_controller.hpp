#pragma once

#include "../errors.hpp"
#include <string>

namespace tmxu {

class ISessionController {
public:
    virtual ~ISessionController() = default;

    virtual CommandResult create_session(const std::string& name) = 0;
    virtual CommandResult rename_session(const std::string& old_name, const std::string& new_name) = 0;
    virtual CommandResult kill_session(const std::string& name) = 0;
};

} // namespace tmxu
