#pragma once

#include <string>

#include "lcr/log/logger.hpp"


namespace fluxwire::examples {

    inline void set_log_level(const std::string& log_level) {
        using namespace lcr::log;
        Logger::instance().set_level(level_from_string(log_level));
    }

} // namespace fluxwire::examples
