#pragma once
#include <memory>
#include <spdlog/logger.h>

namespace sprout::core {

    // Shared "sprout" logger. Created on first use with a colored stdout sink at
    // info level; SPDLOG_LEVEL in the environment overrides the level.
    std::shared_ptr<spdlog::logger> logger();

    // Replace the library logger. Passing nullptr restores the default one.
    void setLogger(std::shared_ptr<spdlog::logger> logger);

} // namespace sprout::core
