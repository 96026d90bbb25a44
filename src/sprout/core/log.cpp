#include "sprout/core/log.hpp"
#include <mutex>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace sprout::core {

    namespace {
        constexpr const char *kLoggerName = "sprout";

        std::mutex &loggerMutex() {
            static std::mutex mutex;
            return mutex;
        }

        std::shared_ptr<spdlog::logger> &loggerSlot() {
            static std::shared_ptr<spdlog::logger> slot;
            return slot;
        }

        std::shared_ptr<spdlog::logger> makeDefaultLogger() {
            auto existing = spdlog::get(kLoggerName);
            if (existing) {
                return existing;
            }
            auto created = spdlog::stdout_color_mt(kLoggerName);
            created->set_level(spdlog::level::info);
            created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");
            spdlog::cfg::load_env_levels();
            return created;
        }
    } // namespace

    std::shared_ptr<spdlog::logger> logger() {
        std::lock_guard<std::mutex> lock(loggerMutex());
        auto &slot = loggerSlot();
        if (!slot) {
            slot = makeDefaultLogger();
        }
        return slot;
    }

    void setLogger(std::shared_ptr<spdlog::logger> logger) {
        std::lock_guard<std::mutex> lock(loggerMutex());
        loggerSlot() = std::move(logger);
    }

} // namespace sprout::core
