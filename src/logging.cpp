#include <slotbook/logging.hpp>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace slotbook::log {

    std::shared_ptr<spdlog::logger> get() {
        static std::once_flag once;
        static std::shared_ptr<spdlog::logger> logger;
        std::call_once(once, [] {
            logger = spdlog::get("slotbook");
            if (!logger) {
                logger = spdlog::stdout_color_mt("slotbook");
            }
        });
        return logger;
    }

    void init(const std::string& level, const std::string& pattern) {
        auto logger = get();
        auto lvl = spdlog::level::from_str(level);
        if (lvl == spdlog::level::off && level != "off") {
            lvl = spdlog::level::info;
        }
        logger->set_level(lvl);
        logger->set_pattern(pattern);
    }

} // namespace slotbook::log
