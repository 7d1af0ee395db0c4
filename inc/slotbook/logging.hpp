#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace slotbook::log {

    // Shared "slotbook" logger; created on first use with a colored stdout sink.
    std::shared_ptr<spdlog::logger> get();

    // Unknown level names fall back to info.
    void init(const std::string& level, const std::string& pattern);

} // namespace slotbook::log
