// src/utils/logging.cpp
#include "alm/utils/logging.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <unordered_set>

namespace alm {
namespace logging {

namespace {
    std::atomic<int> g_level{static_cast<int>(Level::Info)};
    std::mutex g_output_mutex;
    std::mutex g_once_mutex;
    std::unordered_set<std::string> g_warned;

    const char* level_tag(Level level) {
        switch (level) {
            case Level::Debug: return "[DEBUG] ";
            case Level::Info: return "[INFO] ";
            case Level::Warning: return "[WARNING] ";
            case Level::Error: return "[ERROR] ";
        }
        return "";
    }
}

void set_level(Level level) {
    g_level.store(static_cast<int>(level));
}

Level get_level() {
    return static_cast<Level>(g_level.load());
}

void log(Level level, const std::string& message) {
    if (static_cast<int>(level) < g_level.load()) return;

    std::lock_guard<std::mutex> lock(g_output_mutex);
    if (level >= Level::Warning) {
        std::cerr << level_tag(level) << message << std::endl;
    } else {
        std::cout << level_tag(level) << message << std::endl;
    }
}

void warn_once(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(g_once_mutex);
        if (!g_warned.insert(message).second) {
            return;
        }
    }
    warning(message);
}

} // namespace logging
} // namespace alm
