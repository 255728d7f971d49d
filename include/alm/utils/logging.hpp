// include/alm/utils/logging.hpp
#pragma once

#include <string>

namespace alm {
namespace logging {

enum class Level {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

// Messages below the threshold are dropped. Default is Info.
void set_level(Level level);
Level get_level();

// Debug and info go to stdout, warnings and errors to stderr
void log(Level level, const std::string& message);

inline void debug(const std::string& message) { log(Level::Debug, message); }
inline void info(const std::string& message) { log(Level::Info, message); }
inline void warning(const std::string& message) { log(Level::Warning, message); }
inline void error(const std::string& message) { log(Level::Error, message); }

// Emit a warning only the first time this exact message is seen
void warn_once(const std::string& message);

} // namespace logging
} // namespace alm
