#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace logger {

enum class Level {
    Info = 0,
    Warn = 1,
    Error = 2
};

// "info" | "warn" | "error" (case-insensitive). Unknown names map to Info.
Level level_from_string(const std::string& name);
const char* to_string(Level level);

// Optionally write to a file in addition to the console.
void set_log_file(const std::string& path);   // empty path disables file logging
void set_level(Level level);
Level level();

// Console lines go to stderr; stdout is reserved for command output.
void set_console(bool enabled);

// Log APIs
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

// In-memory ring buffer of the most recent lines.
// Returns a copy of current log lines (thread-safe snapshot).
std::vector<std::string> lines();

// Clears the in-memory buffer (does not affect file/console).
void clear();

// Current number of lines in the in-memory buffer.
std::size_t line_count();

} // namespace logger
