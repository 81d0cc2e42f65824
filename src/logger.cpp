#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>

namespace {
std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

logger::Level& log_level_ref() {
    static logger::Level lvl = logger::Level::Info;
    return lvl;
}

bool& console_enabled_ref() {
    static bool enabled = true;
    return enabled;
}

std::unique_ptr<std::ofstream>& log_file_ref() {
    static std::unique_ptr<std::ofstream> f;
    return f;
}

// In-memory log buffer (ring)
std::vector<std::string>& log_buffer() {
    static std::vector<std::string> b;
    return b;
}
constexpr std::size_t kLogBufferMax = 2000; // keep last 2000 lines

std::string now_timestamp() {
    using namespace std::chrono;
    auto tp = system_clock::now();
    std::time_t tt = system_clock::to_time_t(tp);
    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &tt);
#else
    localtime_r(&tt, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void write_line(logger::Level level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::ostringstream line;
    line << "[" << now_timestamp() << "] [" << logger::to_string(level) << "] " << msg << '\n';
    const std::string text = line.str();

    if (console_enabled_ref()) {
        std::cerr << text;
    }

    if (auto& f = log_file_ref()) {
        (*f) << text;
        f->flush();
    }

    auto& buf = log_buffer();
    buf.push_back(text);
    if (buf.size() > kLogBufferMax) {
        buf.erase(buf.begin(), buf.begin() + (buf.size() - kLogBufferMax));
    }
}
} // namespace

namespace logger {

Level level_from_string(const std::string& name) {
    std::string l = name;
    std::transform(l.begin(), l.end(), l.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (l == "warn" || l == "warning") return Level::Warn;
    if (l == "error") return Level::Error;
    return Level::Info;
}

const char* to_string(Level level) {
    switch (level) {
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    case Level::Info:
    default:
        return "INFO";
    }
}

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex());
    auto& f = log_file_ref();
    if (f) {
        f->flush();
        f.reset();
    }
    if (!path.empty()) {
        auto stream = std::make_unique<std::ofstream>(path, std::ios::app);
        if (stream->is_open()) {
            f = std::move(stream);
        }
        // otherwise fall back to console only
    }
}

void set_level(Level level) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_level_ref() = level;
}

Level level() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_level_ref();
}

void set_console(bool enabled) {
    std::lock_guard<std::mutex> lock(log_mutex());
    console_enabled_ref() = enabled;
}

void info(const std::string& msg) {
    if (level() <= Level::Info) {
        write_line(Level::Info, msg);
    }
}

void warn(const std::string& msg) {
    if (level() <= Level::Warn) {
        write_line(Level::Warn, msg);
    }
}

void error(const std::string& msg) {
    // Always print errors
    write_line(Level::Error, msg);
}

// --- In-memory log buffer API ---
std::vector<std::string> lines() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_buffer();
}

void clear() {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_buffer().clear();
}

std::size_t line_count() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_buffer().size();
}

} // namespace logger
