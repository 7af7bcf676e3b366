#pragma once

#include <unistd.h>
#include <string>
#include <string_view>
#include <optional>
#include <atomic>
#include <mutex>
#include <ctime>

namespace leakscan::compact {

enum class Level {
    Debug = 0,
    Info,
    Warn,
    Error,
    Off
};

inline std::optional<Level> parse_level(std::string_view name) {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "off") return Level::Off;
    return std::nullopt;
}

// Unbuffered line logger: one ::write per record, serialized process-wide
class Log {
public:
    static void set_level(Level level) { threshold().store(level); }
    static Level level() { return threshold().load(); }

    // Redirect output, e.g. to a pipe in tests. Defaults to stderr.
    static void set_fd(int fd) { output_fd().store(fd); }

    static bool enabled(Level level) {
        return level != Level::Off && static_cast<int>(level) >= static_cast<int>(threshold().load());
    }

    static void debug(std::string_view tag, std::string_view msg) { write(Level::Debug, tag, msg); }
    static void info(std::string_view tag, std::string_view msg) { write(Level::Info, tag, msg); }
    static void warn(std::string_view tag, std::string_view msg) { write(Level::Warn, tag, msg); }
    static void error(std::string_view tag, std::string_view msg) { write(Level::Error, tag, msg); }

    static void write(Level level, std::string_view tag, std::string_view msg) {
        if (!enabled(level)) return;

        std::string line;
        line.reserve(msg.size() + tag.size() + 40);
        append_timestamp(line);
        line += ' ';
        line += label(level);
        line += " [";
        line += tag;
        line += "] ";
        line += msg;
        line += '\n';

        std::lock_guard<std::mutex> lock(get_mutex());
        const char* p = line.data();
        size_t left = line.size();
        int fd = output_fd().load();
        while (left > 0) {
            ssize_t n = ::write(fd, p, left);
            if (n <= 0) break;
            p += n;
            left -= static_cast<size_t>(n);
        }
    }

private:
    static std::string_view label(Level level) {
        switch (level) {
            case Level::Debug: return "DEBUG";
            case Level::Info: return "INFO ";
            case Level::Warn: return "WARN ";
            case Level::Error: return "ERROR";
            default: return "     ";
        }
    }

    static void append_timestamp(std::string& out) {
        std::time_t now = std::time(nullptr);
        std::tm tm{};
        gmtime_r(&now, &tm);
        char buf[32];
        size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
        out.append(buf, n);
    }

    static std::atomic<Level>& threshold() {
        static std::atomic<Level> level{Level::Info};
        return level;
    }

    static std::atomic<int>& output_fd() {
        static std::atomic<int> fd{STDERR_FILENO};
        return fd;
    }

    static std::mutex& get_mutex() {
        static std::mutex m;
        return m;
    }
};

} // namespace leakscan::compact
