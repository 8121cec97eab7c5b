#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <cctype>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <atomic>
#include <optional>
#include <vector>

namespace wgpeers::utils {

// ============================================================================
// String Utilities
// ============================================================================

inline constexpr std::string_view kWhitespace = " \t\n\r\v\f";

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

// Returns a view into the input; no allocation.
[[nodiscard]] inline std::string_view trim(std::string_view str) {
    const auto start = str.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) {
        return {};
    }
    const auto end = str.find_last_not_of(kWhitespace);
    return str.substr(start, end - start + 1);
}

/**
 * @brief Case-insensitive prefix test.
 *
 * Only the prefix window of @p line is case-folded; the rest of the line is
 * never touched, so multi-byte text after the key stays intact.
 *
 * @param line Line to test
 * @param lower_prefix Expected prefix, already lower-case ASCII
 */
[[nodiscard]] inline bool starts_with_ci(std::string_view line, std::string_view lower_prefix) {
    if (line.size() < lower_prefix.size()) return false;
    for (size_t i = 0; i < lower_prefix.size(); ++i) {
        const auto c = static_cast<char>(std::tolower(static_cast<unsigned char>(line[i])));
        if (c != lower_prefix[i]) return false;
    }
    return true;
}

// Slice after the first occurrence of c; the whole input when c is absent.
[[nodiscard]] inline std::string_view after_char(std::string_view str, char c) {
    const auto pos = str.find(c);
    if (pos == std::string_view::npos) return str;
    return str.substr(pos + 1);
}

/**
 * @brief Split text into lines.
 *
 * Lines end at '\n'; one trailing '\r' is stripped from each line. Text ending
 * with a newline does not produce a final empty line.
 */
[[nodiscard]] inline std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (level < min_level().load(std::memory_order_relaxed)) return;

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::min_level().store(level, std::memory_order_relaxed);
}

inline Level level() {
    return detail::min_level().load(std::memory_order_relaxed);
}

inline bool enabled(Level level) {
    return level >= detail::min_level().load(std::memory_order_relaxed);
}

// Accepts "debug", "info", "warn"/"warning", "error" in any case
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    const std::string lower = to_lower(trim(name));
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace wgpeers::utils
