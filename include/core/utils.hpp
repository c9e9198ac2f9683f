#pragma once

#include <openssl/crypto.h>

#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace kvault::utils {

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Format a time point as UTC ISO-8601 with second precision
 * ("2026-10-19T08:30:00Z"). This is the wire format of the `expires` tag.
 */
inline std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto time = std::chrono::system_clock::to_time_t(tp);

    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return time_buf;
}

/**
 * @brief Parse "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and a
 * trailing 'Z'. Offsets other than UTC are rejected.
 */
[[nodiscard]] inline std::optional<std::chrono::system_clock::time_point>
parse_iso8601(std::string_view text) {
    if (text.size() < 19) return std::nullopt;

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    const auto field = [&](size_t pos, size_t len, int& out) {
        const auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + len, out);
        return ec == std::errc{} && ptr == text.data() + pos + len;
    };

    if (!field(0, 4, year) || text[4] != '-' || !field(5, 2, month) || text[7] != '-' ||
        !field(8, 2, day) || (text[10] != 'T' && text[10] != ' ') || !field(11, 2, hour) ||
        text[13] != ':' || !field(14, 2, minute) || text[16] != ':' || !field(17, 2, second)) {
        return std::nullopt;
    }

    size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') ++pos;
    }
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) ++pos;
    if (pos != text.size()) return std::nullopt;

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    const std::chrono::year_month_day ymd{
        std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
        std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) return std::nullopt;

    return std::chrono::sys_days{ymd} + std::chrono::hours{hour} +
           std::chrono::minutes{minute} + std::chrono::seconds{second};
}

inline std::chrono::system_clock::time_point from_unix_seconds(int64_t seconds) {
    return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
}

inline int64_t to_unix_seconds(const std::chrono::system_clock::time_point& tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

// ============================================================================
// Numeric Parsing
// ============================================================================

template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(std::string_view str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return std::string(str.substr(start, end - start + 1));
}

inline std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;
    while (std::getline(iss, token, delimiter)) {
        tokens.emplace_back(std::move(token));
    }
    return tokens;
}

[[nodiscard]] inline std::string hex_encode(const uint8_t* data, size_t len) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += kDigits[data[i] >> 4];
        out += kDigits[data[i] & 0x0F];
    }
    return out;
}

/**
 * @brief Percent-encode for application/x-www-form-urlencoded bodies and
 * query strings (RFC 3986 unreserved set passes through).
 */
[[nodiscard]] inline std::string url_encode(std::string_view s) {
    std::string out;
    out.reserve(s.size() + s.size() / 4);
    for (const char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += c;
        } else {
            out += std::format("%{:02X}", static_cast<unsigned>(uc));
        }
    }
    return out;
}

/**
 * @brief Overwrite a transient string's whole allocation, then empty it.
 * Used for formatted Authorization headers and raw bodies carrying values.
 */
inline void secure_wipe(std::string& s) noexcept {
    if (s.capacity() > 0) {
        OPENSSL_cleanse(s.data(), s.capacity());
    }
    s.clear();
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

/// Accepts "debug", "info", "warn"/"warning", "error"; unknown names keep INFO.
inline Level parse_level(std::string_view name) {
    const auto lower = to_lower(name);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return Level::INFO;
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

} // namespace kvault::utils
