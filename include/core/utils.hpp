#pragma once

#include <array>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace tracectx::utils {

// ============================================================================
// Hex Encoding
// ============================================================================

inline constexpr std::string_view kHexDigits = "0123456789abcdef";

// Encode bytes as lowercase hex
template<std::size_t N>
[[nodiscard]] inline std::string bytes_to_hex(const std::array<uint8_t, N>& bytes) {
    std::string out;
    out.resize(N * 2);
    for (std::size_t i = 0; i < N; ++i) {
        out[i * 2 + 0] = kHexDigits[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHexDigits[bytes[i] & 0xF];
    }
    return out;
}

// Decode exactly N bytes of hex (either case); nullopt on wrong length or bad digit
template<std::size_t N>
[[nodiscard]] inline std::optional<std::array<uint8_t, N>> hex_to_bytes(std::string_view hex) {
    if (hex.size() != N * 2) return std::nullopt;

    std::array<uint8_t, N> bytes{};
    for (std::size_t i = 0; i < N; ++i) {
        unsigned int val{};
        const auto* first = hex.data() + i * 2;
        const auto [ptr, ec] = std::from_chars(first, first + 2, val, 16);
        // from_chars accepts a single digit, so require both consumed
        if (ec != std::errc{} || ptr != first + 2) return std::nullopt;
        bytes[i] = static_cast<uint8_t>(val);
    }
    return bytes;
}

// ============================================================================
// Numeric Parsing (std::from_chars — no exceptions, no locale, no allocations)
// ============================================================================

// Parse integer, returns std::nullopt on failure (for cases where 0 is ambiguous)
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline void write(Level level, const std::string& msg) {
        const char* tag = "";
        switch (level) {
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

} // namespace tracectx::utils
