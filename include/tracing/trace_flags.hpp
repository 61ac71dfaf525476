#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace tracectx {

/**
 * @brief W3C trace-flags byte
 *
 * Only the RECORDED ("sampled") bit is defined; other bits are carried through
 * untouched so unknown flags survive a round trip.
 */
enum class TraceFlags : uint8_t {
    NONE     = 0x00,
    RECORDED = 0x01,
};

[[nodiscard]] constexpr TraceFlags operator|(TraceFlags a, TraceFlags b) {
    return static_cast<TraceFlags>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

[[nodiscard]] constexpr TraceFlags operator&(TraceFlags a, TraceFlags b) {
    return static_cast<TraceFlags>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

[[nodiscard]] constexpr bool has_flag(TraceFlags flags, TraceFlags flag) {
    return (flags & flag) == flag;
}

// Sampling state only; bits other than RECORDED do not change the name
[[nodiscard]] constexpr std::string_view trace_flags_to_string(TraceFlags flags) {
    return has_flag(flags, TraceFlags::RECORDED) ? "recorded" : "none";
}

// Integer value from config or CLI; nullopt unless it fits in one byte
[[nodiscard]] constexpr std::optional<TraceFlags> parse_trace_flags(int64_t value) {
    if (value < 0 || value > 0xFF) return std::nullopt;
    return static_cast<TraceFlags>(value);
}

} // namespace tracectx
