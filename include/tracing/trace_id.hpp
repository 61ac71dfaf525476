#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace tracectx {

/**
 * @brief 128-bit W3C trace identifier
 *
 * Hex form: 32 lowercase hex chars. The all-zero value is the default
 * ("empty") id and is never a valid trace id.
 */
class TraceId {
public:
    static constexpr std::size_t kSize = 16;
    using Bytes = std::array<uint8_t, kSize>;

    TraceId() = default;

    [[nodiscard]] static TraceId from_bytes(std::span<const uint8_t, kSize> bytes);

    /// Parse 32 hex chars (either case); nullopt on wrong length or non-hex
    [[nodiscard]] static std::optional<TraceId> from_hex(std::string_view hex);

    /// Random non-empty id
    [[nodiscard]] static TraceId create_random();

    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] bool is_empty() const;
    [[nodiscard]] const Bytes& bytes() const { return bytes_; }
    [[nodiscard]] std::size_t hash() const;

    bool operator==(const TraceId& other) const = default;

private:
    explicit TraceId(const Bytes& bytes) : bytes_(bytes) {}

    Bytes bytes_{};
};

/**
 * @brief 64-bit W3C span identifier (16 hex chars)
 */
class SpanId {
public:
    static constexpr std::size_t kSize = 8;
    using Bytes = std::array<uint8_t, kSize>;

    SpanId() = default;

    [[nodiscard]] static SpanId from_bytes(std::span<const uint8_t, kSize> bytes);
    [[nodiscard]] static std::optional<SpanId> from_hex(std::string_view hex);
    [[nodiscard]] static SpanId create_random();

    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] bool is_empty() const;
    [[nodiscard]] const Bytes& bytes() const { return bytes_; }
    [[nodiscard]] std::size_t hash() const;

    bool operator==(const SpanId& other) const = default;

private:
    explicit SpanId(const Bytes& bytes) : bytes_(bytes) {}

    Bytes bytes_{};
};

} // namespace tracectx

template<>
struct std::hash<tracectx::TraceId> {
    std::size_t operator()(const tracectx::TraceId& id) const noexcept { return id.hash(); }
};

template<>
struct std::hash<tracectx::SpanId> {
    std::size_t operator()(const tracectx::SpanId& id) const noexcept { return id.hash(); }
};
