#include "tracing/trace_id.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <random>

namespace tracectx {

namespace {

template<std::size_t N>
bool is_all_zeros(const std::array<uint8_t, N>& bytes) {
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

template<std::size_t N>
std::size_t hash_bytes(const std::array<uint8_t, N>& bytes) {
    return std::hash<std::string_view>{}(
        std::string_view(reinterpret_cast<const char*>(bytes.data()), N));
}

// Fill with random bytes until at least one is non-zero
template<std::size_t N>
std::array<uint8_t, N> random_bytes() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    std::array<uint8_t, N> bytes{};
    do {
        for (std::size_t i = 0; i < N; i += 8) {
            const uint64_t val = dis(gen);
            const std::size_t chunk = std::min(N - i, std::size_t(8));
            for (std::size_t j = 0; j < chunk; ++j) {
                bytes[i + j] = static_cast<uint8_t>(val >> (j * 8));
            }
        }
    } while (is_all_zeros(bytes));
    return bytes;
}

} // anonymous namespace

// ============================================================================
// TraceId
// ============================================================================

TraceId TraceId::from_bytes(std::span<const uint8_t, kSize> bytes) {
    Bytes b{};
    std::copy(bytes.begin(), bytes.end(), b.begin());
    return TraceId(b);
}

std::optional<TraceId> TraceId::from_hex(std::string_view hex) {
    auto bytes = utils::hex_to_bytes<kSize>(hex);
    if (!bytes) return std::nullopt;
    return TraceId(*bytes);
}

TraceId TraceId::create_random() {
    return TraceId(random_bytes<kSize>());
}

std::string TraceId::to_hex() const {
    return utils::bytes_to_hex(bytes_);
}

bool TraceId::is_empty() const {
    return is_all_zeros(bytes_);
}

std::size_t TraceId::hash() const {
    return hash_bytes(bytes_);
}

// ============================================================================
// SpanId
// ============================================================================

SpanId SpanId::from_bytes(std::span<const uint8_t, kSize> bytes) {
    Bytes b{};
    std::copy(bytes.begin(), bytes.end(), b.begin());
    return SpanId(b);
}

std::optional<SpanId> SpanId::from_hex(std::string_view hex) {
    auto bytes = utils::hex_to_bytes<kSize>(hex);
    if (!bytes) return std::nullopt;
    return SpanId(*bytes);
}

SpanId SpanId::create_random() {
    return SpanId(random_bytes<kSize>());
}

std::string SpanId::to_hex() const {
    return utils::bytes_to_hex(bytes_);
}

bool SpanId::is_empty() const {
    return is_all_zeros(bytes_);
}

std::size_t SpanId::hash() const {
    return hash_bytes(bytes_);
}

} // namespace tracectx
