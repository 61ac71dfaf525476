#pragma once

#include "core/error.hpp"
#include "tracing/trace_flags.hpp"
#include "tracing/trace_id.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace tracectx {

/**
 * @brief W3C Trace Context value (trace-id, span-id, flags, tracestate)
 *
 * Immutable once constructed. The validating constructor rejects empty
 * (all-zero) trace and span ids, so the only way to obtain a context with
 * empty ids is default construction, which represents "no context".
 *
 * Equality compares all four fields; tracestate comparison is exact and an
 * absent tracestate is distinct from an empty one. hash() is consistent with
 * equality and returns 0 for the default context.
 */
class TraceContext {
public:
    /// Default ("no context") value: empty ids, no flags, no tracestate
    TraceContext() = default;

    /**
     * @brief Construct a validated context
     * @throws InvalidArgument naming "trace_id" or "span_id" when that id is empty
     */
    TraceContext(TraceId trace_id, SpanId span_id, TraceFlags trace_flags,
                 std::optional<std::string> trace_state = std::nullopt);

    /// Non-throwing variant of the validating constructor
    [[nodiscard]] static Result<TraceContext> create(
        TraceId trace_id, SpanId span_id, TraceFlags trace_flags,
        std::optional<std::string> trace_state = std::nullopt);

    [[nodiscard]] const TraceId& trace_id() const { return trace_id_; }
    [[nodiscard]] const SpanId& span_id() const { return span_id_; }
    [[nodiscard]] TraceFlags trace_flags() const { return trace_flags_; }
    [[nodiscard]] const std::optional<std::string>& trace_state() const { return trace_state_; }

    [[nodiscard]] bool is_sampled() const { return has_flag(trace_flags_, TraceFlags::RECORDED); }

    /// True for the default-constructed value
    [[nodiscard]] bool is_default() const;

    [[nodiscard]] bool equals(const TraceContext& other) const;
    [[nodiscard]] bool not_equals(const TraceContext& other) const { return !equals(other); }

    bool operator==(const TraceContext& other) const { return equals(other); }
    bool operator!=(const TraceContext& other) const { return not_equals(other); }

    /// DJB2-style combination of the field hashes (seed 5381, h = h * 33 + x)
    [[nodiscard]] std::size_t hash() const;

private:
    TraceId trace_id_;
    SpanId span_id_;
    TraceFlags trace_flags_ = TraceFlags::NONE;
    std::optional<std::string> trace_state_;
};

} // namespace tracectx

template<>
struct std::hash<tracectx::TraceContext> {
    std::size_t operator()(const tracectx::TraceContext& ctx) const noexcept { return ctx.hash(); }
};
