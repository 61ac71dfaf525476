#include "tracing/trace_context.hpp"

#include <format>
#include <utility>

namespace tracectx {

namespace {

constexpr std::size_t kHashSeed = 5381;

// h * 33 + value, unsigned wrap-around
constexpr std::size_t hash_step(std::size_t h, std::size_t value) {
    return ((h << 5) + h) + value;
}

// Name of the first empty id, or nullptr when both are set
const char* invalid_id_param(const TraceId& trace_id, const SpanId& span_id) {
    if (trace_id.is_empty()) return "trace_id";
    if (span_id.is_empty()) return "span_id";
    return nullptr;
}

std::string invalid_id_message(const char* param) {
    return std::format("{}: span id or trace id is invalid (all zeros)", param);
}

} // anonymous namespace

TraceContext::TraceContext(TraceId trace_id, SpanId span_id, TraceFlags trace_flags,
                           std::optional<std::string> trace_state)
    : trace_id_(trace_id),
      span_id_(span_id),
      trace_flags_(trace_flags),
      trace_state_(std::move(trace_state)) {
    if (const char* param = invalid_id_param(trace_id_, span_id_)) {
        throw InvalidArgument(param, invalid_id_message(param));
    }
}

Result<TraceContext> TraceContext::create(TraceId trace_id, SpanId span_id, TraceFlags trace_flags,
                                          std::optional<std::string> trace_state) {
    if (const char* param = invalid_id_param(trace_id, span_id)) {
        return Result<TraceContext>::error(ErrorCategory::INVALID_ARGUMENT, invalid_id_message(param));
    }
    return Result<TraceContext>::ok(TraceContext(trace_id, span_id, trace_flags, std::move(trace_state)));
}

bool TraceContext::is_default() const {
    return trace_id_.is_empty() && span_id_.is_empty()
        && trace_flags_ == TraceFlags::NONE && !trace_state_.has_value();
}

bool TraceContext::equals(const TraceContext& other) const {
    return span_id_ == other.span_id_
        && trace_id_ == other.trace_id_
        && trace_flags_ == other.trace_flags_
        && trace_state_ == other.trace_state_;
}

std::size_t TraceContext::hash() const {
    if (is_default()) return 0;

    std::size_t h = kHashSeed;
    h = hash_step(h, trace_id_.hash());
    h = hash_step(h, span_id_.hash());
    h = hash_step(h, static_cast<std::size_t>(trace_flags_));
    h = hash_step(h, trace_state_ ? std::hash<std::string>{}(*trace_state_) : 0);
    return h;
}

} // namespace tracectx
