#include "config/context_loader.hpp"

#include <toml++/toml.hpp>
#include <format>
#include <fstream>
#include <iterator>
#include <optional>

namespace tracectx {

static constexpr std::string_view kContexts   = "contexts";
static constexpr std::string_view kTraceId    = "trace_id";
static constexpr std::string_view kSpanId     = "span_id";
static constexpr std::string_view kTraceFlags = "trace_flags";
static constexpr std::string_view kTraceState = "trace_state";

// ============================================================================
// Public API - Load from file
// ============================================================================

ContextLoader::LoadResult ContextLoader::load_from_file(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return LoadResult::error(std::format("Cannot open config file: {}", config_path));
    }

    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return load_from_string(buffer);
}

// ============================================================================
// Public API - Load from string
// ============================================================================

ContextLoader::LoadResult ContextLoader::load_from_string(const std::string& toml_content) {
    std::vector<TraceContext> contexts;

    try {
        auto config = toml::parse(toml_content);

        const auto* contexts_array = config[kContexts].as_array();
        if (!contexts_array) {
            return LoadResult::error("No [[contexts]] array found in configuration");
        }

        std::size_t index = 0;
        for (const auto& elem : *contexts_array) {
            const auto* node = elem.as_table();
            if (!node) {
                return LoadResult::error(std::format("Context {}: entry is not a table", index));
            }
            const auto& tbl = *node;

            // Required: trace_id
            const auto trace_id_node = tbl[kTraceId];
            if (!trace_id_node) {
                return LoadResult::error(std::format("Context {}: missing trace_id", index));
            }
            const auto* trace_id_str = trace_id_node.as_string();
            if (!trace_id_str) {
                return LoadResult::error(std::format("Context {}: trace_id must be a string", index));
            }
            const auto trace_id = TraceId::from_hex(trace_id_str->get());
            if (!trace_id) {
                return LoadResult::error(
                    std::format("Context {}: trace_id '{}' is not 32 hex chars", index, trace_id_str->get()));
            }

            // Required: span_id
            const auto span_id_node = tbl[kSpanId];
            if (!span_id_node) {
                return LoadResult::error(std::format("Context {}: missing span_id", index));
            }
            const auto* span_id_str = span_id_node.as_string();
            if (!span_id_str) {
                return LoadResult::error(std::format("Context {}: span_id must be a string", index));
            }
            const auto span_id = SpanId::from_hex(span_id_str->get());
            if (!span_id) {
                return LoadResult::error(
                    std::format("Context {}: span_id '{}' is not 16 hex chars", index, span_id_str->get()));
            }

            // Optional: trace_flags (integer, default 0)
            auto flags = std::optional<TraceFlags>(TraceFlags::NONE);
            if (const auto flags_node = tbl[kTraceFlags]) {
                const auto* flags_int = flags_node.as_integer();
                if (!flags_int) {
                    return LoadResult::error(std::format("Context {}: trace_flags must be an integer", index));
                }
                flags = parse_trace_flags(flags_int->get());
                if (!flags) {
                    return LoadResult::error(
                        std::format("Context {}: trace_flags {} out of range [0, 255]", index, flags_int->get()));
                }
            }

            // Optional: trace_state (kept verbatim, absent when omitted)
            std::optional<std::string> trace_state;
            if (const auto state_node = tbl[kTraceState]) {
                const auto* state_str = state_node.as_string();
                if (!state_str) {
                    return LoadResult::error(std::format("Context {}: trace_state must be a string", index));
                }
                trace_state = state_str->get();
            }

            auto result = TraceContext::create(*trace_id, *span_id, *flags, std::move(trace_state));
            if (result.is_error()) {
                return LoadResult::error(std::format("Context {}: {}", index, result.error_message()));
            }
            contexts.emplace_back(std::move(result.value()));
            ++index;
        }
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.description()));
    }

    return LoadResult::ok(std::move(contexts));
}

} // namespace tracectx
