#include "config/context_loader.hpp"
#include "core/utils.hpp"
#include "tool/command_line.hpp"
#include "tracing/trace_context.hpp"

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

using namespace tracectx;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitInvalid = 2;

void print_usage(const char* prog) {
    utils::log::error(std::format(
        "usage: {} <trace_id> <span_id> [trace_flags] [trace_state]\n"
        "       {} --config <contexts.toml>", prog, prog));
}

// Build a single context from positional arguments
ContextLoader::LoadResult load_from_args(const std::vector<std::string>& args) {
    const std::string_view trace_hex = args[0];
    const std::string_view span_hex = args[1];

    const auto trace_id = TraceId::from_hex(trace_hex);
    if (!trace_id) {
        return ContextLoader::LoadResult::error(
            std::format("trace_id '{}' is not 32 hex chars", trace_hex));
    }
    const auto span_id = SpanId::from_hex(span_hex);
    if (!span_id) {
        return ContextLoader::LoadResult::error(
            std::format("span_id '{}' is not 16 hex chars", span_hex));
    }

    auto flags = std::optional<TraceFlags>(TraceFlags::NONE);
    if (args.size() > 2) {
        const auto flags_val = utils::try_parse_int<int64_t>(args[2]);
        flags = flags_val ? parse_trace_flags(*flags_val) : std::nullopt;
        if (!flags) {
            return ContextLoader::LoadResult::error(
                std::format("trace_flags '{}' is not an integer in [0, 255]", args[2]));
        }
    }

    std::optional<std::string> trace_state;
    if (args.size() > 3) {
        trace_state = args[3];
    }

    auto result = TraceContext::create(*trace_id, *span_id, *flags, std::move(trace_state));
    if (result.is_error()) {
        return ContextLoader::LoadResult::error(result.error_message());
    }
    return ContextLoader::LoadResult::ok({std::move(result.value())});
}

void report(const std::vector<TraceContext>& contexts) {
    std::unordered_set<TraceContext> seen;
    seen.reserve(contexts.size());

    for (size_t i = 0; i < contexts.size(); ++i) {
        const auto& ctx = contexts[i];
        utils::log::info(std::format(
            "context[{}] trace_id={} span_id={} flags={:02x} ({}) trace_state={} hash={:016x}",
            i, ctx.trace_id().to_hex(), ctx.span_id().to_hex(),
            static_cast<unsigned>(ctx.trace_flags()), trace_flags_to_string(ctx.trace_flags()),
            ctx.trace_state() ? std::format("\"{}\"", *ctx.trace_state()) : "<none>",
            ctx.hash()));

        if (!seen.insert(ctx).second) {
            utils::log::warn(std::format("context[{}] duplicates an earlier context", i));
        }
    }

    utils::log::info(std::format("{} context(s), {} distinct", contexts.size(), seen.size()));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    ContextLoader::LoadResult loaded;

    const auto cmd = parse_command_line(argc, argv);
    switch (cmd.mode) {
        case CommandMode::CONFIG:
            utils::log::info(std::format("Loading contexts from {}", cmd.config_path));
            loaded = ContextLoader::load_from_file(cmd.config_path);
            break;
        case CommandMode::ARGUMENTS:
            loaded = load_from_args(cmd.args);
            break;
        case CommandMode::USAGE:
            print_usage(argc > 0 ? argv[0] : "tracectx");
            return kExitUsage;
    }

    if (!loaded.success) {
        utils::log::error(loaded.error_message);
        return kExitInvalid;
    }

    report(loaded.contexts);
    return kExitOk;
}
