#include <catch2/catch_test_macros.hpp>
#include "config/context_loader.hpp"

#include <cstdio>
#include <fstream>

using namespace tracectx;

// ============================================================================
// Context Loader Tests
// ============================================================================

TEST_CASE("ContextLoader: load valid contexts", "[config]") {
    auto result = ContextLoader::load_from_string(R"(
[[contexts]]
trace_id = "4bf92f3577b34da6a3ce929d0e0e4736"
span_id = "00f067aa0ba902b7"
trace_flags = 1
trace_state = "rojo=1"

[[contexts]]
trace_id = "0af7651916cd43dd8448eb211c80319c"
span_id = "b7ad6b7169203331"
)");

    REQUIRE(result.success);
    REQUIRE(result.contexts.size() == 2);

    const auto& first = result.contexts[0];
    REQUIRE(first.trace_id().to_hex() == "4bf92f3577b34da6a3ce929d0e0e4736");
    REQUIRE(first.span_id().to_hex() == "00f067aa0ba902b7");
    REQUIRE(first.is_sampled());
    REQUIRE(first.trace_state() == std::optional<std::string>("rojo=1"));

    const auto& second = result.contexts[1];
    REQUIRE(second.trace_flags() == TraceFlags::NONE);
    REQUIRE_FALSE(second.trace_state().has_value());
}

TEST_CASE("ContextLoader: identical entries load as equal contexts", "[config]") {
    auto result = ContextLoader::load_from_string(R"(
[[contexts]]
trace_id = "4bf92f3577b34da6a3ce929d0e0e4736"
span_id = "00f067aa0ba902b7"
trace_flags = 1

[[contexts]]
trace_id = "4BF92F3577B34DA6A3CE929D0E0E4736"
span_id = "00F067AA0BA902B7"
trace_flags = 1
)");

    REQUIRE(result.success);
    REQUIRE(result.contexts.size() == 2);
    REQUIRE(result.contexts[0] == result.contexts[1]);
    REQUIRE(result.contexts[0].hash() == result.contexts[1].hash());
}

TEST_CASE("ContextLoader: missing contexts array", "[config]") {
    auto result = ContextLoader::load_from_string("title = \"nothing here\"\n");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_message.find("[[contexts]]") != std::string::npos);
}

TEST_CASE("ContextLoader: missing span_id", "[config]") {
    auto result = ContextLoader::load_from_string(R"(
[[contexts]]
trace_id = "4bf92f3577b34da6a3ce929d0e0e4736"
)");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_message.find("missing span_id") != std::string::npos);
}

TEST_CASE("ContextLoader: malformed trace_id reports entry index", "[config]") {
    auto result = ContextLoader::load_from_string(R"(
[[contexts]]
trace_id = "4bf92f3577b34da6a3ce929d0e0e4736"
span_id = "00f067aa0ba902b7"

[[contexts]]
trace_id = "abcd"
span_id = "00f067aa0ba902b7"
)");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_message.find("Context 1") != std::string::npos);
    REQUIRE(result.error_message.find("trace_id") != std::string::npos);
}

TEST_CASE("ContextLoader: all-zero span_id is rejected", "[config]") {
    auto result = ContextLoader::load_from_string(R"(
[[contexts]]
trace_id = "4bf92f3577b34da6a3ce929d0e0e4736"
span_id = "0000000000000000"
)");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_message.find("span_id") != std::string::npos);
}

TEST_CASE("ContextLoader: trace_flags out of range", "[config]") {
    auto result = ContextLoader::load_from_string(R"(
[[contexts]]
trace_id = "4bf92f3577b34da6a3ce929d0e0e4736"
span_id = "00f067aa0ba902b7"
trace_flags = 300
)");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_message.find("trace_flags") != std::string::npos);
}

TEST_CASE("ContextLoader: string trace_flags is rejected", "[config]") {
    auto result = ContextLoader::load_from_string(R"(
[[contexts]]
trace_id = "4bf92f3577b34da6a3ce929d0e0e4736"
span_id = "00f067aa0ba902b7"
trace_flags = "1"
)");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_message.find("trace_flags must be an integer") != std::string::npos);
}

TEST_CASE("ContextLoader: boolean trace_flags is rejected", "[config]") {
    auto result = ContextLoader::load_from_string(R"(
[[contexts]]
trace_id = "4bf92f3577b34da6a3ce929d0e0e4736"
span_id = "00f067aa0ba902b7"
trace_flags = true
)");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_message.find("trace_flags must be an integer") != std::string::npos);
}

TEST_CASE("ContextLoader: integer trace_state is rejected", "[config]") {
    auto result = ContextLoader::load_from_string(R"(
[[contexts]]
trace_id = "4bf92f3577b34da6a3ce929d0e0e4736"
span_id = "00f067aa0ba902b7"
trace_state = 5
)");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_message.find("trace_state must be a string") != std::string::npos);
}

TEST_CASE("ContextLoader: non-string trace_id is rejected", "[config]") {
    auto result = ContextLoader::load_from_string(R"(
[[contexts]]
trace_id = 42
span_id = "00f067aa0ba902b7"
)");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_message.find("trace_id must be a string") != std::string::npos);
}

TEST_CASE("ContextLoader: TOML syntax error", "[config]") {
    auto result = ContextLoader::load_from_string("[[contexts]\ntrace_id = ");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_message.find("TOML parse error") != std::string::npos);
}

TEST_CASE("ContextLoader: missing file", "[config]") {
    auto result = ContextLoader::load_from_file("/nonexistent/contexts.toml");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_message.find("Cannot open config file") != std::string::npos);
}

TEST_CASE("ContextLoader: load from file", "[config]") {
    const std::string path = "test_context_loader_contexts.toml";
    {
        std::ofstream out(path);
        out << "[[contexts]]\n"
            << "trace_id = \"4bf92f3577b34da6a3ce929d0e0e4736\"\n"
            << "span_id = \"00f067aa0ba902b7\"\n"
            << "trace_state = \"congo=t61rcWkgMzE\"\n";
    }

    auto result = ContextLoader::load_from_file(path);
    std::remove(path.c_str());

    REQUIRE(result.success);
    REQUIRE(result.contexts.size() == 1);
    REQUIRE(*result.contexts[0].trace_state() == "congo=t61rcWkgMzE");
}
