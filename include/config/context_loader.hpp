#pragma once

#include "tracing/trace_context.hpp"

#include <string>
#include <vector>

namespace tracectx {

/**
 * @brief Trace context loader from TOML configuration
 *
 * Reads an array of [[contexts]] tables:
 *
 *   [[contexts]]
 *   trace_id    = "4bf92f3577b34da6a3ce929d0e0e4736"
 *   span_id     = "00f067aa0ba902b7"
 *   trace_flags = 1          # optional, default 0
 *   trace_state = "rojo=1"   # optional
 *
 * Validates:
 * - id presence, length and hex digits
 * - non-zero ids
 * - trace_flags fits in one byte
 */
class ContextLoader {
public:
    /**
     * @brief Load result
     */
    struct LoadResult {
        bool success = false;
        std::string error_message;
        std::vector<TraceContext> contexts;

        static LoadResult ok(std::vector<TraceContext> contexts_vec) {
            LoadResult result;
            result.success = true;
            result.contexts = std::move(contexts_vec);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load contexts from TOML file
     * @param config_path Path to the TOML file
     * @return Load result with contexts or error
     */
    static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load contexts from TOML string
     * @param toml_content TOML content
     * @return Load result with contexts or error
     */
    static LoadResult load_from_string(const std::string& toml_content);
};

} // namespace tracectx
