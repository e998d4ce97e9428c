#pragma once

#include "llm/AnalysisClient.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace datachat {
namespace llm {

/**
 * Parsed form of an http:// worker URL
 */
struct WorkerEndpoint {
    std::string host;
    std::string port = "80";
    std::string target = "/";

    // Throws std::invalid_argument for anything but http://host[:port][/path]
    static WorkerEndpoint parse(const std::string& url);

    std::string toString() const;
};

/**
 * JSON protocol spoken with the analysis worker.
 *
 * Request:
 *   {"model", "prompt", "table": {columns, schema, data},
 *    "context": [{"prompt", "response", "has_visualization"}],
 *    "options": {"visualization_format", "save_charts", "enable_cache", "enforce_privacy"},
 *    "timeout_ms"}
 *
 * Successful response (2xx):
 *   {"text": "...", "visualization": {...} | [...] | null}
 *
 * Error response (any status):
 *   {"error": {"type": "rate_limited" | "timeout" | "context_too_large" | ..., "message": "..."}}
 */
class WorkerProtocol {
public:
    static json buildRequestBody(const AnalysisRequest& request,
                                 const std::string& model,
                                 std::chrono::milliseconds timeout);

    /**
     * Map an HTTP status, body and Retry-After header to a result.
     * A recognised error.type wins over the status code.
     */
    static AnalysisResult interpretResponse(unsigned status,
                                            const std::string& body,
                                            const std::string& retryAfter = "");

    // Retry-After in delta-seconds; HTTP dates are not supported
    static std::optional<std::chrono::milliseconds> parseRetryAfter(const std::string& value);

    static std::optional<storage::ErrorCategory> categoryFromErrorType(const std::string& type);
};

} // namespace llm
} // namespace datachat
