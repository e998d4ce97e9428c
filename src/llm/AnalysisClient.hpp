#pragma once

#include "storage/Records.hpp"
#include "table/Table.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace datachat {
namespace llm {

using json = nlohmann::json;

// Visualization format the worker is asked to return
inline constexpr const char* kStructuredVisualization = "plotly_json";

/**
 * Everything the analysis collaborator needs for one invocation.
 */
struct AnalysisRequest {
    ConstTablePtr table;
    std::vector<storage::Exchange> context;     // oldest first, successes only
    std::string prompt;
    std::string visualizationFormat = kStructuredVisualization;
    std::chrono::steady_clock::time_point deadline;

    // Set by the caller when it stops waiting; clients should give up promptly
    std::shared_ptr<std::atomic<bool>> cancelled = std::make_shared<std::atomic<bool>>(false);

    bool isCancelled() const { return cancelled && cancelled->load(); }
};

/**
 * Outcome of one invocation. Either a response (text and/or a structured
 * visualization) or a classified failure.
 */
struct AnalysisResult {
    bool ok = false;

    // Success
    std::string text;
    std::optional<json> visualization;

    // Failure
    storage::ErrorCategory category = storage::ErrorCategory::MalformedOutput;
    std::string detail;                                 // for logs, never shown to users
    std::optional<std::chrono::milliseconds> retryAfter;

    static AnalysisResult success(std::string text, std::optional<json> visualization = std::nullopt) {
        AnalysisResult r;
        r.ok = true;
        r.text = std::move(text);
        r.visualization = std::move(visualization);
        return r;
    }

    static AnalysisResult failure(storage::ErrorCategory category,
                                  std::string detail,
                                  std::optional<std::chrono::milliseconds> retryAfter = std::nullopt) {
        AnalysisResult r;
        r.ok = false;
        r.category = category;
        r.detail = std::move(detail);
        r.retryAfter = retryAfter;
        return r;
    }
};

/**
 * Analysis collaborator that turns (table, context, prompt) into a response.
 *
 * Implementations must be safe to call from several threads at once.
 * Expected failures are returned as classified results; an exception
 * escaping invoke() is treated by the caller as malformed output.
 */
class AnalysisClient {
public:
    virtual ~AnalysisClient() = default;

    virtual AnalysisResult invoke(const AnalysisRequest& request) = 0;

    // Short identifier for logs
    virtual std::string name() const = 0;
};

using AnalysisClientPtr = std::shared_ptr<AnalysisClient>;

} // namespace llm
} // namespace datachat
