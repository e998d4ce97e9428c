#pragma once

#include "table/TableProfiler.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace datachat {
namespace storage {

using json = nlohmann::json;

enum class DatasetStatus {
    Pending,
    Processing,
    Ready,
    Error
};

enum class ExchangeStatus {
    Success,
    Error
};

/**
 * Failure taxonomy for a query. Mutually exclusive; the retryable ones
 * are RateLimited, Timeout and UpstreamUnavailable.
 */
enum class ErrorCategory {
    DataUnavailable,
    RateLimited,
    Timeout,
    ContextTooLarge,
    MalformedOutput,
    UpstreamUnavailable
};

std::string toString(DatasetStatus status);
std::string toString(ExchangeStatus status);
std::string toString(ErrorCategory category);

// These throw std::invalid_argument on unknown names
DatasetStatus datasetStatusFromString(const std::string& name);
ExchangeStatus exchangeStatusFromString(const std::string& name);
ErrorCategory errorCategoryFromString(const std::string& name);

/**
 * Metadata produced by ingestion
 */
struct DatasetMetadata {
    TableProfile profile;
    size_t fileSizeBytes = 0;
    std::vector<std::string> sheetNames;
    std::vector<std::string> parseWarnings;
    std::string error;                      // set when ingestion failed

    json toJson() const;
    static DatasetMetadata fromJson(const json& j);
};

/**
 * An uploaded dataset. Immutable once Ready; a re-upload is a new Dataset.
 */
struct Dataset {
    std::string id;
    std::string name;
    std::string fingerprint;                // "sha256:<hex>:<size>", empty until stored
    DatasetStatus status = DatasetStatus::Pending;
    DatasetMetadata metadata;
    std::string uploadedAt;                 // ISO 8601 timestamp

    json toJson() const;
};

/**
 * A conversation about exactly one dataset
 */
struct Session {
    std::string id;
    std::string datasetId;                  // never changes after creation
    std::string title;
    std::string createdAt;
    std::string updatedAt;

    json toJson() const;
};

/**
 * One prompt/response pair. Immutable once appended.
 */
struct Exchange {
    int64_t id = 0;                         // assigned by the store
    std::string sessionId;
    int64_t sequence = 0;                   // 1-based position in the session
    std::string prompt;
    std::string responseText;
    std::optional<json> visualization;      // opaque structured payload, stored verbatim
    ExchangeStatus status = ExchangeStatus::Success;
    std::string errorMessage;               // user-facing, iff status == Error
    std::optional<ErrorCategory> errorCategory;
    std::string createdAt;

    bool succeeded() const { return status == ExchangeStatus::Success; }

    json toJson() const;
};

} // namespace storage
} // namespace datachat
