#include "storage/Records.hpp"
#include <stdexcept>

namespace datachat {
namespace storage {

std::string toString(DatasetStatus status) {
    switch (status) {
        case DatasetStatus::Pending: return "pending";
        case DatasetStatus::Processing: return "processing";
        case DatasetStatus::Ready: return "ready";
        case DatasetStatus::Error: return "error";
    }
    return "error";
}

std::string toString(ExchangeStatus status) {
    return status == ExchangeStatus::Success ? "success" : "error";
}

std::string toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::DataUnavailable: return "data_unavailable";
        case ErrorCategory::RateLimited: return "rate_limited";
        case ErrorCategory::Timeout: return "timeout";
        case ErrorCategory::ContextTooLarge: return "context_too_large";
        case ErrorCategory::MalformedOutput: return "malformed_output";
        case ErrorCategory::UpstreamUnavailable: return "upstream_unavailable";
    }
    return "malformed_output";
}

DatasetStatus datasetStatusFromString(const std::string& name) {
    if (name == "pending") return DatasetStatus::Pending;
    if (name == "processing") return DatasetStatus::Processing;
    if (name == "ready") return DatasetStatus::Ready;
    if (name == "error") return DatasetStatus::Error;
    throw std::invalid_argument("Unknown dataset status: " + name);
}

ExchangeStatus exchangeStatusFromString(const std::string& name) {
    if (name == "success") return ExchangeStatus::Success;
    if (name == "error") return ExchangeStatus::Error;
    throw std::invalid_argument("Unknown exchange status: " + name);
}

ErrorCategory errorCategoryFromString(const std::string& name) {
    if (name == "data_unavailable") return ErrorCategory::DataUnavailable;
    if (name == "rate_limited") return ErrorCategory::RateLimited;
    if (name == "timeout") return ErrorCategory::Timeout;
    if (name == "context_too_large") return ErrorCategory::ContextTooLarge;
    if (name == "malformed_output") return ErrorCategory::MalformedOutput;
    if (name == "upstream_unavailable") return ErrorCategory::UpstreamUnavailable;
    throw std::invalid_argument("Unknown error category: " + name);
}

json DatasetMetadata::toJson() const {
    if (!error.empty()) {
        return {{"error", error}, {"parse_warnings", parseWarnings}};
    }

    json j = TableProfiler::toJson(profile);
    j["file_size_bytes"] = fileSizeBytes;
    j["sheet_names"] = sheetNames;
    j["parse_warnings"] = parseWarnings;
    return j;
}

DatasetMetadata DatasetMetadata::fromJson(const json& j) {
    DatasetMetadata metadata;
    if (!j.is_object()) {
        return metadata;
    }
    metadata.profile = TableProfiler::fromJson(j);
    metadata.fileSizeBytes = j.value("file_size_bytes", size_t{0});
    metadata.sheetNames = j.value("sheet_names", std::vector<std::string>{});
    metadata.parseWarnings = j.value("parse_warnings", std::vector<std::string>{});
    metadata.error = j.value("error", "");
    return metadata;
}

json Dataset::toJson() const {
    return {
        {"id", id},
        {"name", name},
        {"fingerprint", fingerprint},
        {"status", toString(status)},
        {"metadata", metadata.toJson()},
        {"uploaded_at", uploadedAt}
    };
}

json Session::toJson() const {
    return {
        {"id", id},
        {"dataset_id", datasetId},
        {"title", title},
        {"created_at", createdAt},
        {"updated_at", updatedAt}
    };
}

json Exchange::toJson() const {
    json j;
    j["id"] = id;
    j["session_id"] = sessionId;
    j["sequence"] = sequence;
    j["prompt"] = prompt;
    j["status"] = toString(status);
    j["created_at"] = createdAt;

    if (status == ExchangeStatus::Success) {
        j["response_text"] = responseText;
        j["visualization"] = visualization ? *visualization : json(nullptr);
    } else {
        j["error_message"] = errorMessage;
        if (errorCategory) {
            j["error_category"] = toString(*errorCategory);
        }
    }

    return j;
}

} // namespace storage
} // namespace datachat
