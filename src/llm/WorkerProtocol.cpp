#include "llm/WorkerProtocol.hpp"
#include <stdexcept>

namespace datachat {
namespace llm {

using storage::ErrorCategory;

namespace {

constexpr size_t kMaxDetailLength = 300;

std::string clip(const std::string& text) {
    if (text.size() <= kMaxDetailLength) return text;
    return text.substr(0, kMaxDetailLength) + "...";
}

} // anonymous namespace

WorkerEndpoint WorkerEndpoint::parse(const std::string& url) {
    const std::string scheme = "http://";
    if (url.rfind(scheme, 0) != 0) {
        throw std::invalid_argument("Worker URL must start with http://: " + url);
    }

    std::string rest = url.substr(scheme.size());
    WorkerEndpoint endpoint;

    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        endpoint.target = rest.substr(slash);
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        endpoint.port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (endpoint.port.empty() ||
            endpoint.port.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("Invalid port in worker URL: " + url);
        }
    }

    if (authority.empty()) {
        throw std::invalid_argument("Missing host in worker URL: " + url);
    }
    endpoint.host = authority;
    return endpoint;
}

std::string WorkerEndpoint::toString() const {
    return "http://" + host + ":" + port + target;
}

json WorkerProtocol::buildRequestBody(const AnalysisRequest& request,
                                      const std::string& model,
                                      std::chrono::milliseconds timeout) {
    json context = json::array();
    for (const auto& exchange : request.context) {
        context.push_back({
            {"prompt", exchange.prompt},
            {"response", exchange.responseText},
            {"has_visualization", exchange.visualization.has_value()}
        });
    }

    return {
        {"model", model},
        {"prompt", request.prompt},
        {"table", request.table ? request.table->toJsonWithSchema() : json(nullptr)},
        {"context", context},
        {"options", {
            {"visualization_format", request.visualizationFormat},
            {"save_charts", false},
            {"enable_cache", false},
            {"enforce_privacy", true}
        }},
        {"timeout_ms", timeout.count()}
    };
}

std::optional<ErrorCategory> WorkerProtocol::categoryFromErrorType(const std::string& type) {
    if (type == "rate_limited" || type == "overloaded") return ErrorCategory::RateLimited;
    if (type == "timeout") return ErrorCategory::Timeout;
    if (type == "context_too_large") return ErrorCategory::ContextTooLarge;
    if (type == "malformed_output" || type == "execution_error") return ErrorCategory::MalformedOutput;
    if (type == "upstream_unavailable") return ErrorCategory::UpstreamUnavailable;
    return std::nullopt;
}

std::optional<std::chrono::milliseconds> WorkerProtocol::parseRetryAfter(const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::chrono::milliseconds(std::stoll(value) * 1000);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

AnalysisResult WorkerProtocol::interpretResponse(unsigned status,
                                                 const std::string& body,
                                                 const std::string& retryAfter) {
    json parsed = json::parse(body, nullptr, false);
    const bool isObject = parsed.is_object();

    std::string errorType;
    std::string errorMessage;
    if (isObject && parsed.contains("error") && !parsed["error"].is_null()) {
        const json& error = parsed["error"];
        if (error.is_object()) {
            errorType = error.value("type", "");
            errorMessage = error.value("message", "");
        } else if (error.is_string()) {
            errorMessage = error.get<std::string>();
        } else {
            errorType = "malformed_output";
        }
    }

    std::string detail = "HTTP " + std::to_string(status) + ": " +
                         clip(errorMessage.empty() ? body : errorMessage);
    auto hint = parseRetryAfter(retryAfter);

    if (!errorType.empty() || !errorMessage.empty()) {
        if (auto category = categoryFromErrorType(errorType)) {
            return AnalysisResult::failure(*category, detail,
                                           *category == ErrorCategory::RateLimited ? hint : std::nullopt);
        }
    }

    if (status == 429) {
        return AnalysisResult::failure(ErrorCategory::RateLimited, detail, hint);
    }
    if (status == 413) {
        return AnalysisResult::failure(ErrorCategory::ContextTooLarge, detail);
    }
    if (status == 408 || status == 504) {
        return AnalysisResult::failure(ErrorCategory::Timeout, detail);
    }
    if (status >= 500) {
        return AnalysisResult::failure(ErrorCategory::UpstreamUnavailable, detail);
    }
    if (status == 401 || status == 403) {
        return AnalysisResult::failure(ErrorCategory::UpstreamUnavailable, "worker rejected credentials (" + detail + ")");
    }
    if (status < 200 || status >= 300) {
        return AnalysisResult::failure(ErrorCategory::MalformedOutput, detail);
    }

    // 2xx from here on
    if (!isObject) {
        return AnalysisResult::failure(ErrorCategory::MalformedOutput, "unparseable worker response: " + clip(body));
    }
    if (!errorType.empty() || !errorMessage.empty()) {
        return AnalysisResult::failure(ErrorCategory::MalformedOutput, detail);
    }

    std::string text;
    if (parsed.contains("text") && !parsed["text"].is_null()) {
        if (!parsed["text"].is_string()) {
            return AnalysisResult::failure(ErrorCategory::MalformedOutput, "worker response text is not a string");
        }
        text = parsed["text"].get<std::string>();
    }

    std::optional<json> visualization;
    if (parsed.contains("visualization") && !parsed["visualization"].is_null()) {
        visualization = parsed["visualization"];
    }

    return AnalysisResult::success(std::move(text), std::move(visualization));
}

} // namespace llm
} // namespace datachat
