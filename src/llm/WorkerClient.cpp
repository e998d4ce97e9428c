#include "llm/WorkerClient.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace datachat {
namespace llm {

using storage::ErrorCategory;

namespace {

// How often a running call checks whether its caller gave up
constexpr std::chrono::milliseconds kCancelPollInterval{50};

} // anonymous namespace

WorkerClient::Options WorkerClient::optionsFromConfig(const AppConfig& config) {
    return Options{
        .url = config.workerUrl,
        .apiKeyEnv = config.workerApiKeyEnv,
        .model = config.workerModel,
        .timeout = std::chrono::milliseconds(config.workerTimeoutMs)
    };
}

WorkerClient::WorkerClient(Options options)
    : m_options(std::move(options)) {
    try {
        m_endpoint = WorkerEndpoint::parse(m_options.url);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    }

    const char* key = std::getenv(m_options.apiKeyEnv.c_str());
    if (key == nullptr || *key == '\0') {
        throw std::runtime_error("Environment variable " + m_options.apiKeyEnv + " is not set");
    }
    m_apiKey = key;

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::error_code ec;
    m_addresses = resolver.resolve(m_endpoint.host, m_endpoint.port, ec);
    if (ec) {
        throw std::runtime_error("Cannot resolve worker host " + m_endpoint.host + ": " + ec.message());
    }

    LOG_INFO("worker", "Analysis worker at " + m_endpoint.toString() + " (model " + m_options.model + ")");
}

std::string WorkerClient::name() const {
    return "worker " + m_endpoint.host + ":" + m_endpoint.port;
}

AnalysisResult WorkerClient::invoke(const AnalysisRequest& request) {
    if (request.isCancelled()) {
        return AnalysisResult::failure(ErrorCategory::Timeout, "call cancelled before start");
    }

    auto now = std::chrono::steady_clock::now();
    if (request.deadline <= now) {
        return AnalysisResult::failure(ErrorCategory::Timeout, "deadline passed before the worker call");
    }
    auto budget = std::min(m_options.timeout,
                           std::chrono::duration_cast<std::chrono::milliseconds>(request.deadline - now));

    http::request<http::string_body> req{http::verb::post, m_endpoint.target, 11};
    req.set(http::field::host, m_endpoint.host);
    req.set(http::field::user_agent, "datachat/1.0");
    req.set(http::field::content_type, "application/json");
    req.set(http::field::accept, "application/json");
    req.set(http::field::authorization, "Bearer " + m_apiKey);
    req.body() = WorkerProtocol::buildRequestBody(request, m_options.model, budget).dump();
    req.prepare_payload();

    net::io_context ioc;
    beast::tcp_stream stream(ioc);
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxResponseBytes);

    beast::error_code result;
    std::string stage = "connect";

    stream.expires_after(budget);
    stream.async_connect(m_addresses, [&](beast::error_code connectEc, const tcp::endpoint&) {
        if (connectEc) {
            result = connectEc;
            return;
        }
        stage = "write";
        http::async_write(stream, req, [&](beast::error_code writeEc, std::size_t) {
            if (writeEc) {
                result = writeEc;
                return;
            }
            stage = "read";
            http::async_read(stream, buffer, parser, [&](beast::error_code readEc, std::size_t) {
                result = readEc;
            });
        });
    });

    bool cancelled = false;
    while (!ioc.stopped()) {
        ioc.run_for(kCancelPollInterval);
        if (!cancelled && request.isCancelled()) {
            cancelled = true;
            stream.cancel();
        }
    }

    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    if (cancelled) {
        return AnalysisResult::failure(ErrorCategory::Timeout, "call abandoned by the caller during " + stage);
    }
    if (result == beast::error::timeout) {
        return AnalysisResult::failure(ErrorCategory::Timeout,
                                       "no worker response within " + std::to_string(budget.count()) +
                                       "ms (" + stage + ")");
    }
    if (result == http::error::body_limit) {
        return AnalysisResult::failure(ErrorCategory::MalformedOutput, "worker response exceeds size limit");
    }
    if (result) {
        return AnalysisResult::failure(ErrorCategory::UpstreamUnavailable,
                                       stage + " failed: " + result.message());
    }

    const auto& res = parser.get();
    std::string retryAfter;
    auto it = res.find(http::field::retry_after);
    if (it != res.end()) {
        retryAfter.assign(it->value().data(), it->value().size());
    }

    LOG_DEBUG("worker", "HTTP " + std::to_string(res.result_int()) + " from worker, " +
              std::to_string(res.body().size()) + " bytes");
    return WorkerProtocol::interpretResponse(res.result_int(), res.body(), retryAfter);
}

} // namespace llm
} // namespace datachat
