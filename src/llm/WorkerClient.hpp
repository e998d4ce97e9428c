#pragma once

#include "llm/AnalysisClient.hpp"
#include "llm/WorkerProtocol.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <string>

namespace datachat {

struct AppConfig;

namespace llm {

/**
 * AnalysisClient that calls a sandboxed analysis worker over HTTP.
 *
 * Construction reads the API key from the configured environment variable
 * and resolves the worker host once; both failures throw
 * std::runtime_error. Each invoke() opens its own connection on a private
 * io_context, so one instance serves concurrent queries.
 */
class WorkerClient : public AnalysisClient {
public:
    struct Options {
        std::string url;
        std::string apiKeyEnv;
        std::string model;
        std::chrono::milliseconds timeout{60000};
    };

    static constexpr size_t kMaxResponseBytes = 32 * 1024 * 1024;

    explicit WorkerClient(Options options);

    static Options optionsFromConfig(const AppConfig& config);

    AnalysisResult invoke(const AnalysisRequest& request) override;

    std::string name() const override;

    const WorkerEndpoint& endpoint() const { return m_endpoint; }

private:
    Options m_options;
    WorkerEndpoint m_endpoint;
    std::string m_apiKey;
    boost::asio::ip::tcp::resolver::results_type m_addresses;
};

} // namespace llm
} // namespace datachat
