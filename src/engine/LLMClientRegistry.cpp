#include "engine/LLMClientRegistry.hpp"
#include "common/Logger.hpp"
#include <stdexcept>

namespace datachat {
namespace engine {

LLMClientRegistry::LLMClientRegistry(Factory factory)
    : m_factory(std::move(factory)) {
    if (!m_factory) {
        throw std::invalid_argument("LLMClientRegistry requires a client factory");
    }
}

llm::AnalysisClientPtr LLMClientRegistry::getClient() {
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        if (m_client) {
            return m_client;
        }
    }

    std::lock_guard<std::mutex> buildLock(m_buildMutex);

    // Another caller may have built it while we waited
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        if (m_client) {
            return m_client;
        }
    }

    llm::AnalysisClientPtr client = build();

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_client = client;
    ++m_constructions;
    return client;
}

void LLMClientRegistry::reset() {
    std::lock_guard<std::mutex> buildLock(m_buildMutex);

    llm::AnalysisClientPtr client = build();

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_client = client;
    ++m_constructions;
    LOG_INFO("llm", "Analysis client rebuilt (" + client->name() + ")");
}

bool LLMClientRegistry::isConstructed() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_client != nullptr;
}

size_t LLMClientRegistry::constructionCount() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_constructions;
}

llm::AnalysisClientPtr LLMClientRegistry::build() {
    llm::AnalysisClientPtr client;
    try {
        client = m_factory();
    } catch (const std::exception& e) {
        std::string message = std::string("Failed to construct analysis client: ") + e.what();
        LOG_ERROR("llm", message);
        throw std::runtime_error(message);
    }
    if (!client) {
        throw std::runtime_error("Analysis client factory returned no client");
    }
    LOG_DEBUG("llm", "Constructed analysis client " + client->name());
    return client;
}

} // namespace engine
} // namespace datachat
