#pragma once

#include "engine/DatasetCache.hpp"
#include "engine/DatasetIngestor.hpp"
#include "engine/LLMClientRegistry.hpp"
#include "engine/QueryExecutor.hpp"
#include "storage/SessionStore.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace datachat {
namespace server {

using json = nlohmann::json;

/// Route handler result: {HTTP status code, JSON body}
using RouteResult = std::pair<unsigned, json>;

/**
 * JSON API over the query engine. Transport-free: HttpSession hands it
 * the method, target and body of each request.
 *
 * Routes:
 *   GET  /api/health
 *   GET  /api/datasets                  POST /api/datasets {name, table}
 *   GET  /api/datasets/:id              GET  /api/datasets/:id/sessions
 *   POST /api/sessions {dataset_id, title?}
 *   GET  /api/sessions/:id
 *   POST /api/sessions/:id/query {prompt}
 *   GET  /api/sessions/:id/history
 *   GET  /api/cache/stats               POST /api/client/reset
 */
class RequestHandler {
public:
    RequestHandler(storage::SessionStore& store,
                   engine::DatasetCache& cache,
                   engine::LLMClientRegistry& clients,
                   engine::QueryExecutor& executor,
                   engine::DatasetIngestor& ingestor);

    /**
     * Route a request. Bad input maps to 400, unknown entities to 404,
     * anything else thrown to 500.
     */
    RouteResult handle(const std::string& method, const std::string& target, const std::string& body);

    // Individual handlers; they throw on bad input or missing entities
    json handleHealth();
    json handleListDatasets();
    json handleCreateDataset(const json& request);
    json handleGetDataset(const std::string& datasetId);
    json handleListSessions(const std::string& datasetId);
    json handleCreateSession(const json& request);
    json handleGetSession(const std::string& sessionId);
    json handleQuery(const std::string& sessionId, const json& request);
    json handleHistory(const std::string& sessionId);
    json handleCacheStats();
    json handleResetClient();

private:
    RouteResult route(const std::string& method,
                      const std::vector<std::string>& segments,
                      const std::string& body);

    static std::vector<std::string> splitPath(const std::string& target);
    static json parseBody(const std::string& body);
    static std::string requireString(const json& request, const std::string& key);
    static json errorBody(const std::string& message);

    storage::SessionStore& m_store;
    engine::DatasetCache& m_cache;
    engine::LLMClientRegistry& m_clients;
    engine::QueryExecutor& m_executor;
    engine::DatasetIngestor& m_ingestor;
};

} // namespace server
} // namespace datachat
