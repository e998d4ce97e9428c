#include "server/RequestHandler.hpp"
#include "common/Logger.hpp"
#include <stdexcept>

namespace datachat {
namespace server {

RequestHandler::RequestHandler(storage::SessionStore& store,
                               engine::DatasetCache& cache,
                               engine::LLMClientRegistry& clients,
                               engine::QueryExecutor& executor,
                               engine::DatasetIngestor& ingestor)
    : m_store(store)
    , m_cache(cache)
    , m_clients(clients)
    , m_executor(executor)
    , m_ingestor(ingestor) {
}

RouteResult RequestHandler::handle(const std::string& method,
                                   const std::string& target,
                                   const std::string& body) {
    try {
        return route(method, splitPath(target), body);
    } catch (const json::exception& e) {
        return {400, errorBody(std::string("Invalid request body: ") + e.what())};
    } catch (const std::invalid_argument& e) {
        return {400, errorBody(e.what())};
    } catch (const std::out_of_range& e) {
        return {404, errorBody(e.what())};
    } catch (const std::exception& e) {
        LOG_ERROR("http", method + " " + target + " failed: " + e.what());
        return {500, errorBody(e.what())};
    }
}

RouteResult RequestHandler::route(const std::string& method,
                                  const std::vector<std::string>& segments,
                                  const std::string& body) {
    const bool isGet = method == "GET";
    const bool isPost = method == "POST";
    const size_t n = segments.size();

    if (n < 2 || segments[0] != "api") {
        return {404, errorBody("Not found")};
    }
    const std::string& resource = segments[1];

    // GET /api/health
    if (resource == "health" && n == 2 && isGet) {
        return {200, handleHealth()};
    }

    if (resource == "datasets") {
        // GET /api/datasets
        if (n == 2 && isGet) {
            return {200, handleListDatasets()};
        }
        // POST /api/datasets
        if (n == 2 && isPost) {
            return {201, handleCreateDataset(parseBody(body))};
        }
        // GET /api/datasets/:id
        if (n == 3 && isGet) {
            return {200, handleGetDataset(segments[2])};
        }
        // GET /api/datasets/:id/sessions
        if (n == 4 && isGet && segments[3] == "sessions") {
            return {200, handleListSessions(segments[2])};
        }
    }

    if (resource == "sessions") {
        // POST /api/sessions
        if (n == 2 && isPost) {
            return {201, handleCreateSession(parseBody(body))};
        }
        // GET /api/sessions/:id
        if (n == 3 && isGet) {
            return {200, handleGetSession(segments[2])};
        }
        // POST /api/sessions/:id/query
        if (n == 4 && isPost && segments[3] == "query") {
            return {200, handleQuery(segments[2], parseBody(body))};
        }
        // GET /api/sessions/:id/history
        if (n == 4 && isGet && segments[3] == "history") {
            return {200, handleHistory(segments[2])};
        }
    }

    // GET /api/cache/stats
    if (resource == "cache" && n == 3 && segments[2] == "stats" && isGet) {
        return {200, handleCacheStats()};
    }

    // POST /api/client/reset
    if (resource == "client" && n == 3 && segments[2] == "reset" && isPost) {
        return {200, handleResetClient()};
    }

    return {404, errorBody("Not found")};
}

json RequestHandler::handleHealth() {
    return json{
        {"status", "ok"},
        {"service", "datachat"},
        {"version", "1.0.0"},
        {"client_constructed", m_clients.isConstructed()},
        {"cached_datasets", m_cache.size()},
        {"abandoned_calls", m_executor.abandonedCalls()}
    };
}

json RequestHandler::handleListDatasets() {
    json datasets = json::array();
    for (const auto& dataset : m_store.listDatasets()) {
        datasets.push_back(dataset.toJson());
    }
    return json{{"status", "ok"}, {"datasets", datasets}};
}

json RequestHandler::handleCreateDataset(const json& request) {
    std::string name = requireString(request, "name");
    if (!request.contains("table")) {
        throw std::invalid_argument("Missing field: table");
    }
    auto dataset = m_ingestor.ingest(name, request["table"]);
    return json{{"status", "ok"}, {"dataset", dataset.toJson()}};
}

json RequestHandler::handleGetDataset(const std::string& datasetId) {
    auto dataset = m_store.getDataset(datasetId);
    if (!dataset) {
        throw std::out_of_range("Dataset not found: " + datasetId);
    }
    return json{{"status", "ok"}, {"dataset", dataset->toJson()}};
}

json RequestHandler::handleListSessions(const std::string& datasetId) {
    if (!m_store.getDataset(datasetId)) {
        throw std::out_of_range("Dataset not found: " + datasetId);
    }
    json sessions = json::array();
    for (const auto& session : m_store.listSessions(datasetId)) {
        sessions.push_back(session.toJson());
    }
    return json{{"status", "ok"}, {"sessions", sessions}};
}

json RequestHandler::handleCreateSession(const json& request) {
    std::string datasetId = requireString(request, "dataset_id");
    std::string title = request.value("title", "");
    auto session = m_store.createSession(datasetId, title);
    return json{{"status", "ok"}, {"session", session.toJson()}};
}

json RequestHandler::handleGetSession(const std::string& sessionId) {
    auto session = m_store.getSession(sessionId);
    if (!session) {
        throw std::out_of_range("Session not found: " + sessionId);
    }
    json result = session->toJson();
    result["exchange_count"] = m_store.exchangeCount(sessionId);
    return json{{"status", "ok"}, {"session", result}};
}

json RequestHandler::handleQuery(const std::string& sessionId, const json& request) {
    std::string prompt = requireString(request, "prompt");
    auto exchange = m_executor.submitQuery(sessionId, prompt);
    return json{{"status", "ok"}, {"exchange", exchange.toJson()}};
}

json RequestHandler::handleHistory(const std::string& sessionId) {
    json exchanges = json::array();
    for (const auto& exchange : m_executor.getHistory(sessionId)) {
        exchanges.push_back(exchange.toJson());
    }
    return json{{"status", "ok"}, {"session_id", sessionId}, {"exchanges", exchanges}};
}

json RequestHandler::handleCacheStats() {
    return json{{"status", "ok"}, {"cache", m_cache.stats().toJson()}};
}

json RequestHandler::handleResetClient() {
    m_clients.reset();
    return json{{"status", "ok"}, {"construction_count", m_clients.constructionCount()}};
}

std::vector<std::string> RequestHandler::splitPath(const std::string& target) {
    std::string path = target.substr(0, target.find('?'));
    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) slash = path.size();
        if (slash > pos) {
            segments.push_back(path.substr(pos, slash - pos));
        }
        pos = slash + 1;
    }
    return segments;
}

json RequestHandler::parseBody(const std::string& body) {
    if (body.empty()) {
        return json::object();
    }
    json parsed = json::parse(body);
    if (!parsed.is_object()) {
        throw std::invalid_argument("Request body must be a JSON object");
    }
    return parsed;
}

std::string RequestHandler::requireString(const json& request, const std::string& key) {
    if (!request.contains(key) || !request[key].is_string()) {
        throw std::invalid_argument("Missing field: " + key);
    }
    return request[key].get<std::string>();
}

json RequestHandler::errorBody(const std::string& message) {
    return json{{"status", "error"}, {"message", message}};
}

} // namespace server
} // namespace datachat
