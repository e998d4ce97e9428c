#include <catch2/catch.hpp>
#include "engine/QueryExecutor.hpp"
#include "engine/DatasetIngestor.hpp"
#include "TestSupport.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

using namespace datachat;
using namespace datachat::engine;
using namespace datachat::storage;
using datachat::llm::AnalysisResult;
using datachat::testing::ScriptedClient;

namespace {

QueryExecutorOptions fastOptions() {
    QueryExecutorOptions options;
    options.queryTimeout = std::chrono::milliseconds(2000);
    options.workerTimeout = std::chrono::milliseconds(1000);
    options.retryBackoff = std::chrono::milliseconds(10);
    return options;
}

/**
 * Store with one ready dataset and one session, wired to a scripted client
 */
class ExecutorFixture {
public:
    explicit ExecutorFixture(QueryExecutorOptions options = fastOptions(),
                             QueryExecutor::TableLoader loader = nullptr)
        : store(":memory:")
        , cache(4)
        , client(std::make_shared<ScriptedClient>())
        , registry([this]() {
            ++factoryCalls;
            return client;
        })
        , executor(store, cache, registry, options, std::move(loader))
    {
        auto dataset = store.registerDataset("sales.csv");
        store.updateDatasetStatus(dataset.id, DatasetStatus::Processing);
        store.saveDatasetTable(dataset.id, "sha256:abc:3", testing::salesTableJson());
        store.updateDatasetStatus(dataset.id, DatasetStatus::Ready);
        datasetId = dataset.id;
        sessionId = store.createSession(datasetId).id;
    }

    SessionStore store;
    DatasetCache cache;
    std::shared_ptr<ScriptedClient> client;
    std::atomic<int> factoryCalls{0};
    LLMClientRegistry registry;
    QueryExecutor executor;
    std::string datasetId;
    std::string sessionId;
};

} // anonymous namespace

// =============================================================================
// Successful flow
// =============================================================================

TEST_CASE("Successful query is persisted with text and visualization", "[QueryExecutor]") {
    ExecutorFixture fx;
    json chart = json::parse(R"({"data": [{"type": "bar"}], "layout": {"title": "Units"}})");
    fx.client->push(AnalysisResult::success("North sold 10 units.", chart));

    auto ex = fx.executor.submitQuery(fx.sessionId, "  Units by region?  ");

    REQUIRE(ex.succeeded());
    REQUIRE(ex.sequence == 1);
    REQUIRE(ex.prompt == "Units by region?");
    REQUIRE(ex.responseText == "North sold 10 units.");
    REQUIRE(ex.visualization);
    REQUIRE(*ex.visualization == chart);
    REQUIRE(ex.errorMessage.empty());
    REQUIRE_FALSE(ex.errorCategory);

    auto requests = fx.client->requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].table->rowCount() == 3);
    REQUIRE(requests[0].context.empty());
    REQUIRE(requests[0].visualizationFormat == llm::kStructuredVisualization);
}

TEST_CASE("Second query carries the first exchange as context", "[QueryExecutor]") {
    ExecutorFixture fx;
    fx.client->push(AnalysisResult::success("first answer"));
    fx.client->push(AnalysisResult::success("second answer"));

    auto first = fx.executor.submitQuery(fx.sessionId, "first question");
    auto second = fx.executor.submitQuery(fx.sessionId, "second question");

    REQUIRE(second.succeeded());
    auto requests = fx.client->requests();
    REQUIRE(requests.size() == 2);
    REQUIRE(requests[1].context.size() == 1);
    REQUIRE(requests[1].context[0].id == first.id);
    REQUIRE(requests[1].context[0].responseText == "first answer");

    auto history = fx.executor.getHistory(fx.sessionId);
    REQUIRE(history.size() == 2);
    REQUIRE(history[0].sequence == 1);
    REQUIRE(history[1].sequence == 2);
}

TEST_CASE("Table is loaded once across queries", "[QueryExecutor]") {
    std::atomic<int> loads{0};
    SessionStore* storePtr = nullptr;
    ExecutorFixture fx(fastOptions(), [&](const std::string& id, const std::string& fp) {
        ++loads;
        return storePtr->loadDatasetTable(id, fp);
    });
    storePtr = &fx.store;

    fx.executor.submitQuery(fx.sessionId, "one");
    fx.executor.submitQuery(fx.sessionId, "two");

    REQUIRE(loads == 1);
    REQUIRE(fx.cache.stats().hits == 1);
}

// =============================================================================
// Retry policy
// =============================================================================

TEST_CASE("Rate limited twice is recorded after exactly two calls", "[QueryExecutor][retry]") {
    ExecutorFixture fx;
    fx.client->push(AnalysisResult::failure(ErrorCategory::RateLimited, "429 from upstream"));

    auto ex = fx.executor.submitQuery(fx.sessionId, "total revenue?");

    REQUIRE(fx.client->callCount() == 2);
    REQUIRE_FALSE(ex.succeeded());
    REQUIRE(ex.errorCategory == ErrorCategory::RateLimited);
    REQUIRE(ex.errorMessage == QueryExecutor::userMessage(ErrorCategory::RateLimited));
    REQUIRE(ex.errorMessage.find("429") == std::string::npos);

    // The failed exchange is in history but never in context
    fx.client->clearScript();
    fx.client->push(AnalysisResult::success("42"));
    auto next = fx.executor.submitQuery(fx.sessionId, "try again");

    REQUIRE(next.succeeded());
    REQUIRE(fx.executor.getHistory(fx.sessionId).size() == 2);
    REQUIRE(fx.client->requests().back().context.empty());
}

TEST_CASE("A retryable failure followed by success succeeds", "[QueryExecutor][retry]") {
    for (auto category : {ErrorCategory::RateLimited, ErrorCategory::Timeout, ErrorCategory::UpstreamUnavailable}) {
        ExecutorFixture fx;
        fx.client->push(AnalysisResult::failure(category, "transient"));
        fx.client->push(AnalysisResult::success("recovered"));

        auto ex = fx.executor.submitQuery(fx.sessionId, "question");

        REQUIRE(ex.succeeded());
        REQUIRE(ex.responseText == "recovered");
        REQUIRE(fx.client->callCount() == 2);
    }
}

TEST_CASE("Fatal failures are not retried", "[QueryExecutor][retry]") {
    for (auto category : {ErrorCategory::ContextTooLarge, ErrorCategory::MalformedOutput}) {
        ExecutorFixture fx;
        fx.client->push(AnalysisResult::failure(category, "fatal"));
        fx.client->push(AnalysisResult::success("never reached"));

        auto ex = fx.executor.submitQuery(fx.sessionId, "question");

        REQUIRE_FALSE(ex.succeeded());
        REQUIRE(ex.errorCategory == category);
        REQUIRE(fx.client->callCount() == 1);
    }
}

TEST_CASE("Retry is skipped when the hint exceeds the remaining budget", "[QueryExecutor][retry]") {
    ExecutorFixture fx;
    fx.client->push(AnalysisResult::failure(ErrorCategory::RateLimited, "slow down",
                                            std::chrono::milliseconds(60000)));

    auto start = std::chrono::steady_clock::now();
    auto ex = fx.executor.submitQuery(fx.sessionId, "question");
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(ex.errorCategory == ErrorCategory::RateLimited);
    REQUIRE(fx.client->callCount() == 1);
    REQUIRE(elapsed < std::chrono::milliseconds(1500));
}

TEST_CASE("Retry waits for the retry-after hint", "[QueryExecutor][retry]") {
    ExecutorFixture fx;
    fx.client->push(AnalysisResult::failure(ErrorCategory::RateLimited, "slow down",
                                            std::chrono::milliseconds(200)));
    fx.client->push(AnalysisResult::success("ok"));

    auto start = std::chrono::steady_clock::now();
    auto ex = fx.executor.submitQuery(fx.sessionId, "question");
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(ex.succeeded());
    REQUIRE(elapsed >= std::chrono::milliseconds(200));
}

TEST_CASE("Client construction failure is UpstreamUnavailable and retried once", "[QueryExecutor][retry]") {
    SessionStore store(":memory:");
    auto dataset = store.registerDataset("d");
    store.updateDatasetStatus(dataset.id, DatasetStatus::Processing);
    store.saveDatasetTable(dataset.id, "fp", testing::salesTableJson());
    store.updateDatasetStatus(dataset.id, DatasetStatus::Ready);
    auto session = store.createSession(dataset.id);

    DatasetCache cache(4);
    int attempts = 0;
    LLMClientRegistry registry([&]() -> llm::AnalysisClientPtr {
        ++attempts;
        throw std::runtime_error("DATACHAT_WORKER_API_KEY is not set");
    });
    QueryExecutor executor(store, cache, registry, fastOptions());

    auto ex = executor.submitQuery(session.id, "question");

    REQUIRE(ex.errorCategory == ErrorCategory::UpstreamUnavailable);
    REQUIRE(attempts == 2);
    REQUIRE_FALSE(registry.isConstructed());
}

// =============================================================================
// Classification
// =============================================================================

TEST_CASE("Exception from the client becomes MalformedOutput", "[QueryExecutor][classify]") {
    ExecutorFixture fx;
    fx.client->pushStep([](const llm::AnalysisRequest&) -> AnalysisResult {
        throw std::logic_error("generated code referenced a missing column");
    });

    auto ex = fx.executor.submitQuery(fx.sessionId, "question");

    REQUIRE_FALSE(ex.succeeded());
    REQUIRE(ex.errorCategory == ErrorCategory::MalformedOutput);
    REQUIRE(ex.errorMessage.find("missing column") == std::string::npos);
    REQUIRE(fx.client->callCount() == 1);
}

TEST_CASE("Empty response is MalformedOutput", "[QueryExecutor][classify]") {
    ExecutorFixture fx;
    fx.client->push(AnalysisResult::success("   "));

    auto ex = fx.executor.submitQuery(fx.sessionId, "question");

    REQUIRE(ex.errorCategory == ErrorCategory::MalformedOutput);
}

TEST_CASE("Visualization-only response is a success", "[QueryExecutor][classify]") {
    ExecutorFixture fx;
    fx.client->push(AnalysisResult::success("", json::array({json{{"type", "scatter"}}})));

    auto ex = fx.executor.submitQuery(fx.sessionId, "plot it");

    REQUIRE(ex.succeeded());
    REQUIRE(ex.visualization->is_array());
}

TEST_CASE("Scalar visualization payload is MalformedOutput", "[QueryExecutor][classify]") {
    ExecutorFixture fx;
    fx.client->push(AnalysisResult::success("see chart", json("/tmp/chart.png")));

    auto ex = fx.executor.submitQuery(fx.sessionId, "plot it");

    REQUIRE(ex.errorCategory == ErrorCategory::MalformedOutput);
}

// =============================================================================
// Dataset resolution
// =============================================================================

TEST_CASE("Dataset not ready is DataUnavailable without calling the client", "[QueryExecutor][dataset]") {
    ExecutorFixture fx;
    auto pending = fx.store.registerDataset("still uploading");
    auto session = fx.store.createSession(pending.id);

    auto ex = fx.executor.submitQuery(session.id, "question");

    REQUIRE(ex.errorCategory == ErrorCategory::DataUnavailable);
    REQUIRE(fx.client->callCount() == 0);
    REQUIRE(fx.factoryCalls == 0);
    REQUIRE(fx.store.exchangeCount(session.id) == 1);
}

TEST_CASE("Failed dataset is DataUnavailable", "[QueryExecutor][dataset]") {
    ExecutorFixture fx;
    auto broken = fx.store.registerDataset("broken.csv");
    fx.store.updateDatasetStatus(broken.id, DatasetStatus::Error);
    auto session = fx.store.createSession(broken.id);

    auto ex = fx.executor.submitQuery(session.id, "question");

    REQUIRE(ex.errorCategory == ErrorCategory::DataUnavailable);
}

TEST_CASE("Loader failure is DataUnavailable and nothing is cached", "[QueryExecutor][dataset]") {
    ExecutorFixture fx(fastOptions(), [](const std::string&, const std::string&) -> TablePtr {
        throw std::runtime_error("table blob missing");
    });

    auto ex = fx.executor.submitQuery(fx.sessionId, "question");

    REQUIRE(ex.errorCategory == ErrorCategory::DataUnavailable);
    REQUIRE(fx.client->callCount() == 0);
    REQUIRE(fx.cache.size() == 0);
}

// =============================================================================
// Timeouts
// =============================================================================

TEST_CASE("Unresponsive client is abandoned at the deadline", "[QueryExecutor][timeout]") {
    QueryExecutorOptions options = fastOptions();
    options.queryTimeout = std::chrono::milliseconds(300);
    options.workerTimeout = std::chrono::milliseconds(200);

    ExecutorFixture fx(options);
    auto sawCancel = std::make_shared<std::atomic<bool>>(false);
    fx.client->pushStep([sawCancel](const llm::AnalysisRequest& request) {
        auto giveUp = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (!request.isCancelled() && std::chrono::steady_clock::now() < giveUp) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        sawCancel->store(request.isCancelled());
        return AnalysisResult::success("too late");
    });

    auto start = std::chrono::steady_clock::now();
    auto ex = fx.executor.submitQuery(fx.sessionId, "question");
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(ex.errorCategory == ErrorCategory::Timeout);
    REQUIRE(elapsed < std::chrono::milliseconds(1500));

    // The abandoned call observes the cancellation shortly after
    auto until = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!sawCancel->load() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(sawCancel->load());
}

TEST_CASE("Hung call is cut at the call deadline and retried", "[QueryExecutor][timeout]") {
    QueryExecutorOptions options = fastOptions();
    options.queryTimeout = std::chrono::milliseconds(1000);
    options.workerTimeout = std::chrono::milliseconds(300);

    ExecutorFixture fx(options);
    fx.client->pushStep([](const llm::AnalysisRequest& request) {
        auto giveUp = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (!request.isCancelled() && std::chrono::steady_clock::now() < giveUp) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return AnalysisResult::success("too late");
    });
    fx.client->push(AnalysisResult::success("second try"));

    auto start = std::chrono::steady_clock::now();
    auto ex = fx.executor.submitQuery(fx.sessionId, "question");
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(ex.succeeded());
    REQUIRE(ex.responseText == "second try");
    REQUIRE(fx.client->callCount() == 2);
    REQUIRE(elapsed < std::chrono::milliseconds(900));

    auto requests = fx.client->requests();
    REQUIRE(requests[0].deadline - start <= std::chrono::milliseconds(400));
}

TEST_CASE("Calls that ignore cancellation are bounded", "[QueryExecutor][timeout]") {
    QueryExecutorOptions options = fastOptions();
    options.queryTimeout = std::chrono::milliseconds(600);
    options.workerTimeout = std::chrono::milliseconds(100);
    options.maxAbandonedCalls = 1;

    ExecutorFixture fx(options);
    auto release = std::make_shared<std::atomic<bool>>(false);
    fx.client->pushStep([release](const llm::AnalysisRequest&) {
        auto giveUp = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!release->load() && std::chrono::steady_clock::now() < giveUp) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return AnalysisResult::success("ignored");
    });

    auto ex = fx.executor.submitQuery(fx.sessionId, "question");

    // First attempt is abandoned; the retry is refused without a new call
    REQUIRE(ex.errorCategory == ErrorCategory::UpstreamUnavailable);
    REQUIRE(fx.client->callCount() == 1);
    REQUIRE(fx.executor.abandonedCalls() == 1);

    release->store(true);
    auto until = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (fx.executor.abandonedCalls() > 0 && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(fx.executor.abandonedCalls() == 0);
}

// =============================================================================
// Termination guarantees
// =============================================================================

TEST_CASE("Every failure category ends in exactly one persisted exchange", "[QueryExecutor]") {
    const std::vector<ErrorCategory> categories = {
        ErrorCategory::RateLimited, ErrorCategory::Timeout, ErrorCategory::ContextTooLarge,
        ErrorCategory::MalformedOutput, ErrorCategory::UpstreamUnavailable
    };

    for (auto category : categories) {
        ExecutorFixture fx;
        fx.client->push(AnalysisResult::failure(category, "injected"));

        std::vector<QueryState> states;
        fx.executor.setStateObserver([&](const std::string&, QueryState state) { states.push_back(state); });

        auto ex = fx.executor.submitQuery(fx.sessionId, "question");

        REQUIRE(ex.errorCategory == category);
        REQUIRE_FALSE(ex.errorMessage.empty());
        REQUIRE(fx.store.exchangeCount(fx.sessionId) == 1);
        REQUIRE(states.front() == QueryState::Received);
        REQUIRE(states.back() == QueryState::PersistedError);
        REQUIRE(std::count(states.begin(), states.end(), QueryState::PersistedError) == 1);
    }
}

TEST_CASE("Responses that cannot be stored are MalformedOutput", "[QueryExecutor][classify]") {
    ExecutorFixture fx;

    SECTION("Invalid UTF-8 in the visualization") {
        json chart = {{"label", std::string("\xff\xfe")}};
        fx.client->push(AnalysisResult::success("t", chart));
    }

    SECTION("Invalid UTF-8 in the text") {
        fx.client->push(AnalysisResult::success(std::string("caf\xe9")));
    }

    std::vector<QueryState> states;
    fx.executor.setStateObserver([&](const std::string&, QueryState state) { states.push_back(state); });

    storage::Exchange ex;
    REQUIRE_NOTHROW(ex = fx.executor.submitQuery(fx.sessionId, "question"));

    REQUIRE(ex.errorCategory == ErrorCategory::MalformedOutput);
    REQUIRE(fx.store.exchangeCount(fx.sessionId) == 1);
    REQUIRE(states.back() == QueryState::PersistedError);
}

TEST_CASE("Non-standard exceptions still end in a persisted exchange", "[QueryExecutor]") {
    SECTION("From the table loader") {
        ExecutorFixture fx(fastOptions(), [](const std::string&, const std::string&) -> TablePtr {
            throw 42;
        });

        auto ex = fx.executor.submitQuery(fx.sessionId, "question");

        REQUIRE(ex.errorCategory == ErrorCategory::DataUnavailable);
        REQUIRE(fx.store.exchangeCount(fx.sessionId) == 1);
    }

    SECTION("From the client") {
        ExecutorFixture fx;
        fx.client->pushStep([](const llm::AnalysisRequest&) -> AnalysisResult {
            throw 42;
        });

        auto ex = fx.executor.submitQuery(fx.sessionId, "question");

        REQUIRE(ex.errorCategory == ErrorCategory::MalformedOutput);
        REQUIRE(fx.store.exchangeCount(fx.sessionId) == 1);
    }
}

TEST_CASE("State sequence of a successful query", "[QueryExecutor]") {
    ExecutorFixture fx;
    std::vector<QueryState> states;
    fx.executor.setStateObserver([&](const std::string&, QueryState state) { states.push_back(state); });

    fx.executor.submitQuery(fx.sessionId, "question");

    REQUIRE(states == std::vector<QueryState>{
        QueryState::Received, QueryState::ResolvingDataset, QueryState::ResolvingContext,
        QueryState::Invoking, QueryState::Classifying, QueryState::PersistedSuccess
    });
}

// =============================================================================
// Input validation
// =============================================================================

TEST_CASE("Invalid prompts are rejected before anything is recorded", "[QueryExecutor][validation]") {
    ExecutorFixture fx;

    REQUIRE_THROWS_AS(fx.executor.submitQuery(fx.sessionId, ""), std::invalid_argument);
    REQUIRE_THROWS_AS(fx.executor.submitQuery(fx.sessionId, "   \n"), std::invalid_argument);
    REQUIRE_THROWS_AS(fx.executor.submitQuery(fx.sessionId, std::string(2001, 'a')), std::invalid_argument);
    REQUIRE_NOTHROW(fx.executor.submitQuery(fx.sessionId, std::string(2000, 'a')));

    REQUIRE(fx.store.exchangeCount(fx.sessionId) == 1);
}

TEST_CASE("Unknown session is rejected", "[QueryExecutor][validation]") {
    ExecutorFixture fx;

    REQUIRE_THROWS_AS(fx.executor.submitQuery("sess_missing", "question"), std::out_of_range);
    REQUIRE_THROWS_AS(fx.executor.getHistory("sess_missing"), std::out_of_range);
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_CASE("Queries on different sessions run concurrently", "[QueryExecutor][concurrency]") {
    ExecutorFixture fx;
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    fx.client->pushStep([&](const llm::AnalysisRequest&) {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        --running;
        return AnalysisResult::success("done");
    });

    std::vector<std::string> sessions;
    for (int i = 0; i < 4; ++i) {
        sessions.push_back(fx.store.createSession(fx.datasetId).id);
    }

    std::vector<std::thread> threads;
    for (const auto& id : sessions) {
        threads.emplace_back([&fx, id]() { fx.executor.submitQuery(id, "question"); });
    }
    for (auto& t : threads) t.join();

    REQUIRE(peak > 1);
    REQUIRE(fx.factoryCalls == 1);
    for (const auto& id : sessions) {
        REQUIRE(fx.store.history(id).at(0).succeeded());
    }
}

// =============================================================================
// Revenue conversation
// =============================================================================

TEST_CASE("Revenue conversation over an ingested dataset", "[QueryExecutor][conversation]") {
    SessionStore store(":memory:");
    DatasetCache cache(4);
    auto client = std::make_shared<ScriptedClient>();
    LLMClientRegistry registry([client]() { return client; });
    QueryExecutor executor(store, cache, registry, fastOptions());
    DatasetIngestor ingestor(store);

    json revenue = json::parse(R"({
        "columns": ["region", "revenue"],
        "schema": [{"name": "region", "type": "STRING"}, {"name": "revenue", "type": "INT"}],
        "data": [["East", 10], ["West", 20], ["East", 30]]
    })");
    auto dataset = ingestor.ingest("revenue.csv", revenue);
    auto session = store.createSession(dataset.id);

    client->push(AnalysisResult::success("East:40, West:20"));
    client->push(AnalysisResult::success("East: 66.7%, West: 33.3%"));

    auto first = executor.submitQuery(session.id, "sum revenue by region");

    REQUIRE(first.succeeded());
    REQUIRE(first.sequence == 1);
    REQUIRE(first.responseText == "East:40, West:20");
    REQUIRE_FALSE(first.visualization);

    auto second = executor.submitQuery(session.id, "and as a percentage");

    REQUIRE(second.succeeded());
    auto requests = client->requests();
    REQUIRE(requests.size() == 2);
    REQUIRE(requests[0].table->rowCount() == 3);
    REQUIRE(requests[1].context.size() == 1);
    REQUIRE(requests[1].context[0].prompt == "sum revenue by region");
}
