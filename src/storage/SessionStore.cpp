#include "storage/SessionStore.hpp"
#include "table/TableSerializer.hpp"
#include "common/Logger.hpp"
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <random>
#include <ctime>

namespace datachat {
namespace storage {

using json = nlohmann::json;

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

/**
 * Get current UTC timestamp in ISO 8601 format with milliseconds
 */
std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

bool isValidTransition(DatasetStatus from, DatasetStatus to) {
    switch (from) {
        case DatasetStatus::Pending:
            return to == DatasetStatus::Processing || to == DatasetStatus::Error;
        case DatasetStatus::Processing:
            return to == DatasetStatus::Ready || to == DatasetStatus::Error;
        default:
            return false;
    }
}

/**
 * RAII wrapper for SQLite prepared statements
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : m_stmt(nullptr) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare statement: " +
                                     std::string(sqlite3_errmsg(db)));
        }
    }

    ~Statement() {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bindText(int index, const std::string& value) {
        sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bindInt64(int index, int64_t value) {
        sqlite3_bind_int64(m_stmt, index, value);
    }

    void bindNull(int index) {
        sqlite3_bind_null(m_stmt, index);
    }

    bool step() {
        int result = sqlite3_step(m_stmt);
        if (result == SQLITE_ROW) return true;
        if (result == SQLITE_DONE) return false;
        throw std::runtime_error("Step failed: " +
                                 std::string(sqlite3_errmsg(sqlite3_db_handle(m_stmt))));
    }

    std::string getText(int col) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col));
        return text ? text : "";
    }

    int64_t getInt64(int col) {
        return sqlite3_column_int64(m_stmt, col);
    }

    bool isNull(int col) {
        return sqlite3_column_type(m_stmt, col) == SQLITE_NULL;
    }

private:
    sqlite3_stmt* m_stmt;
};

} // anonymous namespace

// =============================================================================
// SessionStore::Impl
// =============================================================================

class SessionStore::Impl {
public:
    explicit Impl(const std::string& dbPath)
        : m_dbPath(dbPath), m_db(nullptr), m_rng(std::random_device{}()) {
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        if (sqlite3_open_v2(dbPath.c_str(), &m_db, flags, nullptr) != SQLITE_OK) {
            std::string error = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            if (m_db) sqlite3_close(m_db);
            throw std::runtime_error("Failed to open database: " + error);
        }

        exec("PRAGMA foreign_keys = ON");
        createTables();
    }

    ~Impl() {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    void exec(const std::string& sql) {
        char* errMsg = nullptr;
        if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "Unknown error";
            sqlite3_free(errMsg);
            throw std::runtime_error("SQL error: " + error);
        }
    }

    void createTables() {
        exec(R"(
            CREATE TABLE IF NOT EXISTS datasets (
                id TEXT PRIMARY KEY,
                name TEXT NOT NULL,
                fingerprint TEXT NOT NULL DEFAULT '',
                status TEXT NOT NULL,
                metadata_json TEXT,
                table_json TEXT,
                uploaded_at TEXT NOT NULL
            )
        )");

        exec(R"(
            CREATE TABLE IF NOT EXISTS sessions (
                id TEXT PRIMARY KEY,
                dataset_id TEXT NOT NULL,
                title TEXT NOT NULL,
                created_at TEXT NOT NULL,
                updated_at TEXT NOT NULL,
                FOREIGN KEY (dataset_id) REFERENCES datasets(id)
            )
        )");

        exec(R"(
            CREATE TABLE IF NOT EXISTS exchanges (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                session_id TEXT NOT NULL,
                sequence INTEGER NOT NULL,
                prompt TEXT NOT NULL,
                response_text TEXT NOT NULL DEFAULT '',
                visualization_json TEXT,
                status TEXT NOT NULL,
                error_message TEXT NOT NULL DEFAULT '',
                error_category TEXT,
                created_at TEXT NOT NULL,
                FOREIGN KEY (session_id) REFERENCES sessions(id),
                UNIQUE(session_id, sequence)
            )
        )");

        exec("CREATE INDEX IF NOT EXISTS idx_sessions_dataset ON sessions(dataset_id)");
        exec("CREATE INDEX IF NOT EXISTS idx_exchanges_session ON exchanges(session_id, sequence)");

        exec(R"(
            CREATE TRIGGER IF NOT EXISTS exchanges_no_update
            BEFORE UPDATE ON exchanges
            BEGIN
                SELECT RAISE(ABORT, 'exchanges are append-only');
            END
        )");

        exec(R"(
            CREATE TRIGGER IF NOT EXISTS exchanges_no_delete
            BEFORE DELETE ON exchanges
            BEGIN
                SELECT RAISE(ABORT, 'exchanges are append-only');
            END
        )");
    }

    std::string generateId(const std::string& prefix) {
        std::uniform_int_distribution<uint64_t> dis;
        std::stringstream ss;
        ss << prefix << std::hex << std::setfill('0') << std::setw(16) << dis(m_rng);
        return ss.str();
    }

    /**
     * Timestamp that never precedes the previous one handed out
     */
    std::string nextTimestamp() {
        std::string ts = currentTimestamp();
        if (ts < m_lastTimestamp) {
            ts = m_lastTimestamp;
        }
        m_lastTimestamp = ts;
        return ts;
    }

    // === Datasets ===

    Dataset registerDataset(const std::string& name) {
        std::lock_guard<std::mutex> lock(m_mutex);

        Dataset dataset;
        dataset.id = generateId("ds_");
        dataset.name = name;
        dataset.status = DatasetStatus::Pending;
        dataset.uploadedAt = nextTimestamp();

        Statement stmt(m_db, R"(
            INSERT INTO datasets (id, name, fingerprint, status, metadata_json, uploaded_at)
            VALUES (?, ?, '', ?, ?, ?)
        )");
        stmt.bindText(1, dataset.id);
        stmt.bindText(2, dataset.name);
        stmt.bindText(3, toString(dataset.status));
        stmt.bindText(4, dataset.metadata.toJson().dump());
        stmt.bindText(5, dataset.uploadedAt);
        stmt.step();

        return dataset;
    }

    void updateDatasetStatus(const std::string& datasetId,
                             DatasetStatus status,
                             const std::optional<DatasetMetadata>& metadata) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto current = fetchDataset(datasetId);
        if (!current) {
            throw std::out_of_range("Dataset not found: " + datasetId);
        }
        if (!isValidTransition(current->status, status)) {
            throw std::invalid_argument("Invalid dataset status transition: " +
                                        toString(current->status) + " -> " + toString(status));
        }

        if (metadata) {
            Statement stmt(m_db, "UPDATE datasets SET status = ?, metadata_json = ? WHERE id = ?");
            stmt.bindText(1, toString(status));
            stmt.bindText(2, metadata->toJson().dump());
            stmt.bindText(3, datasetId);
            stmt.step();
        } else {
            Statement stmt(m_db, "UPDATE datasets SET status = ? WHERE id = ?");
            stmt.bindText(1, toString(status));
            stmt.bindText(2, datasetId);
            stmt.step();
        }
    }

    void saveDatasetTable(const std::string& datasetId,
                          const std::string& fingerprint,
                          const json& tableJson) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto current = fetchDataset(datasetId);
        if (!current) {
            throw std::out_of_range("Dataset not found: " + datasetId);
        }
        if (current->status != DatasetStatus::Processing) {
            throw std::invalid_argument("Dataset " + datasetId + " is " +
                                        toString(current->status) +
                                        ", table can only be stored while processing");
        }

        Statement stmt(m_db, "UPDATE datasets SET fingerprint = ?, table_json = ? WHERE id = ?");
        stmt.bindText(1, fingerprint);
        stmt.bindText(2, tableJson.dump());
        stmt.bindText(3, datasetId);
        stmt.step();
    }

    std::optional<Dataset> getDataset(const std::string& datasetId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return fetchDataset(datasetId);
    }

    std::vector<Dataset> listDatasets() {
        std::lock_guard<std::mutex> lock(m_mutex);

        Statement stmt(m_db, R"(
            SELECT id, name, fingerprint, status, metadata_json, uploaded_at
            FROM datasets ORDER BY uploaded_at DESC
        )");

        std::vector<Dataset> result;
        while (stmt.step()) {
            result.push_back(readDataset(stmt));
        }
        return result;
    }

    TablePtr loadDatasetTable(const std::string& datasetId, const std::string& fingerprint) {
        std::string tableText;
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            Statement stmt(m_db, "SELECT fingerprint, table_json FROM datasets WHERE id = ?");
            stmt.bindText(1, datasetId);
            if (!stmt.step()) {
                throw std::runtime_error("Dataset not found: " + datasetId);
            }
            std::string stored = stmt.getText(0);
            if (stored != fingerprint) {
                throw std::runtime_error("Dataset " + datasetId + " fingerprint mismatch: stored " +
                                         stored + ", requested " + fingerprint);
            }
            if (stmt.isNull(1)) {
                throw std::runtime_error("Dataset " + datasetId + " has no stored table");
            }
            tableText = stmt.getText(1);
        }

        // Decoding runs outside the lock so large tables don't stall other callers
        return TableSerializer::fromJson(json::parse(tableText));
    }

    // === Sessions ===

    Session createSession(const std::string& datasetId, const std::string& title) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto dataset = fetchDataset(datasetId);
        if (!dataset) {
            throw std::out_of_range("Dataset not found: " + datasetId);
        }

        Session session;
        session.id = generateId("sess_");
        session.datasetId = datasetId;
        session.title = title.empty() ? "Analysis of " + dataset->name : title;
        session.createdAt = nextTimestamp();
        session.updatedAt = session.createdAt;

        Statement stmt(m_db, R"(
            INSERT INTO sessions (id, dataset_id, title, created_at, updated_at)
            VALUES (?, ?, ?, ?, ?)
        )");
        stmt.bindText(1, session.id);
        stmt.bindText(2, session.datasetId);
        stmt.bindText(3, session.title);
        stmt.bindText(4, session.createdAt);
        stmt.bindText(5, session.updatedAt);
        stmt.step();

        return session;
    }

    std::optional<Session> getSession(const std::string& sessionId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return fetchSession(sessionId);
    }

    std::vector<Session> listSessions(const std::string& datasetId) {
        std::lock_guard<std::mutex> lock(m_mutex);

        Statement stmt(m_db, R"(
            SELECT id, dataset_id, title, created_at, updated_at
            FROM sessions WHERE dataset_id = ? ORDER BY updated_at DESC
        )");
        stmt.bindText(1, datasetId);

        std::vector<Session> result;
        while (stmt.step()) {
            result.push_back(readSession(stmt));
        }
        return result;
    }

    // === Exchanges ===

    Exchange appendExchange(const std::string& sessionId, const Exchange& exchange) {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!fetchSession(sessionId)) {
            throw std::out_of_range("Session not found: " + sessionId);
        }

        Exchange stored = exchange;
        stored.sessionId = sessionId;
        stored.createdAt = nextTimestamp();

        exec("BEGIN IMMEDIATE");
        try {
            {
                Statement seq(m_db, "SELECT COALESCE(MAX(sequence), 0) FROM exchanges WHERE session_id = ?");
                seq.bindText(1, sessionId);
                seq.step();
                stored.sequence = seq.getInt64(0) + 1;
            }

            {
                Statement stmt(m_db, R"(
                    INSERT INTO exchanges (session_id, sequence, prompt, response_text,
                                           visualization_json, status, error_message,
                                           error_category, created_at)
                    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
                )");
                stmt.bindText(1, sessionId);
                stmt.bindInt64(2, stored.sequence);
                stmt.bindText(3, stored.prompt);
                stmt.bindText(4, stored.responseText);
                if (stored.visualization) {
                    stmt.bindText(5, stored.visualization->dump());
                } else {
                    stmt.bindNull(5);
                }
                stmt.bindText(6, toString(stored.status));
                stmt.bindText(7, stored.errorMessage);
                if (stored.errorCategory) {
                    stmt.bindText(8, toString(*stored.errorCategory));
                } else {
                    stmt.bindNull(8);
                }
                stmt.bindText(9, stored.createdAt);
                stmt.step();
            }
            stored.id = sqlite3_last_insert_rowid(m_db);

            {
                Statement touch(m_db, "UPDATE sessions SET updated_at = ? WHERE id = ?");
                touch.bindText(1, stored.createdAt);
                touch.bindText(2, sessionId);
                touch.step();
            }

            exec("COMMIT");
        } catch (const std::exception& e) {
            LOG_ERROR("store", "Append to session " + sessionId + " failed: " + e.what());
            exec("ROLLBACK");
            throw;
        }

        return stored;
    }

    std::vector<Exchange> history(const std::string& sessionId) {
        std::lock_guard<std::mutex> lock(m_mutex);

        Statement stmt(m_db, R"(
            SELECT id, session_id, sequence, prompt, response_text, visualization_json,
                   status, error_message, error_category, created_at
            FROM exchanges WHERE session_id = ? ORDER BY sequence ASC
        )");
        stmt.bindText(1, sessionId);

        std::vector<Exchange> result;
        while (stmt.step()) {
            Exchange ex;
            ex.id = stmt.getInt64(0);
            ex.sessionId = stmt.getText(1);
            ex.sequence = stmt.getInt64(2);
            ex.prompt = stmt.getText(3);
            ex.responseText = stmt.getText(4);
            if (!stmt.isNull(5)) {
                ex.visualization = json::parse(stmt.getText(5));
            }
            ex.status = exchangeStatusFromString(stmt.getText(6));
            ex.errorMessage = stmt.getText(7);
            if (!stmt.isNull(8)) {
                ex.errorCategory = errorCategoryFromString(stmt.getText(8));
            }
            ex.createdAt = stmt.getText(9);
            result.push_back(std::move(ex));
        }
        return result;
    }

    size_t exchangeCount(const std::string& sessionId) {
        std::lock_guard<std::mutex> lock(m_mutex);

        Statement stmt(m_db, "SELECT COUNT(*) FROM exchanges WHERE session_id = ?");
        stmt.bindText(1, sessionId);
        stmt.step();
        return static_cast<size_t>(stmt.getInt64(0));
    }

    const std::string& getDbPath() const { return m_dbPath; }

private:
    // Callers hold m_mutex
    std::optional<Dataset> fetchDataset(const std::string& datasetId) {
        Statement stmt(m_db, R"(
            SELECT id, name, fingerprint, status, metadata_json, uploaded_at
            FROM datasets WHERE id = ?
        )");
        stmt.bindText(1, datasetId);
        if (!stmt.step()) {
            return std::nullopt;
        }
        return readDataset(stmt);
    }

    std::optional<Session> fetchSession(const std::string& sessionId) {
        Statement stmt(m_db, R"(
            SELECT id, dataset_id, title, created_at, updated_at
            FROM sessions WHERE id = ?
        )");
        stmt.bindText(1, sessionId);
        if (!stmt.step()) {
            return std::nullopt;
        }
        return readSession(stmt);
    }

    static Dataset readDataset(Statement& stmt) {
        Dataset dataset;
        dataset.id = stmt.getText(0);
        dataset.name = stmt.getText(1);
        dataset.fingerprint = stmt.getText(2);
        dataset.status = datasetStatusFromString(stmt.getText(3));
        if (!stmt.isNull(4)) {
            dataset.metadata = DatasetMetadata::fromJson(json::parse(stmt.getText(4)));
        }
        dataset.uploadedAt = stmt.getText(5);
        return dataset;
    }

    static Session readSession(Statement& stmt) {
        Session session;
        session.id = stmt.getText(0);
        session.datasetId = stmt.getText(1);
        session.title = stmt.getText(2);
        session.createdAt = stmt.getText(3);
        session.updatedAt = stmt.getText(4);
        return session;
    }

    std::string m_dbPath;
    sqlite3* m_db;
    std::mutex m_mutex;
    std::mt19937_64 m_rng;
    std::string m_lastTimestamp;
};

// =============================================================================
// SessionStore Public Interface
// =============================================================================

SessionStore::SessionStore(const std::string& dbPath)
    : m_impl(std::make_unique<Impl>(dbPath)) {}

SessionStore::~SessionStore() = default;

Dataset SessionStore::registerDataset(const std::string& name) {
    return m_impl->registerDataset(name);
}

void SessionStore::updateDatasetStatus(const std::string& datasetId,
                                       DatasetStatus status,
                                       const std::optional<DatasetMetadata>& metadata) {
    m_impl->updateDatasetStatus(datasetId, status, metadata);
}

void SessionStore::saveDatasetTable(const std::string& datasetId,
                                    const std::string& fingerprint,
                                    const json& tableJson) {
    m_impl->saveDatasetTable(datasetId, fingerprint, tableJson);
}

std::optional<Dataset> SessionStore::getDataset(const std::string& datasetId) {
    return m_impl->getDataset(datasetId);
}

std::vector<Dataset> SessionStore::listDatasets() {
    return m_impl->listDatasets();
}

TablePtr SessionStore::loadDatasetTable(const std::string& datasetId, const std::string& fingerprint) {
    return m_impl->loadDatasetTable(datasetId, fingerprint);
}

Session SessionStore::createSession(const std::string& datasetId, const std::string& title) {
    return m_impl->createSession(datasetId, title);
}

std::optional<Session> SessionStore::getSession(const std::string& sessionId) {
    return m_impl->getSession(sessionId);
}

std::vector<Session> SessionStore::listSessions(const std::string& datasetId) {
    return m_impl->listSessions(datasetId);
}

Exchange SessionStore::appendExchange(const std::string& sessionId, const Exchange& exchange) {
    return m_impl->appendExchange(sessionId, exchange);
}

std::vector<Exchange> SessionStore::history(const std::string& sessionId) {
    return m_impl->history(sessionId);
}

size_t SessionStore::exchangeCount(const std::string& sessionId) {
    return m_impl->exchangeCount(sessionId);
}

const std::string& SessionStore::getDbPath() const {
    return m_impl->getDbPath();
}

} // namespace storage
} // namespace datachat
