#pragma once

#include "storage/Records.hpp"
#include "table/Table.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>

namespace datachat {
namespace storage {

/**
 * SQLite-backed store for datasets, sessions and their exchange logs.
 *
 * Exchanges are append-only: there is no update or delete operation, and
 * the schema rejects UPDATE/DELETE on the exchanges table. Each append gets
 * the next sequence number in its session and a timestamp that never goes
 * backwards, so history reads are stable while a new exchange is written.
 *
 * All methods are thread-safe.
 *
 * Usage:
 *   SessionStore store("./datachat.db");
 *   auto ds = store.registerDataset("sales.csv");
 *   ...
 *   auto session = store.createSession(ds.id);
 *   store.appendExchange(session.id, exchange);
 *   auto log = store.history(session.id);
 */
class SessionStore {
public:
    /**
     * Open or create a SQLite database at the given path (":memory:" works)
     */
    explicit SessionStore(const std::string& dbPath);
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    // === Datasets ===

    /**
     * Create a new dataset in Pending state and return it
     */
    Dataset registerDataset(const std::string& name);

    /**
     * Move a dataset to a new status, optionally replacing its metadata.
     * Allowed: pending->processing, pending->error, processing->ready,
     * processing->error. Throws std::invalid_argument otherwise and
     * std::out_of_range for an unknown dataset.
     */
    void updateDatasetStatus(const std::string& datasetId,
                             DatasetStatus status,
                             const std::optional<DatasetMetadata>& metadata = std::nullopt);

    /**
     * Store the decoded table and its fingerprint. Only valid while the
     * dataset is Processing.
     */
    void saveDatasetTable(const std::string& datasetId,
                          const std::string& fingerprint,
                          const json& tableJson);

    std::optional<Dataset> getDataset(const std::string& datasetId);

    /**
     * All datasets ordered by uploaded_at DESC
     */
    std::vector<Dataset> listDatasets();

    /**
     * Load the decoded table for (datasetId, fingerprint).
     * Throws std::runtime_error when the dataset is unknown, has no stored
     * table, or its fingerprint differs from the requested one.
     */
    TablePtr loadDatasetTable(const std::string& datasetId, const std::string& fingerprint);

    // === Sessions ===

    /**
     * Create a session bound to a dataset. An empty title becomes
     * "Analysis of <dataset name>". Throws std::out_of_range for an
     * unknown dataset.
     */
    Session createSession(const std::string& datasetId, const std::string& title = "");

    std::optional<Session> getSession(const std::string& sessionId);

    /**
     * Sessions of a dataset ordered by updated_at DESC
     */
    std::vector<Session> listSessions(const std::string& datasetId);

    // === Exchanges ===

    /**
     * Append an exchange to a session. id, sequence, sessionId and createdAt
     * are assigned here; the stored record is returned.
     * Throws std::out_of_range for an unknown session.
     */
    Exchange appendExchange(const std::string& sessionId, const Exchange& exchange);

    /**
     * Full exchange log of a session in append order
     */
    std::vector<Exchange> history(const std::string& sessionId);

    size_t exchangeCount(const std::string& sessionId);

    const std::string& getDbPath() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace storage
} // namespace datachat
