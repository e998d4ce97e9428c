#pragma once

#include "storage/SessionStore.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace datachat {
namespace engine {

using json = nlohmann::json;

/**
 * Turns an already-decoded table into a Ready dataset.
 *
 * The dataset is registered as Pending, moved to Processing, then the
 * table is validated and profiled, fingerprinted and stored before the
 * dataset becomes Ready. Any failure after registration leaves the
 * dataset in Error with the reason in its metadata, and is rethrown.
 */
class DatasetIngestor {
public:
    static constexpr size_t kMaxNameLength = 255;
    static constexpr size_t kMaxTableBytes = 104857600;     // 100 MB

    explicit DatasetIngestor(storage::SessionStore& store);

    /**
     * Ingest a table in {columns, schema, data} form.
     * Throws std::invalid_argument for a bad name (nothing is registered)
     * or a table that fails validation.
     */
    storage::Dataset ingest(const std::string& name, const json& tableJson);

    /**
     * "sha256:<hex>:<size>" over the given bytes
     */
    static std::string fingerprint(const std::string& bytes);

private:
    storage::SessionStore& m_store;
};

} // namespace engine
} // namespace datachat
