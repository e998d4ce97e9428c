#include "engine/DatasetIngestor.hpp"
#include "common/Logger.hpp"
#include "common/StringUtil.hpp"
#include "table/TableProfiler.hpp"
#include "table/TableSerializer.hpp"
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace datachat {
namespace engine {

DatasetIngestor::DatasetIngestor(storage::SessionStore& store)
    : m_store(store) {
}

std::string DatasetIngestor::fingerprint(const std::string& bytes) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), digest);

    std::ostringstream stream;
    stream << "sha256:" << std::hex << std::setfill('0');
    for (const unsigned char c : digest) {
        stream << std::setw(2) << static_cast<int>(c);
    }
    stream << std::dec << ':' << bytes.size();
    return stream.str();
}

storage::Dataset DatasetIngestor::ingest(const std::string& name, const json& tableJson) {
    std::string cleanName = trim(name);
    if (cleanName.empty()) {
        throw std::invalid_argument("Dataset name is required.");
    }
    if (cleanName.size() > kMaxNameLength) {
        throw std::invalid_argument("Dataset name must be less than 255 characters.");
    }

    storage::Dataset dataset = m_store.registerDataset(cleanName);
    LOG_INFO("ingest", "Registered dataset " + dataset.id + " (" + cleanName + ")");

    try {
        m_store.updateDatasetStatus(dataset.id, storage::DatasetStatus::Processing);

        TablePtr table = TableSerializer::fromJson(tableJson);

        // Rejects tables without columns or rows
        storage::DatasetMetadata metadata;
        metadata.profile = TableProfiler::profile(*table);

        // Fingerprint the canonical form so equal tables hash equally
        json canonical = table->toJsonWithSchema();
        std::string bytes = canonical.dump();
        if (bytes.size() > kMaxTableBytes) {
            throw std::invalid_argument("File size must be less than 100MB.");
        }
        metadata.fileSizeBytes = bytes.size();

        std::string fp = fingerprint(bytes);
        m_store.saveDatasetTable(dataset.id, fp, canonical);
        m_store.updateDatasetStatus(dataset.id, storage::DatasetStatus::Ready, metadata);

        LOG_INFO("ingest", "Dataset " + dataset.id + " ready: " +
                 std::to_string(metadata.profile.rowCount) + " rows, " +
                 std::to_string(metadata.profile.columnCount) + " columns");
    } catch (const std::exception& e) {
        LOG_WARN("ingest", "Dataset " + dataset.id + " failed: " + e.what());

        storage::DatasetMetadata failed;
        failed.error = e.what();
        failed.parseWarnings.push_back(e.what());
        m_store.updateDatasetStatus(dataset.id, storage::DatasetStatus::Error, failed);
        throw;
    }

    auto stored = m_store.getDataset(dataset.id);
    if (!stored) {
        throw std::runtime_error("Dataset " + dataset.id + " disappeared after ingestion");
    }
    return *stored;
}

} // namespace engine
} // namespace datachat
