#pragma once

#include "Column.hpp"
#include <nlohmann/json.hpp>
#include <unordered_map>
#include <vector>
#include <string>
#include <memory>

namespace datachat {

using json = nlohmann::json;

/**
 * Decoded in-memory table behind a dataset.
 *
 * Built once by the ingestion side (or by a loader feeding the dataset
 * cache), then shared read-only between concurrent queries through
 * ConstTablePtr. Nothing in the query path mutates a table after load.
 *
 * Responsibilities are split as in the rest of the module:
 * - Table: columns and structure
 * - TableSerializer: JSON with schema, fromJson
 * - TableProfiler: per-column statistics for dataset metadata
 */
class Table {
public:
    Table() = default;

    // Construction
    void addColumn(IColumnPtr column);
    void addIntColumn(const std::string& name);
    void addDoubleColumn(const std::string& name);
    void addStringColumn(const std::string& name);

    // Appends one row of textual cells; an empty cell in a numeric column is null
    void addRow(const std::vector<std::string>& values);

    // Accessors
    IColumnPtr getColumn(const std::string& name) const;
    bool hasColumn(const std::string& name) const;
    const std::vector<std::string>& getColumnNames() const { return m_columnOrder; }
    size_t rowCount() const;
    size_t columnCount() const { return m_columns.size(); }
    bool empty() const;
    size_t memoryUsage() const;

    // Serialization (delegates to TableSerializer)
    json toJsonWithSchema() const;

private:
    std::unordered_map<std::string, IColumnPtr> m_columns;
    std::vector<std::string> m_columnOrder;
};

using TablePtr = std::shared_ptr<Table>;
using ConstTablePtr = std::shared_ptr<const Table>;

} // namespace datachat
