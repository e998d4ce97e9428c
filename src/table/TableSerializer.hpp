#pragma once

#include "Column.hpp"
#include <nlohmann/json.hpp>
#include <vector>
#include <string>
#include <memory>
#include <functional>

namespace datachat {

class Table;
using TablePtr = std::shared_ptr<Table>;

using json = nlohmann::json;

/**
 * Single responsibility: table serialization
 */
class TableSerializer {
public:
    using ColumnGetter = std::function<IColumnPtr(const std::string&)>;

    /**
     * Serialize a table with its schema. This is the format tables are
     * persisted in and sent to the analysis worker:
     * {
     *   "columns": ["region", "revenue"],
     *   "schema": [{"name": "region", "type": "STRING"}, {"name": "revenue", "type": "INT"}],
     *   "data": [["East", 10], ["West", null]]
     * }
     * Null cells are written as JSON null.
     */
    static json toJsonWithSchema(
        size_t rowCount,
        const std::vector<std::string>& columnOrder,
        const ColumnGetter& getColumn
    );

    /**
     * Rebuild a table from the schema format above. Without a schema,
     * column types are inferred from the first row.
     * Throws std::invalid_argument on structurally invalid input.
     */
    static TablePtr fromJson(const json& j);

    static std::string columnTypeToString(ColumnType type);
    static ColumnType stringToColumnType(const std::string& typeStr);
};

} // namespace datachat
