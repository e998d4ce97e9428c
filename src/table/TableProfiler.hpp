#pragma once

#include "Table.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace datachat {

using json = nlohmann::json;

struct ColumnProfile {
    std::string name;
    std::string declaredType;              // "INT", "DOUBLE", "STRING"
    size_t nullCount = 0;
    std::vector<std::string> sampleValues; // first distinct non-null values
};

struct TableProfile {
    size_t rowCount = 0;
    size_t columnCount = 0;
    std::vector<ColumnProfile> columns;
};

/**
 * Column statistics shown to users and sent to the analysis worker as a
 * schema hint.
 */
class TableProfiler {
public:
    static constexpr size_t kSampleValues = 5;

    /**
     * Profile a table.
     * Throws std::invalid_argument when the table has no columns or no rows.
     */
    static TableProfile profile(const Table& table);

    static json toJson(const TableProfile& profile);
    static TableProfile fromJson(const json& j);
};

} // namespace datachat
