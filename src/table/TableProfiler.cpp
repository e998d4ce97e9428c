#include "TableProfiler.hpp"
#include "TableSerializer.hpp"
#include <algorithm>
#include <stdexcept>

namespace datachat {

TableProfile TableProfiler::profile(const Table& table) {
    if (table.columnCount() == 0) {
        throw std::invalid_argument("Table has no columns");
    }
    if (table.rowCount() == 0) {
        throw std::invalid_argument("Table has no data rows");
    }

    TableProfile result;
    result.rowCount = table.rowCount();
    result.columnCount = table.columnCount();

    for (const auto& name : table.getColumnNames()) {
        auto col = table.getColumn(name);

        ColumnProfile colProfile;
        colProfile.name = name;
        colProfile.declaredType = TableSerializer::columnTypeToString(col->getType());
        colProfile.nullCount = col->nullCount();

        for (size_t i = 0; i < col->size() && colProfile.sampleValues.size() < kSampleValues; ++i) {
            if (col->isNull(i)) continue;
            std::string value = col->valueAsString(i);
            auto& samples = colProfile.sampleValues;
            if (std::find(samples.begin(), samples.end(), value) == samples.end()) {
                samples.push_back(std::move(value));
            }
        }

        result.columns.push_back(std::move(colProfile));
    }

    return result;
}

json TableProfiler::toJson(const TableProfile& profile) {
    json columns = json::array();
    for (const auto& col : profile.columns) {
        columns.push_back({
            {"name", col.name},
            {"dtype", col.declaredType},
            {"null_count", col.nullCount},
            {"sample_values", col.sampleValues}
        });
    }

    return {
        {"row_count", profile.rowCount},
        {"column_count", profile.columnCount},
        {"columns", columns}
    };
}

TableProfile TableProfiler::fromJson(const json& j) {
    TableProfile profile;
    profile.rowCount = j.value("row_count", size_t{0});
    profile.columnCount = j.value("column_count", size_t{0});

    if (j.contains("columns") && j["columns"].is_array()) {
        for (const auto& c : j["columns"]) {
            ColumnProfile col;
            col.name = c.value("name", "");
            col.declaredType = c.value("dtype", "STRING");
            col.nullCount = c.value("null_count", size_t{0});
            col.sampleValues = c.value("sample_values", std::vector<std::string>{});
            profile.columns.push_back(std::move(col));
        }
    }

    return profile;
}

} // namespace datachat
