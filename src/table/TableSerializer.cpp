#include "TableSerializer.hpp"
#include "Table.hpp"
#include <stdexcept>

namespace datachat {

namespace {

json cellToJson(const IColumnPtr& col, size_t row) {
    if (col->isNull(row)) {
        return nullptr;
    }
    if (auto intCol = std::dynamic_pointer_cast<IntColumn>(col)) {
        return intCol->at(row);
    }
    if (auto doubleCol = std::dynamic_pointer_cast<DoubleColumn>(col)) {
        return doubleCol->at(row);
    }
    if (auto stringCol = std::dynamic_pointer_cast<StringColumn>(col)) {
        return stringCol->at(row);
    }
    return nullptr;
}

ColumnType inferType(const json& val) {
    if (val.is_number_integer()) return ColumnType::INT;
    if (val.is_number_float()) return ColumnType::DOUBLE;
    return ColumnType::STRING;
}

void appendCell(const IColumnPtr& col, const json& val) {
    if (val.is_null()) {
        col->pushNull();
        return;
    }

    if (auto intCol = std::dynamic_pointer_cast<IntColumn>(col)) {
        if (val.is_number_integer()) {
            intCol->push_back(val.get<int64_t>());
        } else if (val.is_number()) {
            intCol->push_back(static_cast<int64_t>(val.get<double>()));
        } else if (val.is_string() && !val.get<std::string>().empty()) {
            intCol->push_back(std::stoll(val.get<std::string>()));
        } else {
            intCol->pushNull();
        }
    } else if (auto doubleCol = std::dynamic_pointer_cast<DoubleColumn>(col)) {
        if (val.is_number()) {
            doubleCol->push_back(val.get<double>());
        } else if (val.is_string() && !val.get<std::string>().empty()) {
            doubleCol->push_back(std::stod(val.get<std::string>()));
        } else {
            doubleCol->pushNull();
        }
    } else if (auto stringCol = std::dynamic_pointer_cast<StringColumn>(col)) {
        if (val.is_string()) {
            stringCol->push_back(val.get<std::string>());
        } else {
            stringCol->push_back(val.dump());
        }
    }
}

} // anonymous namespace

std::string TableSerializer::columnTypeToString(ColumnType type) {
    switch (type) {
        case ColumnType::INT: return "INT";
        case ColumnType::DOUBLE: return "DOUBLE";
        case ColumnType::STRING: return "STRING";
        default: return "STRING";
    }
}

ColumnType TableSerializer::stringToColumnType(const std::string& typeStr) {
    if (typeStr == "INT") return ColumnType::INT;
    if (typeStr == "DOUBLE") return ColumnType::DOUBLE;
    if (typeStr == "STRING") return ColumnType::STRING;
    throw std::invalid_argument("Unknown column type: " + typeStr);
}

json TableSerializer::toJsonWithSchema(
    size_t rowCount,
    const std::vector<std::string>& columnOrder,
    const ColumnGetter& getColumn
) {
    json result = json::object();
    result["columns"] = columnOrder;

    std::vector<IColumnPtr> columns;
    columns.reserve(columnOrder.size());

    json schema = json::array();
    for (const auto& colName : columnOrder) {
        auto col = getColumn(colName);
        columns.push_back(col);
        schema.push_back({{"name", colName}, {"type", columnTypeToString(col->getType())}});
    }
    result["schema"] = schema;

    json data = json::array();
    for (size_t i = 0; i < rowCount; ++i) {
        json row = json::array();
        for (const auto& col : columns) {
            row.push_back(cellToJson(col, i));
        }
        data.push_back(std::move(row));
    }

    result["data"] = std::move(data);
    return result;
}

TablePtr TableSerializer::fromJson(const json& j) {
    if (!j.is_object() || !j.contains("columns") || !j.contains("data")) {
        throw std::invalid_argument("Invalid table JSON: missing 'columns' or 'data'");
    }

    const auto& columns = j["columns"];
    const auto& data = j["data"];
    if (!columns.is_array() || !data.is_array()) {
        throw std::invalid_argument("Invalid table JSON: 'columns' and 'data' must be arrays");
    }

    std::vector<ColumnType> columnTypes;

    if (j.contains("schema") && j["schema"].is_array()) {
        if (j["schema"].size() != columns.size()) {
            throw std::invalid_argument("Invalid table JSON: schema has " +
                                        std::to_string(j["schema"].size()) + " entries for " +
                                        std::to_string(columns.size()) + " columns");
        }
        for (const auto& colSchema : j["schema"]) {
            columnTypes.push_back(stringToColumnType(colSchema.value("type", "STRING")));
        }
    } else if (!data.empty() && data[0].is_array()) {
        const auto& firstRow = data[0];
        for (size_t i = 0; i < columns.size(); ++i) {
            columnTypes.push_back(i < firstRow.size() ? inferType(firstRow[i]) : ColumnType::STRING);
        }
    } else {
        columnTypes.resize(columns.size(), ColumnType::STRING);
    }

    auto table = std::make_shared<Table>();
    std::vector<IColumnPtr> typed;
    typed.reserve(columns.size());

    for (size_t i = 0; i < columns.size(); ++i) {
        if (!columns[i].is_string()) {
            throw std::invalid_argument("Invalid table JSON: column names must be strings");
        }
        std::string colName = columns[i].get<std::string>();
        IColumnPtr col;
        switch (columnTypes[i]) {
            case ColumnType::INT:
                col = std::make_shared<IntColumn>(colName);
                break;
            case ColumnType::DOUBLE:
                col = std::make_shared<DoubleColumn>(colName);
                break;
            case ColumnType::STRING:
                col = std::make_shared<StringColumn>(colName);
                break;
        }
        col->reserve(data.size());
        typed.push_back(col);
    }

    size_t rowIndex = 0;
    for (const auto& row : data) {
        if (!row.is_array() || row.size() != columns.size()) {
            throw std::invalid_argument("Invalid table JSON: row " + std::to_string(rowIndex) +
                                        " does not have " + std::to_string(columns.size()) +
                                        " cells");
        }
        for (size_t i = 0; i < typed.size(); ++i) {
            try {
                appendCell(typed[i], row[i]);
            } catch (const std::logic_error&) {
                throw std::invalid_argument("Invalid table JSON: bad value in row " +
                                            std::to_string(rowIndex) + ", column '" +
                                            typed[i]->getName() + "'");
            }
        }
        ++rowIndex;
    }

    for (const auto& col : typed) {
        table->addColumn(col);
    }

    return table;
}

} // namespace datachat
