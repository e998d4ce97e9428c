#include "Table.hpp"
#include "TableSerializer.hpp"
#include <stdexcept>

namespace datachat {

// ============================================================================
// Construction
// ============================================================================

void Table::addColumn(IColumnPtr column) {
    if (!column) {
        throw std::invalid_argument("Cannot add null column");
    }

    const auto& name = column->getName();
    if (m_columns.find(name) != m_columns.end()) {
        throw std::invalid_argument("Column '" + name + "' already exists");
    }
    if (!m_columns.empty() && column->size() != rowCount()) {
        throw std::invalid_argument("Column '" + name + "' has " +
                                    std::to_string(column->size()) + " rows, expected " +
                                    std::to_string(rowCount()));
    }

    m_columns[name] = column;
    m_columnOrder.push_back(name);
}

void Table::addIntColumn(const std::string& name) {
    addColumn(std::make_shared<IntColumn>(name));
}

void Table::addDoubleColumn(const std::string& name) {
    addColumn(std::make_shared<DoubleColumn>(name));
}

void Table::addStringColumn(const std::string& name) {
    addColumn(std::make_shared<StringColumn>(name));
}

void Table::addRow(const std::vector<std::string>& values) {
    if (values.size() != m_columnOrder.size()) {
        throw std::invalid_argument("Row size mismatch: got " + std::to_string(values.size()) +
                                    " values for " + std::to_string(m_columnOrder.size()) +
                                    " columns");
    }

    for (size_t i = 0; i < values.size(); ++i) {
        auto col = m_columns.at(m_columnOrder[i]);
        const auto& value = values[i];

        if (auto intCol = std::dynamic_pointer_cast<IntColumn>(col)) {
            if (value.empty()) intCol->pushNull();
            else intCol->push_back(std::stoll(value));
        } else if (auto doubleCol = std::dynamic_pointer_cast<DoubleColumn>(col)) {
            if (value.empty()) doubleCol->pushNull();
            else doubleCol->push_back(std::stod(value));
        } else if (auto stringCol = std::dynamic_pointer_cast<StringColumn>(col)) {
            stringCol->push_back(value);
        }
    }
}

// ============================================================================
// Accessors
// ============================================================================

IColumnPtr Table::getColumn(const std::string& name) const {
    auto it = m_columns.find(name);
    if (it == m_columns.end()) {
        throw std::out_of_range("Column '" + name + "' not found");
    }
    return it->second;
}

bool Table::hasColumn(const std::string& name) const {
    return m_columns.find(name) != m_columns.end();
}

size_t Table::rowCount() const {
    if (m_columns.empty()) return 0;
    return m_columns.begin()->second->size();
}

bool Table::empty() const {
    return m_columns.empty() || rowCount() == 0;
}

size_t Table::memoryUsage() const {
    size_t total = 0;
    for (const auto& [name, col] : m_columns) {
        total += name.capacity() + col->memoryUsage();
    }
    return total;
}

// ============================================================================
// Serialization
// ============================================================================

json Table::toJsonWithSchema() const {
    auto columnGetter = [this](const std::string& name) { return getColumn(name); };
    return TableSerializer::toJsonWithSchema(rowCount(), m_columnOrder, columnGetter);
}

} // namespace datachat
