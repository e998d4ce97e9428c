#pragma once

#include <vector>
#include <string>
#include <memory>
#include <cstdint>
#include <sstream>

namespace datachat {

enum class ColumnType {
    INT,
    DOUBLE,
    STRING
};

/**
 * Base interface for typed table columns.
 *
 * Columns are append-only while a table is being built and read-only once
 * the table has been handed to the cache. Missing values are tracked in a
 * validity vector so the profiler can report null counts.
 */
class IColumn {
public:
    virtual ~IColumn() = default;

    virtual const std::string& getName() const = 0;
    virtual ColumnType getType() const = 0;
    virtual size_t size() const = 0;
    virtual void reserve(size_t capacity) = 0;

    virtual void pushNull() = 0;
    virtual bool isNull(size_t index) const = 0;
    virtual size_t nullCount() const = 0;

    // Display form of a cell, empty for null
    virtual std::string valueAsString(size_t index) const = 0;

    // Rough in-memory footprint, used for cache diagnostics
    virtual size_t memoryUsage() const = 0;
};

/**
 * Shared storage for fixed-width columns.
 */
template <typename T, ColumnType Type>
class ScalarColumn : public IColumn {
public:
    explicit ScalarColumn(const std::string& name) : m_name(name) {}

    const std::string& getName() const override { return m_name; }
    ColumnType getType() const override { return Type; }
    size_t size() const override { return m_data.size(); }

    void reserve(size_t capacity) override {
        m_data.reserve(capacity);
        m_valid.reserve(capacity);
    }

    void push_back(T value) {
        m_data.push_back(value);
        m_valid.push_back(true);
    }

    void pushNull() override {
        m_data.push_back(T{});
        m_valid.push_back(false);
        ++m_nullCount;
    }

    bool isNull(size_t index) const override { return !m_valid[index]; }
    size_t nullCount() const override { return m_nullCount; }

    T at(size_t index) const { return m_data[index]; }
    const std::vector<T>& data() const { return m_data; }

    std::string valueAsString(size_t index) const override {
        if (isNull(index)) return "";
        std::ostringstream oss;
        oss << m_data[index];
        return oss.str();
    }

    size_t memoryUsage() const override {
        return m_data.capacity() * sizeof(T) + m_valid.capacity() / 8;
    }

private:
    std::string m_name;
    std::vector<T> m_data;
    std::vector<bool> m_valid;
    size_t m_nullCount = 0;
};

using IntColumn = ScalarColumn<int64_t, ColumnType::INT>;
using DoubleColumn = ScalarColumn<double, ColumnType::DOUBLE>;

class StringColumn : public IColumn {
public:
    explicit StringColumn(const std::string& name) : m_name(name) {}

    const std::string& getName() const override { return m_name; }
    ColumnType getType() const override { return ColumnType::STRING; }
    size_t size() const override { return m_data.size(); }

    void reserve(size_t capacity) override {
        m_data.reserve(capacity);
        m_valid.reserve(capacity);
    }

    void push_back(const std::string& value) {
        m_data.push_back(value);
        m_valid.push_back(true);
    }

    void pushNull() override {
        m_data.emplace_back();
        m_valid.push_back(false);
        ++m_nullCount;
    }

    bool isNull(size_t index) const override { return !m_valid[index]; }
    size_t nullCount() const override { return m_nullCount; }

    const std::string& at(size_t index) const { return m_data[index]; }
    const std::vector<std::string>& data() const { return m_data; }

    std::string valueAsString(size_t index) const override {
        return m_data[index];
    }

    size_t memoryUsage() const override {
        size_t total = m_data.capacity() * sizeof(std::string) + m_valid.capacity() / 8;
        for (const auto& str : m_data) {
            total += str.capacity();
        }
        return total;
    }

private:
    std::string m_name;
    std::vector<std::string> m_data;
    std::vector<bool> m_valid;
    size_t m_nullCount = 0;
};

using IColumnPtr = std::shared_ptr<IColumn>;

} // namespace datachat
