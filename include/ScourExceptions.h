#ifndef SCOUR_EXCEPTIONS_H
#define SCOUR_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Scour {

class ScourException : public std::runtime_error {
public:
    explicit ScourException(const std::string& message) : std::runtime_error(message) {}
};

class TableException : public ScourException {
public:
    explicit TableException(const std::string& message) : ScourException("Table Error: " + message) {}
};

class ConfigurationException : public ScourException {
public:
    explicit ConfigurationException(const std::string& message) : ScourException("Configuration Error: " + message) {}
};

// Raised when a requested column is absent from the table.
class ColumnNotFoundException : public ScourException {
public:
    explicit ColumnNotFoundException(const std::string& column)
        : ScourException("Missing column: '" + column + "'"), column_(column) {}

    const std::string& column() const noexcept { return column_; }

private:
    std::string column_;
};

// Raised when a column exists but its logical type does not fit the operation.
class ColumnTypeException : public ScourException {
public:
    ColumnTypeException(const std::string& column, const std::string& actualType, const std::string& expectedType)
        : ScourException("Column '" + column + "' has type " + actualType + ", expected " + expectedType),
          column_(column), actualType_(actualType), expectedType_(expectedType) {}

    const std::string& column() const noexcept { return column_; }
    const std::string& actualType() const noexcept { return actualType_; }
    const std::string& expectedType() const noexcept { return expectedType_; }

private:
    std::string column_;
    std::string actualType_;
    std::string expectedType_;
};

} // namespace Scour

#endif // SCOUR_EXCEPTIONS_H
