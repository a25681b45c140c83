#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <unordered_map>

#include <relay/common/database_forward.h>
#include <relay/common/logger_forward.h>

struct sqlite3;
struct sqlite3_stmt;

namespace relay
{
namespace common
{

// A column of the current row.
class Field
{
    Query& mQuery;
    int mColumn;

    std::int64_t integer() const;

    std::string text() const;

public:
    Field(Query& query, int column);

    template<typename T>
    auto get() const
      -> std::enable_if_t<std::is_integral_v<T>, T>
    {
        return static_cast<T>(integer());
    }

    template<typename T>
    auto get() const
      -> std::enable_if_t<std::is_same_v<T, std::string>, T>
    {
        return text();
    }

    bool null() const;
}; // Field

// A named placeholder in a prepared statement.
class Parameter
{
    Query& mQuery;
    int mIndex;

    void integer(std::int64_t value);

    void none();

    void text(const char* data, std::size_t length);

public:
    Parameter(Query& query, int index);

    template<typename T>
    auto set(T value)
      -> std::enable_if_t<std::is_integral_v<T>>
    {
        integer(static_cast<std::int64_t>(value));
    }

    void set(const std::string& value)
    {
        text(value.data(), value.size());
    }

    void set(const char* value)
    {
        set(std::string(value));
    }

    void set(std::nullptr_t)
    {
        none();
    }
}; // Parameter

// A prepared statement and its current row.
class Query
{
    friend class Field;
    friend class Parameter;

    // Throws when something's gone wrong with the statement.
    void check(int result, const char* action) const;

    sqlite3* handle() const;

    Database* mDatabase;

    // Maps column names to column indices.
    std::unordered_map<std::string, int> mColumns;

    // Maps parameter names to parameter indices.
    std::unordered_map<std::string, int> mParameters;

    // Is a row available?
    bool mRow;

    sqlite3_stmt* mStatement;

public:
    Query(Badge<Database> badge, Database& database);

    Query(Query&& other);

    ~Query();

    // Prepare a new statement.
    Query& operator=(const char* statement);

    Query& operator=(const std::string& statement);

    // True if a row is available.
    explicit operator bool() const;

    bool operator!() const;

    // How many rows did the last statement modify?
    std::uint64_t changed() const;

    // Run the statement, returning true if it produced a row.
    bool execute();

    Field field(const std::string& name);

    Logger& logger() const;

    // Advance to the next row.
    bool next();

    Parameter param(const std::string& name);
}; // Query

} // common
} // relay

