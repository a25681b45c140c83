#include <utility>

#include <sqlite3.h>

#include <relay/common/badge.h>
#include <relay/common/database.h>
#include <relay/common/logging.h>
#include <relay/common/query.h>

namespace relay
{
namespace common
{

std::int64_t Field::integer() const
{
    auto type = sqlite3_column_type(mQuery.mStatement, mColumn);

    if (type != SQLITE_INTEGER)
        throw LogErrorF(mQuery.logger(),
                        "Column %d doesn't contain an integer",
                        mColumn);

    return sqlite3_column_int64(mQuery.mStatement, mColumn);
}

std::string Field::text() const
{
    auto type = sqlite3_column_type(mQuery.mStatement, mColumn);

    if (type != SQLITE_TEXT)
        throw LogErrorF(mQuery.logger(),
                        "Column %d doesn't contain text",
                        mColumn);

    auto* data = sqlite3_column_text(mQuery.mStatement, mColumn);
    auto size = sqlite3_column_bytes(mQuery.mStatement, mColumn);

    if (!data)
        throw LogErrorF(mQuery.logger(),
                        "Couldn't read column %d: %s",
                        mColumn,
                        sqlite3_errmsg(mQuery.handle()));

    return std::string(reinterpret_cast<const char*>(data),
                       static_cast<std::size_t>(size));
}

Field::Field(Query& query, int column)
  : mQuery(query)
  , mColumn(column)
{
}

bool Field::null() const
{
    return sqlite3_column_type(mQuery.mStatement, mColumn) == SQLITE_NULL;
}

void Parameter::integer(std::int64_t value)
{
    mQuery.check(sqlite3_bind_int64(mQuery.mStatement, mIndex, value),
                 "bind parameter");
}

void Parameter::none()
{
    mQuery.check(sqlite3_bind_null(mQuery.mStatement, mIndex),
                 "bind parameter");
}

void Parameter::text(const char* data, std::size_t length)
{
    auto result = sqlite3_bind_text(mQuery.mStatement,
                                    mIndex,
                                    data,
                                    static_cast<int>(length),
                                    SQLITE_TRANSIENT);

    mQuery.check(result, "bind parameter");
}

Parameter::Parameter(Query& query, int index)
  : mQuery(query)
  , mIndex(index)
{
}

void Query::check(int result, const char* action) const
{
    if (result == SQLITE_OK)
        return;

    throw LogErrorF(logger(),
                    "Couldn't %s: %s",
                    action,
                    sqlite3_errmsg(handle()));
}

sqlite3* Query::handle() const
{
    return mDatabase->handle(Badge<Query>());
}

Query::Query(Badge<Database>, Database& database)
  : mDatabase(&database)
  , mColumns()
  , mParameters()
  , mRow(false)
  , mStatement(nullptr)
{
}

Query::Query(Query&& other)
  : mDatabase(other.mDatabase)
  , mColumns(std::move(other.mColumns))
  , mParameters(std::move(other.mParameters))
  , mRow(std::exchange(other.mRow, false))
  , mStatement(std::exchange(other.mStatement, nullptr))
{
}

Query::~Query()
{
    sqlite3_finalize(mStatement);
}

Query& Query::operator=(const char* statement)
{
    sqlite3_stmt* prepared = nullptr;

    check(sqlite3_prepare_v2(handle(), statement, -1, &prepared, nullptr),
          "prepare statement");

    std::unordered_map<std::string, int> columns;
    std::unordered_map<std::string, int> parameters;

    for (auto i = 0, j = sqlite3_column_count(prepared); i < j; ++i)
        columns.emplace(sqlite3_column_name(prepared, i), i);

    // Parameter indices start at one.
    for (auto i = 1, j = sqlite3_bind_parameter_count(prepared); i <= j; ++i)
    {
        if (auto* name = sqlite3_bind_parameter_name(prepared, i))
            parameters.emplace(name, i);
    }

    sqlite3_finalize(mStatement);

    mColumns = std::move(columns);
    mParameters = std::move(parameters);
    mRow = false;
    mStatement = prepared;

    return *this;
}

Query& Query::operator=(const std::string& statement)
{
    return operator=(statement.c_str());
}

Query::operator bool() const
{
    return mRow;
}

bool Query::operator!() const
{
    return !mRow;
}

std::uint64_t Query::changed() const
{
    return static_cast<std::uint64_t>(sqlite3_changes(handle()));
}

bool Query::execute()
{
    if (!mStatement)
        throw LogError1(logger(), "Couldn't execute query: Nothing prepared");

    // Rewind in case the statement has been run before.
    sqlite3_reset(mStatement);

    return next();
}

Field Query::field(const std::string& name)
{
    auto i = mColumns.find(name);

    if (i == mColumns.end())
        throw LogErrorF(logger(), "Query has no column named %s", name.c_str());

    return Field(*this, i->second);
}

Logger& Query::logger() const
{
    return mDatabase->logger();
}

bool Query::next()
{
    if (!mStatement)
        throw LogError1(logger(), "Couldn't step query: Nothing prepared");

    auto result = sqlite3_step(mStatement);

    mRow = result == SQLITE_ROW;

    if (mRow || result == SQLITE_DONE)
        return mRow;

    // Clears the statement's error so it can be run again.
    sqlite3_reset(mStatement);

    throw LogErrorF(logger(),
                    "Couldn't execute query: %s",
                    sqlite3_errmsg(handle()));
}

Parameter Query::param(const std::string& name)
{
    auto i = mParameters.find(name);

    if (i == mParameters.end())
        throw LogErrorF(logger(), "Query has no parameter named %s", name.c_str());

    return Parameter(*this, i->second);
}

} // common
} // relay

