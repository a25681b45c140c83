#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include <relay/common/database_forward.h>

namespace relay
{
namespace common
{

// Brings a database's schema up to date.
//
// The schema's version is kept in SQLite's user_version pragma. Upgrade n
// takes the schema from version n to version n + 1.
class DatabaseBuilder
{
public:
    using Upgrade = std::function<void(Query&)>;
    using UpgradeVector = std::vector<Upgrade>;

private:
    virtual const UpgradeVector& upgrades() const = 0;

    Database& mDatabase;

protected:
    explicit DatabaseBuilder(Database& database);

    ~DatabaseBuilder() = default;

public:
    // Apply any upgrades the database hasn't seen yet.
    //
    // Returns the schema's resulting version.
    std::size_t build();
}; // DatabaseBuilder

} // common
} // relay

