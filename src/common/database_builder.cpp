#include <string>

#include <relay/common/database_builder.h>
#include <relay/common/database_utilities.h>
#include <relay/common/logging.h>

namespace relay
{
namespace common
{

DatabaseBuilder::DatabaseBuilder(Database& database)
  : mDatabase(database)
{
}

std::size_t DatabaseBuilder::build()
{
    auto& upgrades = this->upgrades();

    return withQuery(mDatabase, [&](Query&& query) {
        query = "pragma user_version";
        query.execute();

        auto version = query.field("user_version").get<std::size_t>();

        // Written by a newer release.
        if (version > upgrades.size())
            throw LogErrorF(query.logger(),
                            "Database schema version %zu isn't supported",
                            version);

        for (; version < upgrades.size(); ++version)
        {
            LogDebugF(query.logger(),
                      "Upgrading database schema to version %zu",
                      version + 1);

            upgrades[version](query);

            // Pragmas can't take bound parameters.
            query = "pragma user_version = " + std::to_string(version + 1);
            query.execute();
        }

        return version;
    });
}

} // common
} // relay

