#include <stdexcept>

#include <relay/common/badge.h>
#include <relay/common/database.h>
#include <relay/common/logging.h>
#include <relay/common/query.h>
#include <relay/common/transaction.h>

namespace relay
{
namespace common
{

void Transaction::control(const char* statement, const char* action)
{
    try
    {
        auto query = mDatabase.query();

        query = statement;
        query.execute();
    }
    catch (std::runtime_error& exception)
    {
        throw LogErrorF(mDatabase.logger(),
                        "Unable to %s transaction: %s",
                        action,
                        exception.what());
    }
}

Transaction::Transaction(Badge<Database>, Database& database)
  : mDatabase(database)
  , mActive(false)
{
    // Take the write lock now rather than on our first write.
    control("begin immediate", "begin");

    mActive = true;
}

Transaction::~Transaction()
{
    if (!mActive)
        return;

    try
    {
        rollback();
    }
    catch (std::runtime_error&)
    {
        // Already logged by control().
    }
}

bool Transaction::active() const
{
    return mActive;
}

void Transaction::commit()
{
    if (!mActive)
        throw LogError1(mDatabase.logger(), "Transaction is no longer active");

    control("commit", "commit");

    mActive = false;
}

Query Transaction::query()
{
    if (!mActive)
        throw LogError1(mDatabase.logger(), "Transaction is no longer active");

    return mDatabase.query();
}

void Transaction::rollback()
{
    if (!mActive)
        throw LogError1(mDatabase.logger(), "Transaction is no longer active");

    // Whatever happens, there's nothing left to roll back.
    mActive = false;

    control("rollback", "roll back");
}

} // common
} // relay

