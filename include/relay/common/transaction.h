#pragma once

#include <relay/common/database_forward.h>

namespace relay
{
namespace common
{

// Holds the database's write lock until committed.
//
// Anything left uncommitted is rolled back when the transaction is
// destroyed.
class Transaction
{
    Database& mDatabase;

    // Cleared once we've committed or rolled back.
    bool mActive;

    // Run a statement that controls the transaction's lifetime.
    void control(const char* statement, const char* action);

public:
    Transaction(Badge<Database> badge, Database& database);

    Transaction(const Transaction& other) = delete;

    ~Transaction();

    Transaction& operator=(const Transaction& rhs) = delete;

    bool active() const;

    void commit();

    // Queries can only be issued while the transaction is active.
    Query query();

    void rollback();
}; // Transaction

} // common
} // relay

