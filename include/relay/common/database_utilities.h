#pragma once

#include <functional>
#include <type_traits>
#include <utility>

#include <relay/common/database.h>
#include <relay/common/query.h>
#include <relay/common/transaction.h>

namespace relay
{
namespace common
{

// Run function inside a transaction, committing if it returns normally.
template<typename Function>
auto withTransaction(Database& database, Function&& function)
  -> std::invoke_result_t<Function, Transaction&>
{
    using Result = std::invoke_result_t<Function, Transaction&>;

    auto lock = database.lock();
    auto transaction = database.transaction();

    if constexpr (std::is_void_v<Result>)
    {
        std::invoke(std::forward<Function>(function), transaction);
        transaction.commit();
    }
    else
    {
        auto result = std::invoke(std::forward<Function>(function), transaction);
        transaction.commit();
        return result;
    }
}

// Run function with a query inside its own transaction.
template<typename Function>
auto withQuery(Database& database, Function&& function)
  -> std::invoke_result_t<Function, Query&&>
{
    return withTransaction(database, [&function](Transaction& transaction) {
        return std::invoke(std::forward<Function>(function), transaction.query());
    });
}

} // common
} // relay

