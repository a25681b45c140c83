#pragma once

#include <relay/common/database_builder.h>

namespace relay
{
namespace transfer
{

class TransferDatabaseBuilder
  : public common::DatabaseBuilder
{
    const UpgradeVector& upgrades() const override;

public:
    explicit TransferDatabaseBuilder(common::Database& database);
}; // TransferDatabaseBuilder

} // transfer
} // relay

