#include <relay/common/query.h>
#include <relay/transfer/transfer_database_builder.h>

namespace relay
{
namespace transfer
{

using namespace common;

static void upgrade01(Query& query);

auto TransferDatabaseBuilder::upgrades() const -> const UpgradeVector&
{
    static const UpgradeVector upgrades = {
        &upgrade01
    }; // upgrades

    return upgrades;
}

TransferDatabaseBuilder::TransferDatabaseBuilder(Database& database)
  : common::DatabaseBuilder(database)
{
}

void upgrade01(Query& query)
{
    query = "create table transfers ( "
            "  bucket text "
            "  constraint nn_transfers_bucket "
            "             not null, "
            "  bytes_transferred integer "
            "  constraint nn_transfers_bytes_transferred "
            "             not null, "
            "  end_time text, "
            "  error text, "
            "  key_prefix text, "
            "  last_update_time text, "
            "  percentage integer "
            "  constraint nn_transfers_percentage "
            "             not null, "
            "  s3_key text, "
            "  s3_location text, "
            "  source_url text "
            "  constraint nn_transfers_source_url "
            "             not null, "
            "  start_time text, "
            "  status text "
            "  constraint nn_transfers_status "
            "             not null, "
            "  total_bytes integer "
            "  constraint nn_transfers_total_bytes "
            "             not null, "
            "  transfer_id text "
            "  constraint nn_transfers_transfer_id "
            "             not null, "
            "  ttl integer, "
            "  constraint pk_transfers "
            "             primary key (transfer_id), "
            "  constraint ck_transfers_status "
            "             check (status in ('pending', "
            "                               'in_progress', "
            "                               'completed', "
            "                               'failed')) "
            ")";

    query.execute();

    // Lets the cleanup process find expired records.
    query = "create index ix_transfers_ttl on transfers (ttl)";

    query.execute();
}

} // transfer
} // relay

