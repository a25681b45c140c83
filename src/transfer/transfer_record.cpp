#include <relay/transfer/transfer_record.h>

namespace relay
{
namespace transfer
{

const char* toString(TransferStatus status)
{
    switch (status)
    {
#define DEFINE_TRANSFER_STATUS_CLAUSE(name, text) case TRANSFER_ ## name: return #text;
        DEFINE_TRANSFER_STATUSES(DEFINE_TRANSFER_STATUS_CLAUSE);
#undef DEFINE_TRANSFER_STATUS_CLAUSE
    }

    // Silence the compiler.
    return "N/A";
}

std::optional<TransferStatus> toTransferStatus(const std::string& text)
{
#define DEFINE_TRANSFER_STATUS_CLAUSE(name, text_) \
    if (text == #text_) \
        return TRANSFER_ ## name;

    DEFINE_TRANSFER_STATUSES(DEFINE_TRANSFER_STATUS_CLAUSE);

#undef DEFINE_TRANSFER_STATUS_CLAUSE

    return std::nullopt;
}

bool terminal(TransferStatus status)
{
    return status == TRANSFER_COMPLETED || status == TRANSFER_FAILED;
}

} // transfer
} // relay

