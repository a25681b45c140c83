#pragma once

#include <relay/common/expected.h>
#include <relay/transfer/transfer_error.h>

namespace relay
{
namespace transfer
{

template<typename T>
using ErrorOr = common::Expected<TransferError, T>;

} // transfer
} // relay

