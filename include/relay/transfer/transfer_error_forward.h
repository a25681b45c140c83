#pragma once

namespace relay
{
namespace transfer
{

enum ErrorKind : unsigned int;

struct TransferError;

} // transfer
} // relay

