#pragma once

namespace relay
{
namespace common
{

class Logger;

} // common
} // relay

