#pragma once

namespace relay
{

enum LogLevel : int;

} // relay

