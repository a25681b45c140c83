#pragma once

namespace relay
{
namespace common
{

class Task;
class TaskQueue;

} // common
} // relay

