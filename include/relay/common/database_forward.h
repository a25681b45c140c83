#pragma once

namespace relay
{
namespace common
{

template<typename T>
class Badge;

class Database;
class DatabaseBuilder;
class Field;
class Parameter;
class Query;
class Transaction;

} // common
} // relay

