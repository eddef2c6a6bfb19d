#include "cpp_dataobject/src/cpp_dataobject/DBDataObject.hpp"

namespace cpp_dataobject
{

bool validate(DataObject& object,
              const std::vector<std::string>& filter,
              bool stopOnFirstError)
{
  return object.columns().doValidation(
    filter,
    stopOnFirstError,
    [&object](RowMapper& mapper) { object.localValidation(mapper); });
}

std::int64_t insertObject(Connection& connection, DataObject& object)
{
  connection.newQuery();
  object.columns().queryInsertInto(connection, object.tableName());
  return connection.lastId();
}

}  // namespace cpp_dataobject
