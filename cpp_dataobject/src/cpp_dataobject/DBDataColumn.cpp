#include "cpp_dataobject/src/cpp_dataobject/DBDataColumn.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include "cpp_dataobject/src/cpp_dataobject/DBExceptions.hpp"
#include "cpp_dataobject/src/utils/DataHelper.hpp"

namespace cpp_dataobject
{

DataColumn::DataColumn(std::string name,
                       SqlDataType type,
                       const DataValue& value,
                       ColumnOptions options)
  : name_{std::move(name)}, type_{type}, value_{}, options_{options}
{
  if (!isValidSqlDataType(type_))
  {
    throw ArgumentError("Invalid data type for column " + name_);
  }

  if (!isNull(value))
  {
    setValue(value);
  }
}

DataColumn DataColumn::makeString(std::string name,
                                  const DataValue& value,
                                  ColumnOptions options)
{
  return DataColumn(std::move(name), SqlDataType::String, value, options);
}

DataColumn DataColumn::makeText(std::string name,
                                const DataValue& value,
                                ColumnOptions options)
{
  return DataColumn(std::move(name), SqlDataType::Text, value, options);
}

DataColumn DataColumn::makeData(std::string name,
                                const DataValue& value,
                                ColumnOptions options)
{
  return DataColumn(std::move(name), SqlDataType::Data, value, options);
}

DataColumn DataColumn::makeInteger(std::string name,
                                   const DataValue& value,
                                   ColumnOptions options)
{
  return DataColumn(std::move(name), SqlDataType::Integer, value, options);
}

DataColumn DataColumn::makeFloat(std::string name,
                                 const DataValue& value,
                                 ColumnOptions options)
{
  return DataColumn(std::move(name), SqlDataType::Float, value, options);
}

DataColumn DataColumn::makeBool(std::string name,
                                const DataValue& value,
                                ColumnOptions options)
{
  return DataColumn(std::move(name), SqlDataType::Bool, value, options);
}

DataColumn DataColumn::makeTimestamp(std::string name,
                                     const DataValue& value,
                                     ColumnOptions options)
{
  return DataColumn(std::move(name), SqlDataType::Timestamp, value, options);
}

void DataColumn::setValue(const DataValue& value)
{
  if (type_ == SqlDataType::Timestamp)
  {
    value_ = data_helper::asDateTime(value);
    return;
  }

  if (isNull(value))
  {
    value_ = std::monostate{};
    return;
  }

  bool accepted = false;
  switch (type_)
  {
    case SqlDataType::String:
    case SqlDataType::Text:
      accepted = std::holds_alternative<std::string>(value);
      break;
    case SqlDataType::Data:
      accepted = std::holds_alternative<Blob>(value);
      break;
    case SqlDataType::Integer:
      accepted = std::holds_alternative<std::int64_t>(value);
      break;
    case SqlDataType::Float:
      accepted = std::holds_alternative<double>(value);
      break;
    case SqlDataType::Bool:
      accepted = std::holds_alternative<bool>(value);
      break;
    case SqlDataType::Timestamp:
      break;
  }

  if (!accepted)
  {
    throw TypeMismatchError(name_, "Value is not " + toString(type_));
  }

  value_ = value;
}

bool DataColumn::isIdentity() const
{
  return boost::algorithm::iequals(name_, "Id");
}

}  // namespace cpp_dataobject
