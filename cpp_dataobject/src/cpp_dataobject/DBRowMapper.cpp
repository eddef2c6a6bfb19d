#include "cpp_dataobject/src/cpp_dataobject/DBRowMapper.hpp"

#include <algorithm>
#include <utility>

#include "cpp_dataobject/src/utils/DataHelper.hpp"
#include "cpp_dataobject/src/utils/StringUtils.hpp"

namespace cpp_dataobject
{

namespace
{

bool contains(const std::vector<std::string>& keys, const std::string& key)
{
  return std::find(keys.begin(), keys.end(), key) != keys.end();
}

std::size_t valueLength(const DataValue& value)
{
  if (const auto* blob = std::get_if<Blob>(&value))
  {
    return blob->size();
  }
  return data_helper::asString(value).size();
}

}  // namespace

RowMapper::RowMapper(std::shared_ptr<spdlog::logger> pLogger)
  : tableName_{},
    columns_{},
    validationErrors_{},
    validationStarted_{false},
    pLogger_{std::move(pLogger)}
{
}

RowMapper::RowMapper(std::string tableName,
                     std::vector<DataColumn> columns,
                     std::shared_ptr<spdlog::logger> pLogger)
  : RowMapper{std::move(pLogger)}
{
  tableName_ = std::move(tableName);
  addColumns(std::move(columns));
}

void RowMapper::addColumns(std::vector<DataColumn> columns)
{
  columns_.reserve(columns_.size() + columns.size());
  for (auto& column : columns)
  {
    columns_.push_back(std::move(column));
  }
}

const DataColumn* RowMapper::findColumn(const std::string& key) const
{
  auto it = std::find_if(columns_.begin(),
                         columns_.end(),
                         [&key](const DataColumn& column)
                         { return column.getName() == key; });
  return it == columns_.end() ? nullptr : &*it;
}

DataColumn* RowMapper::findColumn(const std::string& key)
{
  return const_cast<DataColumn*>(std::as_const(*this).findColumn(key));
}

const DataColumn& RowMapper::requireColumn(const std::string& key) const
{
  const DataColumn* column = findColumn(key);
  if (column == nullptr)
  {
    throw ColumnNotFoundError(key);
  }
  return *column;
}

//
// Setters
//

void RowMapper::setColumnString(const std::string& key,
                                const DataValue& value,
                                bool stripMarkup,
                                bool allowNull)
{
  DataColumn* column = findColumn(key);
  if (column == nullptr)
  {
    LOG_SAFE(pLogger_, spdlog::level::trace, "Ignored unknown column {}", key);
    return;
  }

  if (allowNull && isNull(value))
  {
    column->setValue(std::monostate{});
    return;
  }
  column->setValue(data_helper::asStringSafe(value, stripMarkup));
}

void RowMapper::setColumnInteger(const std::string& key,
                                 const DataValue& value,
                                 bool allowNull)
{
  DataColumn* column = findColumn(key);
  if (column == nullptr)
  {
    LOG_SAFE(pLogger_, spdlog::level::trace, "Ignored unknown column {}", key);
    return;
  }

  if (allowNull && isNull(value))
  {
    column->setValue(std::monostate{});
    return;
  }
  column->setValue(data_helper::asInt(value));
}

void RowMapper::setColumnFloat(const std::string& key,
                               const DataValue& value,
                               bool allowNull)
{
  DataColumn* column = findColumn(key);
  if (column == nullptr)
  {
    LOG_SAFE(pLogger_, spdlog::level::trace, "Ignored unknown column {}", key);
    return;
  }

  if (allowNull && isNull(value))
  {
    column->setValue(std::monostate{});
    return;
  }
  column->setValue(data_helper::asFloat(value));
}

void RowMapper::setColumnBoolean(const std::string& key,
                                 const DataValue& value,
                                 bool allowNull)
{
  DataColumn* column = findColumn(key);
  if (column == nullptr)
  {
    LOG_SAFE(pLogger_, spdlog::level::trace, "Ignored unknown column {}", key);
    return;
  }

  if (allowNull && isNull(value))
  {
    column->setValue(std::monostate{});
    return;
  }
  column->setValue(data_helper::asBool(value));
}

void RowMapper::setColumnDateTime(const std::string& key,
                                  const DataValue& value,
                                  bool allowNull)
{
  DataColumn* column = findColumn(key);
  if (column == nullptr || column->getDataType() != SqlDataType::Timestamp)
  {
    LOG_SAFE(
      pLogger_, spdlog::level::trace, "Ignored non timestamp column {}", key);
    return;
  }

  // The column coerces null to the epoch either way
  column->setValue(allowNull && isNull(value) ? DataValue{} : value);
}

void RowMapper::setColumnData(const std::string& key,
                              const DataValue& value,
                              bool allowNull)
{
  DataColumn* column = findColumn(key);
  if (column == nullptr || column->getDataType() != SqlDataType::Data)
  {
    LOG_SAFE(pLogger_, spdlog::level::trace, "Ignored non data column {}", key);
    return;
  }

  if (isNull(value))
  {
    column->setValue(allowNull ? DataValue{} : DataValue{Blob{}});
    return;
  }

  if (std::holds_alternative<Blob>(value))
  {
    column->setValue(value);
    return;
  }
  column->setValue(toBlob(data_helper::asString(value)));
}

//
// Getters
//

std::string RowMapper::getColumnString(const std::string& key) const
{
  return getNullableColumnString(key).value_or(std::string{});
}

std::int64_t RowMapper::getColumnInteger(const std::string& key) const
{
  return getNullableColumnInteger(key).value_or(0);
}

double RowMapper::getColumnFloat(const std::string& key) const
{
  return getNullableColumnFloat(key).value_or(0.0);
}

bool RowMapper::getColumnBool(const std::string& key) const
{
  return getNullableColumnBool(key).value_or(false);
}

DateTime RowMapper::getColumnDateTime(const std::string& key) const
{
  return getNullableColumnDateTime(key).value_or(DateTime::epoch());
}

Blob RowMapper::getColumnData(const std::string& key) const
{
  return getNullableColumnData(key).value_or(Blob{});
}

std::optional<std::string> RowMapper::getNullableColumnString(
  const std::string& key) const
{
  const DataValue& value = requireColumn(key).getValue();
  if (const auto* blob = std::get_if<Blob>(&value))
  {
    return blobToString(*blob);
  }
  return getTypedValue<std::string>(key,
                                    "Column does not contain string data");
}

std::optional<std::int64_t> RowMapper::getNullableColumnInteger(
  const std::string& key) const
{
  return getTypedValue<std::int64_t>(key, "Column is not an integer");
}

std::optional<double> RowMapper::getNullableColumnFloat(
  const std::string& key) const
{
  return getTypedValue<double>(key, "Column is not a float");
}

std::optional<bool> RowMapper::getNullableColumnBool(
  const std::string& key) const
{
  return getTypedValue<bool>(key, "Column is not a boolean");
}

std::optional<DateTime> RowMapper::getNullableColumnDateTime(
  const std::string& key) const
{
  return getTypedValue<DateTime>(key, "Column is not a timestamp");
}

std::optional<Blob> RowMapper::getNullableColumnData(
  const std::string& key) const
{
  const DataValue& value = requireColumn(key).getValue();
  if (const auto* text = std::get_if<std::string>(&value))
  {
    return toBlob(*text);
  }
  return getTypedValue<Blob>(key, "Column does not contain binary data");
}

const DataValue& RowMapper::getColumnValue(const std::string& key) const
{
  return requireColumn(key).getValue();
}

//
// Parameters and rows
//

int RowMapper::addColumnsToParameters(Connection& connection,
                                      const std::vector<std::string>& keys,
                                      bool include) const
{
  int count = 0;
  for (const auto& column : columns_)
  {
    if (column.isIdentity())
    {
      continue;
    }
    if (!keys.empty() && contains(keys, column.getName()) != include)
    {
      continue;
    }

    connection.addParameter(column.getDataType(), column.getValue());
    ++count;
  }
  return count;
}

bool RowMapper::loadColumnValues(const Row& row)
{
  if (row.empty())
  {
    return false;
  }

  for (const auto& column : columns_)
  {
    auto it = row.find(column.getName());
    if (it == row.end())
    {
      continue;
    }

    const std::string& key = column.getName();
    const DataValue& value = it->second;
    switch (column.getDataType())
    {
      case SqlDataType::String:
      case SqlDataType::Text:
        setColumnString(key, value, false, true);
        break;
      case SqlDataType::Integer:
        setColumnInteger(key, value, true);
        break;
      case SqlDataType::Float:
        setColumnFloat(key, value, true);
        break;
      case SqlDataType::Bool:
        setColumnBoolean(key, value, true);
        break;
      case SqlDataType::Timestamp:
        setColumnDateTime(key, value, true);
        break;
      case SqlDataType::Data:
        setColumnData(key, value, true);
        break;
    }
  }

  return true;
}

//
// Validation
//

void RowMapper::addValidationError(const std::string& key,
                                   ValidationErrorCode code,
                                   std::optional<std::string> message)
{
  if (!validationStarted_)
  {
    throw ConfigurationError("Initial validation not performed first");
  }
  validationErrors_.emplace_back(key, code, std::move(message));
}

void RowMapper::addCustomValidationError(const std::string& column,
                                         const std::string& message)
{
  addValidationError(column, ValidationErrorCode::CustomError, message);
}

bool RowMapper::testNumberRange(const DataColumn& column,
                                double number,
                                bool stopOnFirstError)
{
  const ColumnOptions& options = column.getOptions();
  if (options.minRange == 0 && options.maxRange == 0)
  {
    return true;
  }

  if (options.maxRange != 0 && number > options.maxRange)
  {
    addValidationError(column.getName(), ValidationErrorCode::ValueRangeTooHigh);
    if (stopOnFirstError)
    {
      return false;
    }
  }

  if (number < options.minRange)
  {
    addValidationError(column.getName(), ValidationErrorCode::ValueRangeTooLow);
    if (stopOnFirstError)
    {
      return false;
    }
  }

  return true;
}

bool RowMapper::doValidation(const std::vector<std::string>& filter,
                             bool stopOnFirstError,
                             const LocalValidation& local)
{
  validationErrors_.clear();
  validationStarted_ = true;

  if (columns_.empty())
  {
    throw ConfigurationError("No columns to validate");
  }

  for (const auto& column : columns_)
  {
    if (column.isIdentity())
    {
      continue;
    }
    if (!filter.empty() && !contains(filter, column.getName()))
    {
      continue;
    }

    const std::string& key = column.getName();
    const DataValue& value = column.getValue();
    const ColumnOptions& options = column.getOptions();
    SqlDataType type = column.getDataType();

    if (options.notNull && isNull(value))
    {
      addValidationError(key, ValidationErrorCode::ValueCannotBeNull);
      if (stopOnFirstError)
      {
        break;
      }
      continue;
    }

    if (options.isRequired)
    {
      bool fail = false;
      switch (type)
      {
        case SqlDataType::String:
        case SqlDataType::Text:
          fail = data_helper::asString(value).empty();
          break;
        case SqlDataType::Timestamp:
          fail = data_helper::asDateTime(value).getTimestamp() == 0;
          break;
        default:
          break;
      }

      if (fail)
      {
        addValidationError(key, ValidationErrorCode::ValueIsNotSet);
        if (stopOnFirstError)
        {
          break;
        }
      }
    }

    if (isStringType(type))
    {
      std::size_t length = valueLength(value);

      if (options.maxLength > 0 && length > options.maxLength)
      {
        addValidationError(key, ValidationErrorCode::ValueLengthTooLong);
        if (stopOnFirstError)
        {
          break;
        }
      }

      // An empty value is left to the required check
      if (options.minLength > 0 && length < options.minLength && length != 0)
      {
        addValidationError(key, ValidationErrorCode::ValueLengthTooShort);
        if (stopOnFirstError)
        {
          break;
        }
      }
    }

    if (type == SqlDataType::Integer || type == SqlDataType::Float)
    {
      if (!testNumberRange(
            column, data_helper::asFloat(value), stopOnFirstError))
      {
        break;
      }
    }

    if (type == SqlDataType::Timestamp)
    {
      const auto* timestamp = std::get_if<DateTime>(&value);
      double seconds =
        timestamp ? static_cast<double>(timestamp->getTimestamp()) : 0.0;
      if (!testNumberRange(column, seconds, stopOnFirstError))
      {
        break;
      }
    }
  }

  if (local)
  {
    local(*this);
  }

  return hasValidationErrors();
}

//
// Query builders
//

std::vector<std::string> RowMapper::getColumnNames(
  const std::vector<std::string>& skipKeys,
  bool skipIdentity,
  bool applyTicks) const
{
  std::vector<std::string> names;
  for (const auto& column : columns_)
  {
    if ((skipIdentity && column.isIdentity()) ||
        contains(skipKeys, column.getName()))
    {
      continue;
    }
    names.push_back(applyTicks ? backtick(column.getName())
                               : column.getName());
  }
  return names;
}

std::vector<std::string> RowMapper::getAllColumnNames(bool useTicks) const
{
  return getColumnNames({}, false, useTicks);
}

const std::string& RowMapper::requireTableName(
  const std::string& tableName) const
{
  if (!tableName.empty())
  {
    return tableName;
  }
  if (tableName_.empty())
  {
    throw ConfigurationError("Table name not set");
  }
  return tableName_;
}

std::vector<Row> RowMapper::queryInsertInto(
  Connection& connection,
  const std::string& tableName,
  const std::vector<std::string>& skipKeys)
{
  const std::string& table = requireTableName(tableName);

  std::vector<std::string> names = getColumnNames(skipKeys, true, true);
  std::vector<std::string> tokens(
    names.size(), std::string(1, ValueFormatter::kTokenCharacter));

  std::string sql = "insert into " + backtick(table) + " (" +
                    joinStrings(names, ",") + ") values (" +
                    joinStrings(tokens, ",") + ")";

  addColumnsToParameters(connection, skipKeys, false);
  return connection.query(sql);
}

std::vector<Row> RowMapper::queryUpdate(
  Connection& connection,
  const std::string& tableName,
  const std::string& whereColumn,
  const std::vector<std::string>& skipKeys)
{
  const std::string& table = requireTableName(tableName);

  std::vector<std::string> sets;
  for (const auto& name : getColumnNames(skipKeys, true, true))
  {
    sets.push_back(name + "=" + ValueFormatter::kTokenCharacter);
  }

  std::string sql =
    "update " + backtick(table) + " set " + joinStrings(sets, ",");

  const DataColumn* where = findColumn(whereColumn);
  if (where != nullptr)
  {
    sql += " where " + backtick(where->getName()) + "=" +
           ValueFormatter::kTokenCharacter;
  }

  addColumnsToParameters(connection, skipKeys, false);
  if (where != nullptr)
  {
    connection.addParameter(where->getDataType(), where->getValue());
  }
  return connection.query(sql);
}

std::string RowMapper::buildWhereClauses(
  const WhereClauses& where,
  const std::string& tableName,
  std::vector<Connection::Parameter>& parameters) const
{
  const std::string separator =
    where.getGroupOperator() == WhereOperator::And ? " and " : " or ";

  std::vector<std::string> fragments;
  for (const auto& clause : where.getClauses())
  {
    if (clause.values.empty())
    {
      continue;
    }

    SqlDataType type = SqlDataType::String;
    if (const DataColumn* column = findColumn(clause.column))
    {
      type = column->getDataType();
    }
    else if (tableName == tableName_)
    {
      throw ArgumentError("Invalid where key: " + clause.column);
    }

    std::vector<std::string> comparisons;
    for (const auto& value : clause.values)
    {
      if (isNull(value))
      {
        comparisons.push_back(backtick(clause.column) + " is NULL");
      }
      else
      {
        parameters.emplace_back(type, value);
        comparisons.push_back(backtick(clause.column) + "=" +
                              ValueFormatter::kTokenCharacter);
      }
    }

    if (comparisons.size() > 1)
    {
      fragments.push_back("(" + joinStrings(comparisons, separator) + ")");
    }
    else
    {
      fragments.push_back(comparisons.front());
    }
  }

  if (fragments.empty())
  {
    return {};
  }
  return " where " + joinStrings(fragments, " and ");
}

void RowMapper::bindParameters(
  Connection& connection,
  const std::vector<Connection::Parameter>& parameters) const
{
  for (const auto& [type, value] : parameters)
  {
    connection.addParameter(type, value);
  }
}

std::vector<Row> RowMapper::querySelect(
  Connection& connection,
  const WhereClauses& where,
  const std::vector<OrderClause>& order,
  const std::string& tableName,
  const std::optional<std::vector<std::string>>& skipKeys)
{
  const std::string& table = requireTableName(tableName);

  std::string sql = "select ";
  if (skipKeys)
  {
    sql += joinStrings(getColumnNames(*skipKeys, false, true), ",");
  }
  else
  {
    sql += "*";
  }

  std::vector<Connection::Parameter> parameters;
  sql += " from " + backtick(table);
  sql += buildWhereClauses(where, table, parameters);

  if (!order.empty())
  {
    std::vector<std::string> orders;
    for (const auto& clause : order)
    {
      orders.push_back(backtick(clause.column) +
                       (clause.ascending ? " ASC" : " DESC"));
    }
    sql += " order by " + joinStrings(orders, ", ");
  }

  bindParameters(connection, parameters);
  return connection.query(sql);
}

std::vector<Row> RowMapper::queryDelete(Connection& connection,
                                        const WhereClauses& where,
                                        const std::string& tableName)
{
  const std::string& table = requireTableName(tableName);

  std::vector<Connection::Parameter> parameters;
  std::string sql = "delete from " + backtick(table) +
                    buildWhereClauses(where, table, parameters);

  bindParameters(connection, parameters);
  return connection.query(sql);
}

}  // namespace cpp_dataobject
