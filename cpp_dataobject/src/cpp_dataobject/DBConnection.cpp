#include "cpp_dataobject/src/cpp_dataobject/DBConnection.hpp"

#include <spdlog/fmt/fmt.h>

#include "cpp_dataobject/src/cpp_dataobject/DBExceptions.hpp"
#include "cpp_dataobject/src/cpp_dataobject/DBSqliteDriver.hpp"
#include "cpp_dataobject/src/utils/DataHelper.hpp"
#include "cpp_dataobject/src/utils/StringUtils.hpp"

namespace cpp_dataobject
{

namespace
{

std::unique_ptr<Driver> orDefaultDriver(
  std::unique_ptr<Driver> driver,
  const std::shared_ptr<spdlog::logger>& pLogger)
{
  if (driver)
  {
    return driver;
  }
  return std::make_unique<SqliteDriver>(pLogger);
}

}  // namespace

Connection::Connection(Credentials credentials,
                       std::unique_ptr<Driver> driver,
                       std::shared_ptr<spdlog::logger> pLogger)
  : credentials_{std::move(credentials)},
    driver_{orDefaultDriver(std::move(driver), pLogger)},
    formatter_{*driver_},
    parameters_{},
    cursor_{nullptr},
    lastRowCount_{0},
    pLogger_{std::move(pLogger)}
{
  if (credentials_.empty())
  {
    throw ArgumentError("Missing SQL credentials");
  }
}

Connection::~Connection()
{
  close();
}

void Connection::open()
{
  if (hasConnection())
  {
    return;
  }

  driver_->open(credentials_);
  try
  {
    driver_->setCharset("utf8");
  }
  catch (const SqlError&)
  {
    driver_->close();
    throw;
  }

  LOG_SAFE(pLogger_, spdlog::level::debug, "Connection opened");
}

void Connection::close()
{
  cursor_.reset();
  if (driver_->isOpen())
  {
    driver_->close();
    LOG_SAFE(pLogger_, spdlog::level::debug, "Connection closed");
  }
}

bool Connection::hasConnection() const
{
  return driver_->isOpen();
}

void Connection::addParameter(SqlDataType type, const DataValue& value)
{
  if (!isValidSqlDataType(type))
  {
    throw ArgumentError("Invalid data type for parameter: " + toString(type));
  }

  if (isNull(value))
  {
    parameters_.emplace_back(type, std::monostate{});
    return;
  }

  DataValue coerced;
  switch (type)
  {
    case SqlDataType::String:
      coerced = data_helper::asStringSafe(value);
      break;
    case SqlDataType::Text:
      // Markup is preserved in text blocks
      coerced = data_helper::asStringSafe(value, false);
      break;
    case SqlDataType::Integer:
      coerced = data_helper::asInt(value);
      break;
    case SqlDataType::Float:
      coerced = data_helper::asFloat(value);
      break;
    case SqlDataType::Timestamp:
      coerced = data_helper::asDateTime(value);
      break;
    case SqlDataType::Bool:
      coerced = data_helper::asBool(value);
      break;
    case SqlDataType::Data:
      coerced = std::holds_alternative<Blob>(value)
                  ? std::get<Blob>(value)
                  : toBlob(data_helper::asString(value));
      break;
  }

  parameters_.emplace_back(type, std::move(coerced));
}

void Connection::newQuery()
{
  parameters_.clear();
  lastRowCount_ = 0;
  cursor_.reset();
}

std::vector<Row> Connection::query(const std::string& sql,
                                   bool skipParameterSubstitution)
{
  std::string finalSql = prepareSql(sql, skipParameterSubstitution);

  LOG_SAFE(pLogger_, spdlog::level::debug, "Query: {}", finalSql);

  Driver::Result result = driver_->execute(finalSql);
  lastRowCount_ = result.hasRows
                    ? static_cast<std::int64_t>(result.rows.size())
                    : result.affectedRows;
  return std::move(result.rows);
}

void Connection::beginQuery(const std::string& sql,
                            bool skipParameterSubstitution)
{
  std::string finalSql = prepareSql(sql, skipParameterSubstitution);

  LOG_SAFE(pLogger_, spdlog::level::debug, "Begin query: {}", finalSql);

  cursor_ = driver_->openCursor(finalSql);
}

std::optional<Row> Connection::nextRow()
{
  if (!cursor_)
  {
    return std::nullopt;
  }

  std::optional<Row> row;
  try
  {
    row = cursor_->next();
  }
  catch (const SqlError&)
  {
    cursor_.reset();
    throw;
  }

  if (!row)
  {
    cursor_.reset();
    return std::nullopt;
  }

  ++lastRowCount_;
  return row;
}

std::vector<Row> Connection::procedure(const std::string& name)
{
  return query(buildProcedureCall(name), true);
}

void Connection::beginProcedure(const std::string& name)
{
  beginQuery(buildProcedureCall(name), true);
}

std::int64_t Connection::lastId() const
{
  if (!hasConnection())
  {
    throw ConfigurationError("Cannot read the last id as connection not open");
  }
  return driver_->lastInsertId();
}

std::string Connection::escapeVariable(std::string_view value) const
{
  if (!hasConnection())
  {
    throw ConfigurationError("Cannot escape input as connection not open");
  }
  return driver_->escape(value);
}

std::string Connection::prepareSql(const std::string& sql,
                                   bool skipSubstitution)
{
  // Taken now so that a failure below still consumes them
  std::vector<Parameter> parameters = std::move(parameters_);
  parameters_.clear();
  cursor_.reset();
  lastRowCount_ = 0;

  open();

  if (skipSubstitution)
  {
    return sql;
  }

  std::string result;
  result.reserve(sql.size());

  bool hasMagicCharacter = false;
  std::size_t parameterPosition = 0;
  std::size_t start = 0;
  for (;;)
  {
    std::size_t tokenPosition =
      sql.find(ValueFormatter::kTokenCharacter, start);
    if (tokenPosition == std::string::npos)
    {
      break;
    }

    if (parameterPosition == parameters.size())
    {
      LOG_SAFE(pLogger_,
               spdlog::level::err,
               "Placeholder without a parameter in: {}",
               sql);
      throw ParameterCountError("Too many parameters passed in query", sql);
    }

    const auto& [type, value] = parameters[parameterPosition];
    bool didChange = false;
    result.append(sql, start, tokenPosition - start);
    result += formatter_.format(type, value, didChange);
    hasMagicCharacter = hasMagicCharacter || didChange;

    ++parameterPosition;
    start = tokenPosition + 1;
  }
  result.append(sql, start, std::string::npos);

  if (parameterPosition != parameters.size())
  {
    std::string message = fmt::format(
      "Not enough parameters passed to query (expecting {}, got {})",
      parameters.size(),
      parameterPosition);
    LOG_SAFE(pLogger_, spdlog::level::err, "{}: {}", message, sql);
    throw ParameterCountError(message, sql);
  }

  if (hasMagicCharacter)
  {
    ValueFormatter::restorePlaceholders(result);
  }

  return result;
}

std::string Connection::buildProcedureCall(const std::string& name)
{
  // Taken now so that a formatting failure still consumes them
  std::vector<Parameter> parameters = std::move(parameters_);
  parameters_.clear();

  std::vector<std::string> parts;
  bool changed = false;
  for (const auto& [type, value] : parameters)
  {
    bool didChange = false;
    parts.push_back(formatter_.format(type, value, didChange));
    changed = changed || didChange;
  }

  std::string sql =
    "call " + backtick(name) + "(" + joinStrings(parts, ", ") + ")";
  if (changed)
  {
    ValueFormatter::restorePlaceholders(sql);
  }
  return sql;
}

}  // namespace cpp_dataobject
