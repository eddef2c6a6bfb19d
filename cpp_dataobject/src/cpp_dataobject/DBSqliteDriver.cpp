#include "cpp_dataobject/src/cpp_dataobject/DBSqliteDriver.hpp"

#include <boost/algorithm/string/case_conv.hpp>

#include "cpp_dataobject/src/cpp_dataobject/DBExceptions.hpp"

namespace cpp_dataobject
{

namespace
{

DataValue readColumn(sqlite3_stmt* stmt, int index)
{
  switch (sqlite3_column_type(stmt, index))
  {
    case SQLITE_INTEGER:
      return static_cast<std::int64_t>(sqlite3_column_int64(stmt, index));
    case SQLITE_FLOAT:
      return sqlite3_column_double(stmt, index);
    case SQLITE_TEXT:
    {
      const unsigned char* text = sqlite3_column_text(stmt, index);
      int size = sqlite3_column_bytes(stmt, index);
      return std::string(reinterpret_cast<const char*>(text),
                         static_cast<std::size_t>(size));
    }
    case SQLITE_BLOB:
    {
      const void* blobData = sqlite3_column_blob(stmt, index);
      int blobSize = sqlite3_column_bytes(stmt, index);
      if (blobData && blobSize > 0)
      {
        const uint8_t* data = static_cast<const uint8_t*>(blobData);
        return Blob(data, data + blobSize);
      }
      return Blob{};
    }
    default:
      return std::monostate{};
  }
}

Row readRow(sqlite3_stmt* stmt)
{
  Row row;
  int count = sqlite3_column_count(stmt);
  for (int index = 0; index < count; ++index)
  {
    row.emplace(sqlite3_column_name(stmt, index), readColumn(stmt, index));
  }
  return row;
}

/*!
 * Steps a single prepared statement one row at a time
 */
class SqliteCursor : public Driver::Cursor
{
public:
  SqliteCursor(PreparedSQLStmt stmt, std::string sql)
    : stmt_{std::move(stmt)}, sql_{std::move(sql)}
  {
  }

  std::optional<Row> next() override
  {
    if (!stmt_)
    {
      return std::nullopt;
    }

    int result = sqlite3_step(stmt_.get());
    if (result == SQLITE_ROW)
    {
      return readRow(stmt_.get());
    }
    if (result == SQLITE_DONE)
    {
      stmt_.reset();
      return std::nullopt;
    }

    std::string message = sqlite3_errmsg(sqlite3_db_handle(stmt_.get()));
    stmt_.reset();
    throw SqlError(message, sql_, result);
  }

private:
  PreparedSQLStmt stmt_;
  std::string sql_;
};

}  // namespace

SqliteDriver::SqliteDriver(std::shared_ptr<spdlog::logger> pLogger)
  : db_{nullptr, sqlite3_close}, pLogger_{std::move(pLogger)}
{
}

void SqliteDriver::open(const Credentials& credentials)
{
  close();

  sqlite3* raw_db = nullptr;
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI;

  int result =
    sqlite3_open_v2(credentials.database.c_str(), &raw_db, flags, nullptr);

  if (result != SQLITE_OK)
  {
    std::string error_msg = "Failed to open database: ";
    if (raw_db)
    {
      error_msg += sqlite3_errmsg(raw_db);
      sqlite3_close(raw_db);
    }
    else
    {
      error_msg += "Unknown error";
    }
    LOG_SAFE(pLogger_, spdlog::level::err, "{}", error_msg);
    throw SqlError(error_msg, {}, result);
  }

  // Transfer ownership to unique_ptr
  db_.reset(raw_db);

  LOG_SAFE(
    pLogger_, spdlog::level::debug, "Opened database {}", credentials.database);
}

void SqliteDriver::setCharset(const std::string& charset)
{
  std::string encoding = boost::algorithm::to_lower_copy(charset);
  if (encoding == "utf8" || encoding == "utf8mb4")
  {
    encoding = "UTF-8";
  }
  else
  {
    encoding = charset;
  }

  execute("PRAGMA encoding = '" + escape(encoding) + "'");
}

void SqliteDriver::close()
{
  if (db_)
  {
    db_.reset();
    LOG_SAFE(pLogger_, spdlog::level::debug, "Closed database");
  }
}

bool SqliteDriver::isOpen() const
{
  return db_ != nullptr;
}

Driver::Result SqliteDriver::execute(const std::string& sql)
{
  Result result;

  const char* text = sql.c_str();
  const char* end = text + sql.size();
  while (text < end)
  {
    const char* tail = nullptr;
    PreparedSQLStmt stmt = prepare(sql, text, &tail);
    text = tail;

    // Whitespace or a comment compiles to no statement
    if (!stmt)
    {
      continue;
    }

    std::vector<Row> rows;
    int code = SQLITE_ROW;
    while ((code = sqlite3_step(stmt.get())) == SQLITE_ROW)
    {
      rows.push_back(readRow(stmt.get()));
    }

    if (code != SQLITE_DONE)
    {
      raise(sql, code);
    }

    result.hasRows = sqlite3_column_count(stmt.get()) > 0;
    if (result.hasRows)
    {
      result.rows = std::move(rows);
      result.affectedRows = 0;
    }
    else
    {
      result.rows.clear();
      result.affectedRows = sqlite3_changes(db_.get());
    }
  }

  return result;
}

std::unique_ptr<Driver::Cursor> SqliteDriver::openCursor(const std::string& sql)
{
  const char* text = sql.c_str();
  const char* end = text + sql.size();

  PreparedSQLStmt stmt{nullptr, sqlite3_finalize};
  while (!stmt && text < end)
  {
    const char* tail = nullptr;
    stmt = prepare(sql, text, &tail);
    text = tail;
  }

  // Only whitespace, comments or empty statements may follow
  while (text < end)
  {
    const char* tail = nullptr;
    PreparedSQLStmt extra = prepare(sql, text, &tail);
    text = tail;
    if (extra)
    {
      LOG_SAFE(pLogger_,
               spdlog::level::err,
               "Cursor given more than one statement: {}",
               sql);
      throw SqlError("A cursor runs a single statement", sql);
    }
  }

  return std::make_unique<SqliteCursor>(std::move(stmt), sql);
}

std::string SqliteDriver::escape(std::string_view value) const
{
  std::string escaped;
  escaped.reserve(value.size());
  for (char c : value)
  {
    if (c == '\'')
    {
      escaped += '\'';
    }
    escaped += c;
  }
  return escaped;
}

std::string SqliteDriver::blobLiteral(const Blob& value) const
{
  static constexpr char kHexDigits[] = "0123456789ABCDEF";

  std::string literal;
  literal.reserve(value.size() * 2 + 3);
  literal += "X'";
  for (std::uint8_t byte : value)
  {
    literal += kHexDigits[byte >> 4];
    literal += kHexDigits[byte & 0x0F];
  }
  literal += '\'';
  return literal;
}

std::int64_t SqliteDriver::lastInsertId() const
{
  if (!db_)
  {
    return 0;
  }
  return sqlite3_last_insert_rowid(db_.get());
}

PreparedSQLStmt SqliteDriver::prepare(const std::string& sql,
                                      const char* text,
                                      const char** tail)
{
  if (!db_)
  {
    throw SqlError("Database is not open", sql);
  }

  const char* end = sql.c_str() + sql.size();
  sqlite3_stmt* rawPtr = nullptr;
  int result = sqlite3_prepare_v2(
    db_.get(), text, static_cast<int>(end - text), &rawPtr, tail);

  PreparedSQLStmt stmt{rawPtr, sqlite3_finalize};
  if (result != SQLITE_OK)
  {
    raise(sql, result);
  }

  // sqlite leaves the tail unset when it consumes everything
  if (*tail == nullptr)
  {
    *tail = end;
  }
  return stmt;
}

void SqliteDriver::raise(const std::string& sql, int code) const
{
  std::string message = db_ ? std::string(sqlite3_errmsg(db_.get()))
                            : std::string("Database is not open");
  LOG_SAFE(pLogger_,
           spdlog::level::err,
           "SQL failed with code {}: {} [{}]",
           code,
           message,
           sql);
  throw SqlError(message, sql, code);
}

}  // namespace cpp_dataobject
