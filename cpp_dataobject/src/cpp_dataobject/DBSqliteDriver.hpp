#ifndef DB_SQLITE_DRIVER_HPP
#define DB_SQLITE_DRIVER_HPP

#include <memory>
#include <string>

#include "sqlite3.h"

#include "cpp_dataobject/src/cpp_dataobject/DBDriver.hpp"
#include "cpp_dataobject/src/utils/Logger.hpp"

namespace cpp_dataobject
{

/*!
 * A wrapping alias for the sqlite3 prepared statement
 * that allows us to use modern C++ memory management
 * with this library.
 */
using PreparedSQLStmt =
  std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

/*!
 * \brief Driver over the SQLite C library
 *
 * Credentials::database is the SQLite url (":memory:" or a file path).
 * The host, user and password are accepted and ignored.
 */
class SqliteDriver : public Driver
{
public:
  explicit SqliteDriver(std::shared_ptr<spdlog::logger> pLogger = nullptr);

  /*!
   * \brief Open the database, creating the file if needed
   * \throws SqlError if SQLite cannot open the url
   */
  void open(const Credentials& credentials) override;

  //! Applied with PRAGMA encoding; "utf8" is mapped to "UTF-8"
  void setCharset(const std::string& charset) override;

  void close() override;

  bool isOpen() const override;

  /*!
   * \brief Run every statement in \p sql
   *
   * The rows and row count reported are those of the last statement.
   */
  Result execute(const std::string& sql) override;

  /*!
   * \brief Compile a single statement to be stepped by the cursor
   * \throws SqlError if \p sql holds more than one statement
   */
  std::unique_ptr<Cursor> openCursor(const std::string& sql) override;

  //! Doubles single quotes over the whole of \p value
  std::string escape(std::string_view value) const override;

  //! X'hex'
  std::string blobLiteral(const Blob& value) const override;

  std::int64_t lastInsertId() const override;

private:
  /*!
   * \brief Compile the statement starting at \p text, a position inside
   *        \p sql. \p tail receives the start of the next statement.
   * \return A null statement if only whitespace or comments remain
   */
  PreparedSQLStmt prepare(const std::string& sql,
                          const char* text,
                          const char** tail);

  [[noreturn]] void raise(const std::string& sql, int code) const;

  //!< The unique pointer storing the SQLite database
  //!< object
  std::unique_ptr<sqlite3, decltype(&sqlite3_close)> db_;

  //! The pointer to the spdlog for this object.
  std::shared_ptr<spdlog::logger> pLogger_;
};

}  // namespace cpp_dataobject

#endif  // DB_SQLITE_DRIVER_HPP
