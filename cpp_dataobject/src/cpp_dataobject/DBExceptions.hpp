#ifndef DB_EXCEPTIONS_HPP
#define DB_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace cpp_dataobject
{

/*!
 * \brief Malformed caller input: missing credentials, an invalid
 *        enum value, a bad where-clause shape, a missing file.
 */
class ArgumentError : public std::invalid_argument
{
public:
  explicit ArgumentError(const std::string& message)
    : std::invalid_argument{message}
  {
  }
};

/*!
 * \brief An operation needs state that has not been established yet,
 *        such as a table name, an open connection or a first
 *        validation pass.
 */
class ConfigurationError : public std::logic_error
{
public:
  explicit ConfigurationError(const std::string& message)
    : std::logic_error{message}
  {
  }
};

/*!
 * \brief Base for errors raised about the value held by a column.
 */
class ColumnDataError : public std::runtime_error
{
public:
  ColumnDataError(std::string columnKey, const std::string& message)
    : std::runtime_error{message}, columnKey_{std::move(columnKey)}
  {
  }

  const std::string& getColumnKey() const
  {
    return columnKey_;
  }

private:
  //! The column at fault
  std::string columnKey_;
};

/*!
 * \brief The runtime type of a value disagrees with the declared
 *        SqlDataType of its column.
 */
class TypeMismatchError : public ColumnDataError
{
public:
  using ColumnDataError::ColumnDataError;
};

/*!
 * \brief A getter was asked for a column that was never declared.
 */
class ColumnNotFoundError : public ColumnDataError
{
public:
  explicit ColumnNotFoundError(std::string columnKey)
    : ColumnDataError{std::move(columnKey), "Column does not exist"}
  {
  }
};

/*!
 * \brief A failure reported by the database driver, or by the
 *        connection while preparing SQL for it.
 *
 * Carries the SQL text that was being executed and the driver's
 * error code so that callers can diagnose the failure.
 */
class SqlError : public std::runtime_error
{
public:
  explicit SqlError(const std::string& message,
                    std::string query = {},
                    int code = -1);

  //! The SQL text being executed, or empty if none
  const std::string& getQuery() const
  {
    return query_;
  }

  //! The driver error code, -1 if the driver supplied none
  int getCode() const
  {
    return code_;
  }

  /*!
   * \brief Render the message together with the query for diagnostics,
   *        "message (sql)", with "???" standing in for a missing query.
   */
  std::string describe() const;

private:
  std::string query_;
  int code_;
};

/*!
 * \brief The number of placeholder tokens in a SQL template does not
 *        match the number of bound parameters.
 */
class ParameterCountError : public SqlError
{
public:
  using SqlError::SqlError;
};

}  // namespace cpp_dataobject

#endif  // DB_EXCEPTIONS_HPP
