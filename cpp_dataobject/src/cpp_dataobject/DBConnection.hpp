#ifndef DB_CONNECTION_HPP
#define DB_CONNECTION_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cpp_dataobject/src/cpp_dataobject/DBCredentials.hpp"
#include "cpp_dataobject/src/cpp_dataobject/DBDriver.hpp"
#include "cpp_dataobject/src/cpp_dataobject/DBSqlDataType.hpp"
#include "cpp_dataobject/src/cpp_dataobject/DBValueFormatter.hpp"
#include "cpp_dataobject/src/utils/DataValue.hpp"
#include "cpp_dataobject/src/utils/Logger.hpp"

namespace cpp_dataobject
{

/*!
 * \brief A single synchronous connection with positional parameters
 *
 * Parameters are bound with addParameter() and consumed, left to right,
 * by the '?' tokens of the next query:
 *
 * \code
 * connection.addParameter(SqlDataType::String, std::string("foo"));
 * connection.addParameter(SqlDataType::Integer, std::int64_t{12345});
 * connection.query("select * from Users where Username=? and Type=?");
 * // select * from Users where Username='foo' and Type=12345
 * \endcode
 *
 * A connection holds session state and must not be shared between
 * threads without external locking.
 */
class Connection
{
public:
  //! A bound parameter awaiting the next query
  using Parameter = std::pair<SqlDataType, DataValue>;

  /*!
   * \param credentials Where to connect; stored until open()
   * \param driver The client library to use; SqliteDriver when null
   * \param pLogger Logger for SQL tracing, may be null
   * \throws ArgumentError if every credential field is empty
   */
  explicit Connection(Credentials credentials,
                      std::unique_ptr<Driver> driver = nullptr,
                      std::shared_ptr<spdlog::logger> pLogger = nullptr);

  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  /*!
   * \brief Connect and set the character set to utf8. Does nothing if
   *        already connected.
   * \throws SqlError if the driver cannot connect
   */
  void open();

  //! Release any open cursor and the handle; safe when not connected
  void close();

  bool hasConnection() const;

  /*!
   * \brief Coerce \p value to \p type and queue it for the next query
   *
   * A null value stays null and is written as NULL.
   *
   * \throws ArgumentError for a type outside SqlDataType
   */
  void addParameter(SqlDataType type, const DataValue& value);

  //! Drop pending parameters, the last row count and any open cursor
  void newQuery();

  /*!
   * \brief Substitute the pending parameters into \p sql and run it
   *
   * The connection is opened first if needed. The pending parameters
   * are consumed whether or not the query succeeds.
   *
   * \param skipParameterSubstitution Run \p sql as is, leaving any '?'
   * \return The rows produced, empty for a statement without rows
   * \throws ParameterCountError if placeholders and parameters differ
   * \throws ArgumentError if a Float parameter is infinite or NaN
   * \throws SqlError if the driver rejects the statement
   */
  std::vector<Row> query(const std::string& sql,
                         bool skipParameterSubstitution = false);

  /*!
   * \brief As query(), but rows are fetched one at a time by nextRow()
   */
  void beginQuery(const std::string& sql,
                  bool skipParameterSubstitution = false);

  /*!
   * \brief The next row of the query started by beginQuery()
   * \return Nothing when the rows are exhausted or no query is open
   */
  std::optional<Row> nextRow();

  /*!
   * \brief Call a stored procedure with the pending parameters as its
   *        arguments: call `name`(p1, p2, ...)
   */
  std::vector<Row> procedure(const std::string& name);

  //! As procedure(), but rows are fetched by nextRow()
  void beginProcedure(const std::string& name);

  /*!
   * \brief The id generated by the last insert on this connection
   * \throws ConfigurationError if not connected
   */
  std::int64_t lastId() const;

  /*!
   * \brief Escape text for hand-built SQL outside the parameter system
   * \throws ConfigurationError if not connected
   */
  std::string escapeVariable(std::string_view value) const;

  //! Rows returned or affected by the last query
  std::int64_t getAffectedRowCount() const
  {
    return lastRowCount_;
  }

  const std::vector<Parameter>& getParameters() const
  {
    return parameters_;
  }

  const Credentials& getCredentials() const
  {
    return credentials_;
  }

private:
  //! Consume the pending parameters and produce the SQL to run
  std::string prepareSql(const std::string& sql, bool skipSubstitution);

  std::string buildProcedureCall(const std::string& name);

  Credentials credentials_;

  std::unique_ptr<Driver> driver_;

  ValueFormatter formatter_;

  //! Pending parameters, in binding order
  std::vector<Parameter> parameters_;

  //! The cursor left open by beginQuery()/beginProcedure()
  std::unique_ptr<Driver::Cursor> cursor_;

  std::int64_t lastRowCount_;

  //! The pointer to the spdlog for this object.
  std::shared_ptr<spdlog::logger> pLogger_;
};

}  // namespace cpp_dataobject

#endif  // DB_CONNECTION_HPP
