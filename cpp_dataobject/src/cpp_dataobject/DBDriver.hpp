#ifndef DB_DRIVER_HPP
#define DB_DRIVER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/unordered_map.hpp>

#include "cpp_dataobject/src/cpp_dataobject/DBCredentials.hpp"
#include "cpp_dataobject/src/utils/DataValue.hpp"

namespace cpp_dataobject
{

/*!
 * One result row, keyed by column name
 */
using Row = boost::unordered_map<std::string, DataValue>;

/*!
 * Abstract boundary to a database client library.
 *
 * A connection talks to the database only through this interface, so
 * tests can script a driver and other engines can be plugged in.
 * Every failure is raised as SqlError carrying the driver message, the
 * driver code and the SQL text.
 */
class Driver
{
public:
  /*!
   * \brief Outcome of executing one SQL text
   */
  struct Result
  {
    std::vector<Row> rows;

    //! True if the statement produces rows (a SELECT), even zero of them
    bool hasRows{false};

    //! Rows changed by a statement that produces no rows
    std::int64_t affectedRows{0};
  };

  /*!
   * \brief Forward-only iteration over the rows of one statement
   */
  class Cursor
  {
  public:
    virtual ~Cursor() = default;

    //! The next row, or nothing once the rows are exhausted
    virtual std::optional<Row> next() = 0;
  };

  virtual ~Driver() = default;

  virtual void open(const Credentials& credentials) = 0;

  virtual void setCharset(const std::string& charset) = 0;

  //! Release the handle; closing a closed driver does nothing
  virtual void close() = 0;

  virtual bool isOpen() const = 0;

  virtual Result execute(const std::string& sql) = 0;

  virtual std::unique_ptr<Cursor> openCursor(const std::string& sql) = 0;

  /*!
   * \brief Escape a value for use inside a single-quoted SQL literal.
   *        The quotes themselves are not added.
   */
  virtual std::string escape(std::string_view value) const = 0;

  /*!
   * \brief A complete literal, quotes included, for binary data. Every
   *        byte is kept, embedded NULs included.
   */
  virtual std::string blobLiteral(const Blob& value) const = 0;

  virtual std::int64_t lastInsertId() const = 0;
};

}  // namespace cpp_dataobject

#endif  // DB_DRIVER_HPP
