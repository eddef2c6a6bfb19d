#ifndef DB_DATA_COLUMN_HPP
#define DB_DATA_COLUMN_HPP

#include <cstddef>
#include <string>

#include "cpp_dataobject/src/cpp_dataobject/DBSqlDataType.hpp"
#include "cpp_dataobject/src/utils/DataValue.hpp"

namespace cpp_dataobject
{

/*!
 * \brief Validation constraints attached to a column
 *
 * Lengths apply to String, Text and Data columns. Ranges apply to
 * Integer, Float and Timestamp columns, a timestamp being compared by
 * its Unix time. A limit of 0 is not checked.
 */
struct ColumnOptions
{
  //! The value may not be null
  bool notNull{false};

  //! The value may not be empty (String, Text) or the epoch (Timestamp)
  bool isRequired{false};

  std::size_t minLength{0};
  std::size_t maxLength{0};

  double minRange{0};
  double maxRange{0};
};

/*!
 * \brief One named, typed field of a row mapper
 *
 * The held value always agrees with the declared type, or is null.
 */
class DataColumn
{
public:
  /*!
   * \param name The column name, as in the database table
   * \param type The declared type, fixed for the column's lifetime
   * \param value A default value, passed through setValue() unless null
   * \throws ArgumentError for a type outside SqlDataType
   * \throws TypeMismatchError if \p value does not suit \p type
   */
  DataColumn(std::string name,
             SqlDataType type,
             const DataValue& value = {},
             ColumnOptions options = {});

  static DataColumn makeString(std::string name,
                               const DataValue& value = {},
                               ColumnOptions options = {});

  static DataColumn makeText(std::string name,
                             const DataValue& value = {},
                             ColumnOptions options = {});

  static DataColumn makeData(std::string name,
                             const DataValue& value = {},
                             ColumnOptions options = {});

  static DataColumn makeInteger(std::string name,
                                const DataValue& value = {},
                                ColumnOptions options = {});

  static DataColumn makeFloat(std::string name,
                              const DataValue& value = {},
                              ColumnOptions options = {});

  static DataColumn makeBool(std::string name,
                             const DataValue& value = {},
                             ColumnOptions options = {});

  static DataColumn makeTimestamp(std::string name,
                                  const DataValue& value = {},
                                  ColumnOptions options = {});

  const std::string& getName() const
  {
    return name_;
  }

  SqlDataType getDataType() const
  {
    return type_;
  }

  const DataValue& getValue() const
  {
    return value_;
  }

  /*!
   * \brief Replace the held value
   *
   * String and Text take a string, Data a blob, Integer an int64,
   * Float a double and Bool a bool; each also takes null. Timestamp
   * takes anything, coerced as a date/time with null becoming the
   * epoch.
   *
   * \throws TypeMismatchError for a value of any other kind
   */
  void setValue(const DataValue& value);

  const ColumnOptions& getOptions() const
  {
    return options_;
  }

  //! True for the auto-increment key column, named "Id" in any case
  bool isIdentity() const;

private:
  std::string name_;
  SqlDataType type_;
  DataValue value_;
  ColumnOptions options_;
};

}  // namespace cpp_dataobject

#endif  // DB_DATA_COLUMN_HPP
