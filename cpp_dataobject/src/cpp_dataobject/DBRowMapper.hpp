#ifndef DB_ROW_MAPPER_HPP
#define DB_ROW_MAPPER_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "cpp_dataobject/src/cpp_dataobject/DBConnection.hpp"
#include "cpp_dataobject/src/cpp_dataobject/DBDataColumn.hpp"
#include "cpp_dataobject/src/cpp_dataobject/DBExceptions.hpp"
#include "cpp_dataobject/src/cpp_dataobject/DBValidationError.hpp"
#include "cpp_dataobject/src/cpp_dataobject/DBWhereClause.hpp"
#include "cpp_dataobject/src/utils/DateTime.hpp"
#include "cpp_dataobject/src/utils/Logger.hpp"

namespace cpp_dataobject
{

/*!
 * \brief Maps a fixed, ordered set of typed columns to one table row
 *
 * Entities hold a RowMapper, declare their columns once and use it to
 * bind values, build insert/update/select/delete statements and
 * validate their values. A column named "Id" (in any case) is the
 * auto-increment key and is left out of inserts, updates, bound
 * parameters and validation.
 *
 * \code
 * RowMapper mapper{"widgets",
 *                  {DataColumn::makeInteger("Id"),
 *                   DataColumn::makeString("Name", {}, {.isRequired = true}),
 *                   DataColumn::makeInteger("Age")}};
 * mapper.setColumnString("Name", std::string("abc"));
 * mapper.setColumnInteger("Age", std::int64_t{5});
 * mapper.queryInsertInto(connection);
 * // insert into `widgets` (`Name`,`Age`) values ('abc',5)
 * \endcode
 */
class RowMapper
{
public:
  //! Custom checks run at the end of doValidation()
  using LocalValidation = std::function<void(RowMapper&)>;

  explicit RowMapper(std::shared_ptr<spdlog::logger> pLogger = nullptr);

  RowMapper(std::string tableName,
            std::vector<DataColumn> columns,
            std::shared_ptr<spdlog::logger> pLogger = nullptr);

  //! Append columns; declaration order is kept
  void addColumns(std::vector<DataColumn> columns);

  //! The table name, empty if not set
  const std::string& getTableName() const
  {
    return tableName_;
  }

  void setTableName(std::string tableName)
  {
    tableName_ = std::move(tableName);
  }

  const std::vector<DataColumn>& getColumns() const
  {
    return columns_;
  }

  //! The column called \p key, or null if there is none
  const DataColumn* findColumn(const std::string& key) const;

  //
  // Setters. An unknown key is ignored.
  //

  /*!
   * \brief Store \p value as text, for String and Text columns
   * \param stripMarkup Remove "<...>" markup before storing
   * \param allowNull Keep a null value as null instead of ""
   * \throws TypeMismatchError if the column is not a String or Text column
   */
  void setColumnString(const std::string& key,
                       const DataValue& value,
                       bool stripMarkup = true,
                       bool allowNull = false);

  void setColumnInteger(const std::string& key,
                        const DataValue& value,
                        bool allowNull = false);

  void setColumnFloat(const std::string& key,
                      const DataValue& value,
                      bool allowNull = false);

  void setColumnBoolean(const std::string& key,
                        const DataValue& value,
                        bool allowNull = false);

  //! Only applies to Timestamp columns; null becomes the epoch
  void setColumnDateTime(const std::string& key,
                         const DataValue& value,
                         bool allowNull = false);

  //! Only applies to Data columns
  void setColumnData(const std::string& key,
                     const DataValue& value,
                     bool allowNull = false);

  //
  // Getters. A null value reads as the zero value of the type, or as
  // nothing from the nullable variants.
  //
  // All throw ColumnNotFoundError for an unknown key and
  // TypeMismatchError if the column holds another kind of value.
  //

  //! Also reads Data columns as their bytes
  std::string getColumnString(const std::string& key) const;
  std::int64_t getColumnInteger(const std::string& key) const;
  double getColumnFloat(const std::string& key) const;
  bool getColumnBool(const std::string& key) const;
  DateTime getColumnDateTime(const std::string& key) const;
  Blob getColumnData(const std::string& key) const;

  std::optional<std::string> getNullableColumnString(
    const std::string& key) const;
  std::optional<std::int64_t> getNullableColumnInteger(
    const std::string& key) const;
  std::optional<double> getNullableColumnFloat(const std::string& key) const;
  std::optional<bool> getNullableColumnBool(const std::string& key) const;
  std::optional<DateTime> getNullableColumnDateTime(
    const std::string& key) const;
  std::optional<Blob> getNullableColumnData(const std::string& key) const;

  //! The raw value held by a column
  const DataValue& getColumnValue(const std::string& key) const;

  /*!
   * \brief Bind column values as parameters on \p connection, in
   *        declaration order, never including the identity column
   *
   * \param keys Columns to leave out, or with \p include the only
   *        columns to bind. Empty binds every column.
   * \return The number of parameters bound
   */
  int addColumnsToParameters(Connection& connection,
                             const std::vector<std::string>& keys = {},
                             bool include = false) const;

  /*!
   * \brief Copy the values of a result row into matching columns
   *
   * Values go through the typed setters, markup is kept and a NULL
   * becomes null. Columns absent from the row are left unchanged.
   *
   * \return False if the row is empty
   * \throws TypeMismatchError if a value cannot be stored
   */
  bool loadColumnValues(const Row& row);

  //
  // Validation
  //

  /*!
   * \brief Check every column against its options
   *
   * In order, per column: not null (a failure skips the remaining checks
   * of that column), required, length, then range. \p local runs after
   * the column pass and may add errors through addCustomValidationError().
   *
   * \param filter Only check these columns; empty checks every column
   * \param stopOnFirstError End the column pass at the first failure
   * \return True if any error was found
   * \throws ConfigurationError if no columns have been declared
   */
  bool doValidation(const std::vector<std::string>& filter = {},
                    bool stopOnFirstError = false,
                    const LocalValidation& local = {});

  bool hasValidationErrors() const
  {
    return !validationErrors_.empty();
  }

  //! The errors found by the last doValidation()
  const std::vector<ValidationError>& getValidationErrors() const
  {
    return validationErrors_;
  }

  /*!
   * \brief Record an error found by a custom check
   * \throws ConfigurationError if doValidation() has not been called
   */
  void addCustomValidationError(const std::string& column,
                                const std::string& message);

  //
  // Query builders. Each checks its input and builds the statement
  // first, then binds its own parameters after any already pending on
  // the connection and runs the statement.
  //
  // The table is \p tableName when given, otherwise the mapper's table
  // name; a ConfigurationError is raised when neither is set.
  //

  //! insert into `t` (`A`,`B`) values (?,?)
  std::vector<Row> queryInsertInto(
    Connection& connection,
    const std::string& tableName = {},
    const std::vector<std::string>& skipKeys = {});

  /*!
   * \brief update `t` set `A`=?,`B`=? where `W`=?
   *
   * The where part is only added if \p whereColumn names a column.
   * Without it every row of the table is updated.
   */
  std::vector<Row> queryUpdate(Connection& connection,
                               const std::string& tableName = {},
                               const std::string& whereColumn = {},
                               const std::vector<std::string>& skipKeys = {});

  /*!
   * \brief select * from `t` where ... order by ...
   *
   * \param skipKeys When given, the columns are listed explicitly,
   *        identity included, leaving out these keys
   * \throws ArgumentError for a where key that is not a column of this
   *         mapper's own table
   */
  std::vector<Row> querySelect(
    Connection& connection,
    const WhereClauses& where = {},
    const std::vector<OrderClause>& order = {},
    const std::string& tableName = {},
    const std::optional<std::vector<std::string>>& skipKeys = std::nullopt);

  //! delete from `t` where ...; no where clauses deletes every row
  std::vector<Row> queryDelete(Connection& connection,
                               const WhereClauses& where = {},
                               const std::string& tableName = {});

  //! Every column name, identity included
  std::vector<std::string> getAllColumnNames(bool useTicks = true) const;

private:
  DataColumn* findColumn(const std::string& key);

  const DataColumn& requireColumn(const std::string& key) const;

  void addValidationError(const std::string& key,
                          ValidationErrorCode code,
                          std::optional<std::string> message = std::nullopt);

  //! False if the pass must stop
  bool testNumberRange(const DataColumn& column,
                       double number,
                       bool stopOnFirstError);

  std::vector<std::string> getColumnNames(
    const std::vector<std::string>& skipKeys,
    bool skipIdentity,
    bool applyTicks) const;

  const std::string& requireTableName(const std::string& tableName) const;

  /*!
   * \brief Render the where part of a statement. The values to bind are
   *        appended to \p parameters; nothing is bound on a connection,
   *        so an invalid key leaves no pending parameters behind.
   */
  std::string buildWhereClauses(
    const WhereClauses& where,
    const std::string& tableName,
    std::vector<Connection::Parameter>& parameters) const;

  void bindParameters(
    Connection& connection,
    const std::vector<Connection::Parameter>& parameters) const;

  template <typename T>
  std::optional<T> getTypedValue(const std::string& key,
                                 const char* mismatchMessage) const
  {
    const DataValue& value = requireColumn(key).getValue();
    if (isNull(value))
    {
      return std::nullopt;
    }

    const T* typed = std::get_if<T>(&value);
    if (typed == nullptr)
    {
      throw TypeMismatchError(key, mismatchMessage);
    }
    return *typed;
  }

  std::string tableName_;

  std::vector<DataColumn> columns_;

  std::vector<ValidationError> validationErrors_;

  //! Set by the first doValidation()
  bool validationStarted_;

  //! The pointer to the spdlog for this object.
  std::shared_ptr<spdlog::logger> pLogger_;
};

}  // namespace cpp_dataobject

#endif  // DB_ROW_MAPPER_HPP
