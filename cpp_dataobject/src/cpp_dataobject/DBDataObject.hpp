#ifndef DB_DATA_OBJECT_HPP
#define DB_DATA_OBJECT_HPP

#include <concepts>
#include <cstdint>
#include <string>
#include <vector>

#include <boost/type_index.hpp>

#include "cpp_dataobject/src/cpp_dataobject/DBConnection.hpp"
#include "cpp_dataobject/src/cpp_dataobject/DBRowMapper.hpp"
#include "cpp_dataobject/src/cpp_dataobject/DBWhereClause.hpp"
#include "cpp_dataobject/src/utils/StringUtils.hpp"

namespace cpp_dataobject
{

/*!
 * \brief What an entity stored in a table provides
 *
 * An entity owns a RowMapper holding its columns and exposes it here.
 *
 * \code
 * class Widget : public DataObject
 * {
 * public:
 *   Widget() : mapper_{tableName(), {DataColumn::makeInteger("Id"),
 *                                    DataColumn::makeString("Name")}}
 *   {
 *   }
 *
 *   std::string tableName() const override { return "widgets"; }
 *   RowMapper& columns() override { return mapper_; }
 *   const RowMapper& columns() const override { return mapper_; }
 *
 * private:
 *   RowMapper mapper_;
 * };
 * \endcode
 */
class DataObject
{
public:
  virtual ~DataObject() = default;

  virtual std::string tableName() const = 0;

  virtual RowMapper& columns() = 0;

  virtual const RowMapper& columns() const = 0;

  /*!
   * \brief Cross-column checks, run after the per-column validation
   *        pass. Report findings with addCustomValidationError().
   */
  virtual void localValidation(RowMapper& mapper)
  {
  }
};

// Entities that can be created empty and filled from a row
template <typename T>
concept DataObjectType =
  std::derived_from<T, DataObject> && std::default_initializable<T>;

/*!
 * \brief Validate an entity: the column pass, then its localValidation()
 * \return True if any error was found
 */
bool validate(DataObject& object,
              const std::vector<std::string>& filter = {},
              bool stopOnFirstError = false);

/*!
 * \brief Insert an entity into its table
 * \return The id generated for the new row
 */
std::int64_t insertObject(Connection& connection, DataObject& object);

/*!
 * \brief A table name derived from the type name, without namespaces:
 *        shop::Widget -> "Widget"
 */
template <typename T>
std::string defaultTableName()
{
  return stripNamespace(boost::typeindex::type_id<T>().pretty_name());
}

/*!
 * \brief Select rows from the table of T and load one T per row
 */
template <DataObjectType T>
std::vector<T> selectObjects(Connection& connection,
                             const WhereClauses& where = {},
                             const std::vector<OrderClause>& order = {})
{
  T prototype;
  std::vector<Row> rows = prototype.columns().querySelect(
    connection, where, order, prototype.tableName());

  std::vector<T> results;
  results.reserve(rows.size());
  for (const auto& row : rows)
  {
    T object;
    object.columns().loadColumnValues(row);
    results.push_back(std::move(object));
  }
  return results;
}

}  // namespace cpp_dataobject

#endif  // DB_DATA_OBJECT_HPP
