#ifndef DB_WHERE_CLAUSE_HPP
#define DB_WHERE_CLAUSE_HPP

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cpp_dataobject/src/utils/DataValue.hpp"

namespace cpp_dataobject
{

//! Joins the values of one column inside a where clause
enum class WhereOperator : uint8_t
{
  Or,
  And
};

//! Selects the WhereOperator in the keyed and alternating shapes
inline constexpr std::string_view kWhereControlKey = "!Where";
inline constexpr std::string_view kWhereControlAnd = "!AND";
inline constexpr std::string_view kWhereControlOr = "!OR";

/*!
 * \brief The values one column is compared with. A null value is
 *        rendered as "is NULL".
 */
struct WhereClause
{
  std::string column;
  std::vector<DataValue> values;
};

/*!
 * \brief An ordered set of where clauses
 *
 * Several values of one column are grouped with the group operator,
 * "(`Colour`=? or `Colour`=?)", and different columns are joined with
 * "and". Only one operator applies to a whole set.
 *
 * \code
 * WhereClauses where{{"Colour", std::string("Red")},
 *                    {"Colour", std::string("Blue")},
 *                    {"Size", std::int64_t{4}}};
 * \endcode
 */
class WhereClauses
{
public:
  WhereClauses() = default;

  explicit WhereClauses(std::vector<WhereClause> clauses,
                        WhereOperator groupOperator = WhereOperator::Or);

  /*!
   * \brief Keyed shape: a repeated column adds to that column's values
   * \throws ArgumentError for a bad control key value or a repeated
   *         control key
   */
  WhereClauses(std::initializer_list<std::pair<std::string, DataValue>> pairs);

  /*!
   * \brief Alternating shape: key, value, key, value, ...
   * \throws ArgumentError for an odd length, a key that is not a string
   *         or a bad control key
   */
  static WhereClauses fromAlternating(const std::vector<DataValue>& sequence);

  //! Add one value for \p column, or set the operator via the control key
  WhereClauses& add(const std::string& column, const DataValue& value);

  void setGroupOperator(WhereOperator groupOperator)
  {
    groupOperator_ = groupOperator;
  }

  WhereOperator getGroupOperator() const
  {
    return groupOperator_;
  }

  const std::vector<WhereClause>& getClauses() const
  {
    return clauses_;
  }

  bool empty() const
  {
    return clauses_.empty();
  }

private:
  void applyControlValue(const DataValue& value);

  std::vector<WhereClause> clauses_;
  WhereOperator groupOperator_{WhereOperator::Or};

  //! Set once the control key has been seen
  bool hasControlKey_{false};
};

/*!
 * \brief One "order by" term
 */
struct OrderClause
{
  std::string column;
  bool ascending{true};
};

}  // namespace cpp_dataobject

#endif  // DB_WHERE_CLAUSE_HPP
