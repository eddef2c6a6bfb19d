#ifndef DB_VALUE_FORMATTER_HPP
#define DB_VALUE_FORMATTER_HPP

#include <string>

#include "cpp_dataobject/src/cpp_dataobject/DBDriver.hpp"
#include "cpp_dataobject/src/cpp_dataobject/DBSqlDataType.hpp"
#include "cpp_dataobject/src/utils/DataValue.hpp"

namespace cpp_dataobject
{

/*!
 * \brief Renders a typed value as a SQL literal
 *
 * A '?' inside a String, Text or Data value would later be taken for a
 * placeholder, so it is written as kValueMagicCharacter instead and the
 * caller restores it with restorePlaceholders() once every placeholder
 * has been substituted. The magic character therefore cannot appear in
 * stored data.
 */
class ValueFormatter
{
public:
  //! Marks a positional parameter in SQL text
  static constexpr char kTokenCharacter = '?';

  //! Stands in for a literal kTokenCharacter inside a formatted value
  static constexpr char kValueMagicCharacter = '\x1A';

  explicit ValueFormatter(const Driver& driver) : driver_{driver}
  {
  }

  /*!
   * \brief Format \p value as a literal of type \p type
   *
   * \param changedValue Set to true if a placeholder character in the
   *        value was replaced by the magic character, otherwise false
   * \throws ConfigurationError for a type outside SqlDataType
   * \throws ArgumentError for an infinite or NaN Float value
   */
  std::string format(SqlDataType type,
                     const DataValue& value,
                     bool& changedValue) const;

  //! Turn every magic character in \p sql back into a placeholder
  static void restorePlaceholders(std::string& sql);

private:
  const Driver& driver_;
};

}  // namespace cpp_dataobject

#endif  // DB_VALUE_FORMATTER_HPP
