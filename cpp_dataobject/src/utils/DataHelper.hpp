#ifndef DATA_HELPER_HPP
#define DATA_HELPER_HPP

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>

#include <boost/algorithm/string/trim.hpp>

#include "cpp_dataobject/src/utils/DataValue.hpp"
#include "cpp_dataobject/src/utils/DateTime.hpp"

/*!
 * Coercion of loosely typed values into guaranteed primitives.
 *
 * None of these throw for primitive input. Only the composite DateTime
 * alternative, which has no numeric meaning, is rejected by asInt and
 * asFloat with an ArgumentError.
 */
namespace cpp_dataobject::data_helper
{

/*!
 * An object that knows how to render itself as text
 */
template <typename T>
concept HasToString = requires(const T& object) {
  { object.toString() } -> std::convertible_to<std::string>;
};

/*!
 * \brief Any value as a string
 *
 * null -> "", a double -> "1,234.5000", an integer -> "1,234",
 * a bool -> "True"/"False", a blob -> its bytes, a DateTime ->
 * "YYYY-MM-DD HH:MM:SS" in its display zone.
 */
std::string asString(const DataValue& value);

/*!
 * \brief Render an arbitrary object through its own toString()
 */
template <HasToString T>
  requires(!std::convertible_to<T, DataValue>)
std::string asString(const T& object)
{
  return boost::algorithm::trim_copy(std::string{object.toString()});
}

/*!
 * \brief As asString, but a string input has any "<...>" markup removed
 *        (when \p stripMarkup is set) and is trimmed of whitespace.
 */
std::string asStringSafe(const DataValue& value, bool stripMarkup = true);

/*!
 * \brief A value as a double; numeric text is read up to the first
 *        character that cannot continue a number ("12.5kg" -> 12.5)
 * \throws ArgumentError for a DateTime
 */
double asFloat(const DataValue& value);

/*!
 * \brief A value as a 64-bit integer; fractional values are truncated
 * \throws ArgumentError for a DateTime
 */
std::int64_t asInt(const DataValue& value);

/*!
 * \brief A value as a bool. Text is true only for "1", "true", "on" or
 *        "yes" in any case; every other string is false.
 */
bool asBool(const DataValue& value);

/*!
 * \brief A value as a DateTime displayed in \p timezone
 *
 * null and "" give the epoch, numbers and numeric text are Unix
 * timestamps, other text is parsed as a date/time literal and gives
 * the epoch when it cannot be understood. A DateTime is converted to
 * \p timezone through its instant.
 *
 * \throws ArgumentError if \p timezone is not a known zone
 */
DateTime asDateTime(const DataValue& value,
                    const std::string& timezone = "GMT");

/*!
 * \brief True if the value is a DateTime strictly after the epoch
 */
bool hasDateTime(const DataValue& value);

/*!
 * \brief True if the whole (trimmed) text is a decimal number
 */
bool isNumeric(std::string_view text);

}  // namespace cpp_dataobject::data_helper

#endif  // DATA_HELPER_HPP
