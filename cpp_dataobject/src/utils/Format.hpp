#ifndef FORMAT_HPP
#define FORMAT_HPP

#include <cstdint>
#include <string>

#include "cpp_dataobject/src/utils/DataValue.hpp"

namespace cpp_dataobject
{

/*!
 * \brief Format a floating point number with four decimals and
 *        thousands grouping, e.g. 1234.5 -> "1,234.5000"
 */
std::string doubleToString(double number);

/*!
 * \brief Format an integer with thousands grouping,
 *        e.g. -1234567 -> "-1,234,567"
 */
std::string integerToString(std::int64_t number);

/*!
 * \brief Format an amount of money behind its currency symbol,
 *        e.g. (1234.5, "$") -> "$ 1,234.50"
 */
std::string currencyToString(double amount, const std::string& currency);

/*!
 * \brief Convert a price to a whole number of cents, "19.99" -> 1999
 *
 * The value is rounded to two decimals in its text form before the
 * decimal point is dropped, so binary representation error in the
 * float (19.99 * 100 == 1998.9999...) never loses a cent.
 */
std::int64_t priceToInteger(const DataValue& price);

}  // namespace cpp_dataobject

#endif  // FORMAT_HPP
