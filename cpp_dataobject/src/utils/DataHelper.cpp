#include "cpp_dataobject/src/utils/DataHelper.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <type_traits>

#include <boost/algorithm/string.hpp>

#include "cpp_dataobject/src/cpp_dataobject/DBExceptions.hpp"
#include "cpp_dataobject/src/utils/Format.hpp"
#include "cpp_dataobject/src/utils/StringUtils.hpp"

namespace cpp_dataobject::data_helper
{

namespace
{

bool isDigit(char c)
{
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/*!
 * Length of the leading decimal number in \p text: an optional sign,
 * digits with an optional fraction, and an optional exponent.
 * Returns 0 when the text does not start with a number.
 */
std::size_t numericPrefixLength(std::string_view text, bool& isIntegral)
{
  std::size_t pos = 0;
  isIntegral = true;

  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
    ++pos;

  std::size_t digits = 0;
  while (pos < text.size() && isDigit(text[pos]))
  {
    ++pos;
    ++digits;
  }

  if (pos < text.size() && text[pos] == '.')
  {
    std::size_t fraction = 0;
    auto after = pos + 1;
    while (after < text.size() && isDigit(text[after]))
    {
      ++after;
      ++fraction;
    }
    if (digits + fraction > 0)
    {
      isIntegral = false;
      digits += fraction;
      pos = after;
    }
  }

  if (digits == 0)
  {
    return 0;
  }

  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E'))
  {
    auto after = pos + 1;
    if (after < text.size() && (text[after] == '+' || text[after] == '-'))
      ++after;
    if (after < text.size() && isDigit(text[after]))
    {
      while (after < text.size() && isDigit(text[after]))
        ++after;
      isIntegral = false;
      pos = after;
    }
  }

  return pos;
}

std::int64_t clampToInt(double value)
{
  if (std::isnan(value))
  {
    return 0;
  }
  if (value >= static_cast<double>(std::numeric_limits<std::int64_t>::max()))
  {
    return std::numeric_limits<std::int64_t>::max();
  }
  if (value <= static_cast<double>(std::numeric_limits<std::int64_t>::min()))
  {
    return std::numeric_limits<std::int64_t>::min();
  }
  return static_cast<std::int64_t>(value);
}

double parseFloat(std::string_view text)
{
  auto trimmed = boost::algorithm::trim_copy(std::string{text});
  bool isIntegral = true;
  auto length = numericPrefixLength(trimmed, isIntegral);
  if (length == 0)
  {
    return 0.0;
  }

  // from_chars does not accept a leading '+'
  std::size_t first = trimmed[0] == '+' ? 1 : 0;
  double value = 0.0;
  auto [ptr, ec] = std::from_chars(
    trimmed.data() + first, trimmed.data() + length, value);
  if (ec == std::errc::result_out_of_range)
  {
    // Either an underflow towards zero or an overflow to infinity
    auto exponent = trimmed.find_first_of("eE");
    if (exponent < length && trimmed[exponent + 1] == '-')
    {
      return 0.0;
    }
    return trimmed[0] == '-' ? -std::numeric_limits<double>::infinity()
                             : std::numeric_limits<double>::infinity();
  }
  return value;
}

std::int64_t parseInt(std::string_view text)
{
  auto trimmed = boost::algorithm::trim_copy(std::string{text});
  bool isIntegral = true;
  auto length = numericPrefixLength(trimmed, isIntegral);
  if (length == 0)
  {
    return 0;
  }

  if (isIntegral)
  {
    std::size_t first = trimmed[0] == '+' ? 1 : 0;
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(
      trimmed.data() + first, trimmed.data() + length, value);
    if (ec == std::errc{})
    {
      return value;
    }
  }

  return clampToInt(parseFloat(trimmed));
}

}  // namespace

bool isNumeric(std::string_view text)
{
  auto trimmed = boost::algorithm::trim_copy(std::string{text});
  bool isIntegral = true;
  auto length = numericPrefixLength(trimmed, isIntegral);
  return length > 0 && length == trimmed.size();
}

std::string asString(const DataValue& value)
{
  return std::visit(
    [](const auto& v) -> std::string
    {
      using valueType = std::decay_t<decltype(v)>;

      if constexpr (std::is_same_v<valueType, std::monostate>)
      {
        return {};
      }
      else if constexpr (std::is_same_v<valueType, std::string>)
      {
        return v;
      }
      else if constexpr (std::is_same_v<valueType, double>)
      {
        return doubleToString(v);
      }
      else if constexpr (std::is_same_v<valueType, std::int64_t>)
      {
        return integerToString(v);
      }
      else if constexpr (std::is_same_v<valueType, bool>)
      {
        return v ? "True" : "False";
      }
      else if constexpr (std::is_same_v<valueType, DateTime>)
      {
        return v.format();
      }
      else
      {
        return blobToString(v);
      }
    },
    value);
}

std::string asStringSafe(const DataValue& value, bool stripMarkup)
{
  const auto* text = std::get_if<std::string>(&value);
  if (text == nullptr)
  {
    return asString(value);
  }

  return boost::algorithm::trim_copy(
    stripMarkup ? cpp_dataobject::stripMarkup(*text) : *text);
}

double asFloat(const DataValue& value)
{
  return std::visit(
    [](const auto& v) -> double
    {
      using valueType = std::decay_t<decltype(v)>;

      if constexpr (std::is_same_v<valueType, std::monostate>)
      {
        return 0.0;
      }
      else if constexpr (std::is_same_v<valueType, double>)
      {
        return v;
      }
      else if constexpr (std::is_same_v<valueType, std::int64_t>)
      {
        return static_cast<double>(v);
      }
      else if constexpr (std::is_same_v<valueType, bool>)
      {
        return v ? 1.0 : 0.0;
      }
      else if constexpr (std::is_same_v<valueType, std::string>)
      {
        return parseFloat(v);
      }
      else if constexpr (std::is_same_v<valueType, Blob>)
      {
        return parseFloat(blobToString(v));
      }
      else
      {
        throw ArgumentError("Cannot convert object to float");
      }
    },
    value);
}

std::int64_t asInt(const DataValue& value)
{
  return std::visit(
    [](const auto& v) -> std::int64_t
    {
      using valueType = std::decay_t<decltype(v)>;

      if constexpr (std::is_same_v<valueType, std::monostate>)
      {
        return 0;
      }
      else if constexpr (std::is_same_v<valueType, std::int64_t>)
      {
        return v;
      }
      else if constexpr (std::is_same_v<valueType, double>)
      {
        return clampToInt(v);
      }
      else if constexpr (std::is_same_v<valueType, bool>)
      {
        return v ? 1 : 0;
      }
      else if constexpr (std::is_same_v<valueType, std::string>)
      {
        return parseInt(v);
      }
      else if constexpr (std::is_same_v<valueType, Blob>)
      {
        return parseInt(blobToString(v));
      }
      else
      {
        throw ArgumentError("Cannot convert object to integer");
      }
    },
    value);
}

bool asBool(const DataValue& value)
{
  return std::visit(
    [](const auto& v) -> bool
    {
      using valueType = std::decay_t<decltype(v)>;

      if constexpr (std::is_same_v<valueType, std::monostate>)
      {
        return false;
      }
      else if constexpr (std::is_same_v<valueType, bool>)
      {
        return v;
      }
      else if constexpr (std::is_same_v<valueType, std::int64_t> ||
                         std::is_same_v<valueType, double>)
      {
        return v != 0;
      }
      else if constexpr (std::is_same_v<valueType, std::string> ||
                         std::is_same_v<valueType, Blob>)
      {
        auto s = boost::algorithm::to_lower_copy(
          boost::algorithm::trim_copy(std::string(v.begin(), v.end())));
        return s == "1" || s == "true" || s == "on" || s == "yes";
      }
      else
      {
        return true;
      }
    },
    value);
}

DateTime asDateTime(const DataValue& value, const std::string& timezone)
{
  auto zone = TimeZone::fromName(timezone);

  if (const auto* dt = std::get_if<DateTime>(&value))
  {
    return dt->inZone(zone);
  }

  if (std::holds_alternative<std::int64_t>(value) ||
      std::holds_alternative<double>(value))
  {
    return DateTime::fromUnix(asInt(value), zone);
  }

  if (!std::holds_alternative<std::string>(value) &&
      !std::holds_alternative<Blob>(value))
  {
    // null, or a bool, which is not a date
    return DateTime::epoch().inZone(zone);
  }

  auto text = asString(value);
  if (text.empty())
  {
    return DateTime::epoch().inZone(zone);
  }

  if (isNumeric(text))
  {
    return DateTime::fromUnix(parseInt(text), zone);
  }

  return DateTime::parse(text, zone).value_or(DateTime::epoch().inZone(zone));
}

bool hasDateTime(const DataValue& value)
{
  const auto* dt = std::get_if<DateTime>(&value);
  return dt != nullptr && dt->getTimestamp() > 0;
}

}  // namespace cpp_dataobject::data_helper
