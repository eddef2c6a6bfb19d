#include "cpp_dataobject/src/cpp_dataobject/DBValueFormatter.hpp"

#include <cmath>

#include <spdlog/fmt/fmt.h>

#include "cpp_dataobject/src/cpp_dataobject/DBExceptions.hpp"
#include "cpp_dataobject/src/utils/DataHelper.hpp"
#include "cpp_dataobject/src/utils/StringUtils.hpp"

namespace cpp_dataobject
{

std::string ValueFormatter::format(SqlDataType type,
                                   const DataValue& value,
                                   bool& changedValue) const
{
  changedValue = false;

  if (!isValidSqlDataType(type))
  {
    throw ConfigurationError("Unknown data type in parameter build: " +
                             toString(type));
  }

  if (isNull(value))
  {
    return "NULL";
  }

  switch (type)
  {
    case SqlDataType::Data:
    {
      // Hex literals never contain the token character
      const auto* blob = std::get_if<Blob>(&value);
      return driver_.blobLiteral(blob ? *blob
                                      : toBlob(data_helper::asString(value)));
    }
    case SqlDataType::String:
    case SqlDataType::Text:
    {
      std::string text = std::holds_alternative<Blob>(value)
                           ? blobToString(std::get<Blob>(value))
                           : data_helper::asString(value);
      changedValue =
        replaceAll(text, kTokenCharacter, kValueMagicCharacter) > 0;
      return "'" + driver_.escape(text) + "'";
    }
    case SqlDataType::Integer:
      return std::to_string(data_helper::asInt(value));
    case SqlDataType::Float:
    {
      double number = data_helper::asFloat(value);
      // SQL has no literal for infinity or NaN
      if (!std::isfinite(number))
      {
        throw ArgumentError("Float parameter is not a finite number");
      }
      // Fixed notation, '.' separator whatever the locale
      return fmt::format("{:.6f}", number);
    }
    case SqlDataType::Bool:
      return data_helper::asBool(value) ? "'1'" : "'0'";
    case SqlDataType::Timestamp:
    {
      DateTime timestamp = data_helper::asDateTime(value);
      if (timestamp.isEpoch())
      {
        return "NULL";
      }
      return "'" + timestamp.toGmtString() + "'";
    }
  }

  throw ConfigurationError("Unknown data type in parameter build");
}

void ValueFormatter::restorePlaceholders(std::string& sql)
{
  replaceAll(sql, kValueMagicCharacter, kTokenCharacter);
}

}  // namespace cpp_dataobject
