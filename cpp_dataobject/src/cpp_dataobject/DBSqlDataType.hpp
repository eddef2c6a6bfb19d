#ifndef DB_SQL_DATA_TYPE_HPP
#define DB_SQL_DATA_TYPE_HPP

#include <cstdint>
#include <string>

namespace cpp_dataobject
{

/*!
 * The closed set of types a column or bound parameter can carry.
 * The type drives both the coercion of incoming values and the SQL
 * literal produced for them.
 */
enum class SqlDataType : uint8_t
{
  String = 1,  //!< Short string up to a fixed size (VARCHAR)
  Integer,     //!< Integer
  Float,       //!< Floating point number
  Text,        //!< Large text block; markup is preserved
  Timestamp,   //!< Date and time, stored in GMT
  Bool,        //!< True or false (BIT, TINYINT)
  Data         //!< Binary data (BLOB)
};

inline bool isValidSqlDataType(SqlDataType type)
{
  auto raw = static_cast<uint8_t>(type);
  return raw >= static_cast<uint8_t>(SqlDataType::String) &&
         raw <= static_cast<uint8_t>(SqlDataType::Data);
}

//! True for the types held as text or bytes (String, Text, Data)
inline bool isStringType(SqlDataType type)
{
  return type == SqlDataType::String || type == SqlDataType::Text ||
         type == SqlDataType::Data;
}

inline std::string toString(SqlDataType type)
{
  switch (type)
  {
    case SqlDataType::String:
      return "String";
    case SqlDataType::Integer:
      return "Integer";
    case SqlDataType::Float:
      return "Float";
    case SqlDataType::Text:
      return "Text";
    case SqlDataType::Timestamp:
      return "Timestamp";
    case SqlDataType::Bool:
      return "Bool";
    case SqlDataType::Data:
      return "Data";
  }
  return "Unknown(" + std::to_string(static_cast<int>(type)) + ")";
}

}  // namespace cpp_dataobject

#endif  // DB_SQL_DATA_TYPE_HPP
