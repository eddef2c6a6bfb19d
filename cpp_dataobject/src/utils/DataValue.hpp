#ifndef DATA_VALUE_HPP
#define DATA_VALUE_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "cpp_dataobject/src/utils/DateTime.hpp"

namespace cpp_dataobject
{

//! Binary data, stored in Data (BLOB) columns
using Blob = std::vector<std::uint8_t>;

/*!
 * A loosely typed value as it arrives from a caller or from the
 * database driver. std::monostate stands for SQL NULL.
 */
using DataValue = std::variant<std::monostate,
                               bool,
                               std::int64_t,
                               double,
                               std::string,
                               DateTime,
                               Blob>;

inline bool isNull(const DataValue& value)
{
  return std::holds_alternative<std::monostate>(value);
}

inline Blob toBlob(const std::string& bytes)
{
  return Blob(bytes.begin(), bytes.end());
}

inline std::string blobToString(const Blob& blob)
{
  return std::string(blob.begin(), blob.end());
}

}  // namespace cpp_dataobject

#endif  // DATA_VALUE_HPP
