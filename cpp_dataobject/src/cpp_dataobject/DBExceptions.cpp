#include "cpp_dataobject/src/cpp_dataobject/DBExceptions.hpp"

namespace cpp_dataobject
{

SqlError::SqlError(const std::string& message, std::string query, int code)
  : std::runtime_error{message}, query_{std::move(query)}, code_{code}
{
}

std::string SqlError::describe() const
{
  return std::string{what()} + " (" + (query_.empty() ? "???" : query_) + ")";
}

}  // namespace cpp_dataobject
