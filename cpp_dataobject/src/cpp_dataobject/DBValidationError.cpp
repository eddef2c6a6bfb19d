#include "cpp_dataobject/src/cpp_dataobject/DBValidationError.hpp"

#include <utility>

namespace cpp_dataobject
{

ValidationError::ValidationError(std::string columnKey,
                                 ValidationErrorCode code,
                                 std::optional<std::string> customMessage)
  : columnKey_{std::move(columnKey)},
    code_{code},
    customMessage_{std::move(customMessage)}
{
}

std::string ValidationError::getErrorDescription() const
{
  if (customMessage_)
  {
    return *customMessage_;
  }

  switch (code_)
  {
    case ValidationErrorCode::ColumnNotSpecified:
      return "The specified column has not been defined.";
    case ValidationErrorCode::ValueCannotBeNull:
      return "Value must be set.";
    case ValidationErrorCode::ValueIsNotSet:
      return "Value has not been specified.";
    case ValidationErrorCode::ValueRangeTooHigh:
      return "Value is above the allowed range.";
    case ValidationErrorCode::ValueRangeTooLow:
      return "Value is below the allowed range.";
    case ValidationErrorCode::ValueLengthTooShort:
      return "Value is too short.";
    case ValidationErrorCode::ValueLengthTooLong:
      return "Value has too many characters.";
    default:
      return "Undefined validation error.";
  }
}

}  // namespace cpp_dataobject
