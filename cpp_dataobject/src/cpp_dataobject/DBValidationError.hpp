#ifndef DB_VALIDATION_ERROR_HPP
#define DB_VALIDATION_ERROR_HPP

#include <optional>
#include <string>

namespace cpp_dataobject
{

enum class ValidationErrorCode : int
{
  Undefined = 0,
  ColumnNotSpecified = 1,
  ValueCannotBeNull = 2,
  ValueIsNotSet = 3,
  ValueRangeTooHigh = 4,
  ValueRangeTooLow = 5,
  ValueLengthTooShort = 6,
  ValueLengthTooLong = 7,
  CustomError = 666
};

/*!
 * \brief One finding of a validation pass. Never thrown.
 */
class ValidationError
{
public:
  ValidationError(std::string columnKey,
                  ValidationErrorCode code,
                  std::optional<std::string> customMessage = std::nullopt);

  //! The column at fault
  const std::string& getColumnKey() const
  {
    return columnKey_;
  }

  ValidationErrorCode getErrorCode() const
  {
    return code_;
  }

  void setErrorDescription(std::string message)
  {
    customMessage_ = std::move(message);
  }

  //! The custom message if one was given, else a fixed text per code
  std::string getErrorDescription() const;

private:
  std::string columnKey_;
  ValidationErrorCode code_;
  std::optional<std::string> customMessage_;
};

}  // namespace cpp_dataobject

#endif  // DB_VALIDATION_ERROR_HPP
