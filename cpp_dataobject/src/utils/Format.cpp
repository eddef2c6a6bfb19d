#include "cpp_dataobject/src/utils/Format.hpp"

#include <charconv>

#include <spdlog/fmt/fmt.h>

#include "cpp_dataobject/src/utils/DataHelper.hpp"

namespace cpp_dataobject
{

namespace
{

// Inserts ',' every three digits into the integer part of a plain
// decimal rendering such as "-1234567.50".
std::string groupThousands(const std::string& plain)
{
  std::string::size_type start = (!plain.empty() && plain[0] == '-') ? 1 : 0;
  auto point = plain.find('.');
  auto end = point == std::string::npos ? plain.size() : point;

  std::string grouped = plain.substr(0, start);
  for (auto i = start; i < end; ++i)
  {
    grouped += plain[i];
    auto remaining = end - i - 1;
    if (remaining > 0 && remaining % 3 == 0)
    {
      grouped += ',';
    }
  }
  grouped += plain.substr(end);
  return grouped;
}

std::string groupedFixed(double number, int decimals)
{
  auto plain = fmt::format("{:.{}f}", number, decimals);

  // A negative value that rounds to zero prints as "-0.00"
  if (plain[0] == '-' &&
      plain.find_first_not_of("0.", 1) == std::string::npos)
  {
    plain.erase(0, 1);
  }

  return groupThousands(plain);
}

}  // namespace

std::string doubleToString(double number)
{
  return groupedFixed(number, 4);
}

std::string integerToString(std::int64_t number)
{
  return groupThousands(fmt::format("{}", number));
}

std::string currencyToString(double amount, const std::string& currency)
{
  return currency + " " + groupedFixed(amount, 2);
}

std::int64_t priceToInteger(const DataValue& price)
{
  auto text = fmt::format("{:.2f}", data_helper::asFloat(price));
  auto point = text.find('.');
  if (point == std::string::npos)
  {
    // inf or nan
    return 0;
  }
  text.erase(point, 1);

  std::int64_t cents = 0;
  std::from_chars(text.data(), text.data() + text.size(), cents);
  return cents;
}

}  // namespace cpp_dataobject
