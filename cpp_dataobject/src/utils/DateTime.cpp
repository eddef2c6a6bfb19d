#include "cpp_dataobject/src/utils/DateTime.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <boost/algorithm/string.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include "cpp_dataobject/src/cpp_dataobject/DBExceptions.hpp"

namespace cpp_dataobject
{

namespace
{

const boost::posix_time::ptime kUnixEpoch{boost::gregorian::date{1970, 1, 1}};

// Boost dates stop at the years 1400 and 9999. A day is left at each end
// so that a display offset of up to 14 hours stays inside them.
const std::int64_t kEarliestSeconds =
  (boost::posix_time::ptime{boost::gregorian::date{1400, 1, 2}} - kUnixEpoch)
    .total_seconds();
const std::int64_t kLatestSeconds =
  (boost::posix_time::ptime{boost::gregorian::date{9999, 12, 31}} -
   kUnixEpoch)
    .total_seconds() -
  1;

bool allDigits(std::string_view text)
{
  return !text.empty() &&
         std::all_of(text.begin(),
                     text.end(),
                     [](char c)
                     { return std::isdigit(static_cast<unsigned char>(c)); });
}

int toInt(std::string_view digits)
{
  int value = 0;
  std::from_chars(digits.data(), digits.data() + digits.size(), value);
  return value;
}

std::string formatLocal(std::int64_t localSeconds)
{
  auto stamp = kUnixEpoch + boost::posix_time::seconds(localSeconds);
  auto text = boost::posix_time::to_iso_extended_string(stamp);
  // 1970-01-01T00:00:00
  text[10] = ' ';
  return text;
}

}  // namespace

TimeZone::TimeZone() : name_{"GMT"}, offset_{0}
{
}

TimeZone::TimeZone(std::string name, std::chrono::minutes offset)
  : name_{std::move(name)}, offset_{offset}
{
}

std::optional<TimeZone> TimeZone::tryFromName(std::string_view name)
{
  auto upper = boost::algorithm::to_upper_copy(std::string{name});
  boost::algorithm::trim(upper);

  if (upper == "GMT" || upper == "UTC" || upper == "Z")
  {
    return TimeZone{upper == "Z" ? "UTC" : upper, std::chrono::minutes{0}};
  }

  if (upper.size() < 3 || (upper[0] != '+' && upper[0] != '-'))
  {
    return std::nullopt;
  }

  std::string_view rest{upper};
  rest.remove_prefix(1);

  std::string_view hours;
  std::string_view minutes{"00"};
  if (rest.size() == 2)
  {
    hours = rest;
  }
  else if (rest.size() == 4)
  {
    hours = rest.substr(0, 2);
    minutes = rest.substr(2);
  }
  else if (rest.size() == 5 && rest[2] == ':')
  {
    hours = rest.substr(0, 2);
    minutes = rest.substr(3);
  }
  else
  {
    return std::nullopt;
  }

  if (!allDigits(hours) || !allDigits(minutes))
  {
    return std::nullopt;
  }

  int h = toInt(hours);
  int m = toInt(minutes);
  if (h > 14 || m > 59)
  {
    return std::nullopt;
  }

  int total = h * 60 + m;
  if (upper[0] == '-')
  {
    total = -total;
  }

  return TimeZone{upper, std::chrono::minutes{total}};
}

TimeZone TimeZone::fromName(std::string_view name)
{
  auto zone = tryFromName(name);
  if (!zone)
  {
    throw ArgumentError("Unknown time zone: " + std::string{name});
  }
  return *zone;
}

DateTime::DateTime() : seconds_{0}, zone_{}
{
}

DateTime::DateTime(std::int64_t seconds, TimeZone zone)
  : seconds_{seconds}, zone_{std::move(zone)}
{
}

bool DateTime::isRepresentable(std::int64_t seconds)
{
  return seconds >= kEarliestSeconds && seconds <= kLatestSeconds;
}

DateTime DateTime::fromUnix(std::int64_t seconds, const TimeZone& zone)
{
  if (!isRepresentable(seconds))
  {
    return DateTime{0, zone};
  }
  return DateTime{seconds, zone};
}

DateTime DateTime::now(const TimeZone& zone)
{
  auto since = std::chrono::system_clock::now().time_since_epoch();
  return DateTime{
    std::chrono::duration_cast<std::chrono::seconds>(since).count(), zone};
}

std::optional<DateTime> DateTime::parse(std::string_view text,
                                        const TimeZone& zone)
{
  auto literal = boost::algorithm::trim_copy(std::string{text});
  if (literal.empty())
  {
    return std::nullopt;
  }

  if (boost::algorithm::iequals(literal, "now"))
  {
    return now(zone);
  }

  if (literal[0] == '@')
  {
    std::int64_t seconds = 0;
    const char* first = literal.data() + 1;
    const char* last = literal.data() + literal.size();
    auto [ptr, ec] = std::from_chars(first, last, seconds);
    if (ec != std::errc{} || ptr != last || !isRepresentable(seconds))
    {
      return std::nullopt;
    }
    return DateTime{seconds, zone};
  }

  // Split off a trailing zone designator. The date part "YYYY-MM-DD"
  // is ten characters, so any sign after that belongs to an offset.
  TimeZone literalZone = zone;
  if (literal.size() > 10)
  {
    if (literal.back() == 'Z' || literal.back() == 'z')
    {
      literalZone = TimeZone::fromName("UTC");
      literal.pop_back();
    }
    else if (boost::algorithm::iends_with(literal, " GMT") ||
             boost::algorithm::iends_with(literal, " UTC"))
    {
      literalZone = TimeZone::fromName(literal.substr(literal.size() - 3));
      literal.resize(literal.size() - 4);
    }
    else
    {
      auto sign = literal.find_last_of("+-");
      if (sign != std::string::npos && sign > 10)
      {
        auto offset = TimeZone::tryFromName(literal.substr(sign));
        if (!offset)
        {
          return std::nullopt;
        }
        literalZone = *offset;
        literal.resize(sign);
      }
    }
    boost::algorithm::trim(literal);
  }

  if (literal.size() > 10 && (literal[10] == 'T' || literal[10] == 't'))
  {
    literal[10] = ' ';
  }

  boost::posix_time::ptime stamp;
  try
  {
    if (literal.size() == 10)
    {
      stamp =
        boost::posix_time::ptime{boost::gregorian::from_simple_string(literal)};
    }
    else
    {
      stamp = boost::posix_time::time_from_string(literal);
    }
  }
  catch (const std::exception&)
  {
    // Boost reports malformed and out-of-range fields by throwing
    return std::nullopt;
  }

  if (stamp.is_special())
  {
    return std::nullopt;
  }

  std::int64_t local = (stamp - kUnixEpoch).total_seconds();
  std::int64_t seconds =
    local - std::chrono::duration_cast<std::chrono::seconds>(
              literalZone.getOffset())
              .count();
  if (!isRepresentable(seconds))
  {
    return std::nullopt;
  }

  return DateTime{seconds, zone};
}

DateTime DateTime::inZone(const TimeZone& zone) const
{
  return DateTime{seconds_, zone};
}

std::string DateTime::format() const
{
  return formatLocal(
    seconds_ +
    std::chrono::duration_cast<std::chrono::seconds>(zone_.getOffset())
      .count());
}

std::string DateTime::toGmtString() const
{
  return formatLocal(seconds_);
}

}  // namespace cpp_dataobject
