#ifndef DATE_TIME_HPP
#define DATE_TIME_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cpp_dataobject
{

/*!
 * \brief A fixed-offset time zone used to display a DateTime.
 *
 * Only GMT/UTC and numeric offsets are understood; there is no
 * daylight saving database behind this.
 */
class TimeZone
{
public:
  //! GMT
  TimeZone();

  /*!
   * \brief Look up a zone by name
   * \param name "GMT", "UTC", "Z", or an offset such as "+10:00",
   *        "-0530" or "+02"
   * \throws ArgumentError if the name is not understood
   */
  static TimeZone fromName(std::string_view name);

  //! As fromName, but returns nothing for an unknown name
  static std::optional<TimeZone> tryFromName(std::string_view name);

  const std::string& getName() const
  {
    return name_;
  }

  std::chrono::minutes getOffset() const
  {
    return offset_;
  }

  bool operator==(const TimeZone& rhs) const
  {
    return offset_ == rhs.offset_;
  }

private:
  TimeZone(std::string name, std::chrono::minutes offset);

  std::string name_;
  std::chrono::minutes offset_;
};

/*!
 * \brief An absolute instant, in whole seconds from the Unix epoch,
 *        together with the zone it is displayed in.
 *
 * Two DateTimes are equal when their instants are equal, whatever
 * their display zones. Instants are limited to 1400-01-02 00:00:00
 * through 9999-12-30 23:59:59 GMT.
 */
class DateTime
{
public:
  //! The Unix epoch, displayed in GMT
  DateTime();

  //! An instant outside the supported years gives the epoch
  static DateTime fromUnix(std::int64_t seconds, const TimeZone& zone = {});

  //! True if \p seconds lies within the supported years
  static bool isRepresentable(std::int64_t seconds);

  static DateTime epoch()
  {
    return DateTime{};
  }

  static DateTime now(const TimeZone& zone = {});

  /*!
   * \brief Parse a date/time literal
   *
   * Accepts "now", "@<unix seconds>", "YYYY-MM-DD" and
   * "YYYY-MM-DD HH:MM[:SS[.fff]]" (a 'T' may replace the space),
   * optionally followed by a zone ("Z", "GMT", "UTC", "+HH:MM").
   * Times without a zone are read in \p zone.
   *
   * \return The parsed instant displayed in \p zone, or nothing
   *         if the text is not understood or lies outside the
   *         supported years.
   */
  static std::optional<DateTime> parse(std::string_view text,
                                       const TimeZone& zone = {});

  std::int64_t getTimestamp() const
  {
    return seconds_;
  }

  const TimeZone& getTimeZone() const
  {
    return zone_;
  }

  //! The same instant displayed in another zone
  DateTime inZone(const TimeZone& zone) const;

  bool isEpoch() const
  {
    return seconds_ == 0;
  }

  //! "YYYY-MM-DD HH:MM:SS" in the display zone
  std::string format() const;

  //! "YYYY-MM-DD HH:MM:SS" in GMT
  std::string toGmtString() const;

  bool operator==(const DateTime& rhs) const
  {
    return seconds_ == rhs.seconds_;
  }

  bool operator<(const DateTime& rhs) const
  {
    return seconds_ < rhs.seconds_;
  }

private:
  DateTime(std::int64_t seconds, TimeZone zone);

  std::int64_t seconds_;
  TimeZone zone_;
};

}  // namespace cpp_dataobject

#endif  // DATE_TIME_HPP
