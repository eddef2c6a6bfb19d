#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

#include "cpp_dataobject/src/cpp_dataobject/DBExceptions.hpp"
#include "cpp_dataobject/src/utils/DataHelper.hpp"
#include "cpp_dataobject/src/utils/DateTime.hpp"

using namespace cpp_dataobject;
namespace dh = cpp_dataobject::data_helper;

namespace
{

struct Temperature
{
  double celsius;

  std::string toString() const
  {
    return "  " + std::to_string(static_cast<int>(celsius)) + "C ";
  }
};

}  // namespace

TEST(DataHelperTest, AsStringFormatsEachKind)
{
  EXPECT_EQ(dh::asString(DataValue{}), "");
  EXPECT_EQ(dh::asString(std::string("plain")), "plain");
  EXPECT_EQ(dh::asString(std::int64_t{1234567}), "1,234,567");
  EXPECT_EQ(dh::asString(1234.5), "1,234.5000");
  EXPECT_EQ(dh::asString(true), "True");
  EXPECT_EQ(dh::asString(false), "False");
  EXPECT_EQ(dh::asString(toBlob("bytes")), "bytes");
  EXPECT_EQ(dh::asString(DateTime::fromUnix(86400)), "1970-01-02 00:00:00");
}

TEST(DataHelperTest, AsStringUsesObjectStringifier)
{
  EXPECT_EQ(dh::asString(Temperature{21.0}), "21C");
}

TEST(DataHelperTest, AsStringSafeStripsMarkupAndTrims)
{
  DataValue html = std::string("  <b>Hello</b> <i>there</i>  ");
  EXPECT_EQ(dh::asStringSafe(html), "Hello there");
  EXPECT_EQ(dh::asStringSafe(html, false), "<b>Hello</b> <i>there</i>");
  EXPECT_EQ(dh::asStringSafe(std::int64_t{42}), "42");
}

TEST(DataHelperTest, AsIntParsesNumericPrefix)
{
  EXPECT_EQ(dh::asInt(DataValue{}), 0);
  EXPECT_EQ(dh::asInt(std::string(" 42 ")), 42);
  EXPECT_EQ(dh::asInt(std::string("12abc")), 12);
  EXPECT_EQ(dh::asInt(std::string("-7 apples")), -7);
  EXPECT_EQ(dh::asInt(std::string("abc")), 0);
  EXPECT_EQ(dh::asInt(std::string("1e3")), 1000);
  EXPECT_EQ(dh::asInt(3.9), 3);
  EXPECT_EQ(dh::asInt(-3.9), -3);
  EXPECT_EQ(dh::asInt(true), 1);
}

TEST(DataHelperTest, AsFloatParsesNumericPrefix)
{
  EXPECT_DOUBLE_EQ(dh::asFloat(DataValue{}), 0.0);
  EXPECT_DOUBLE_EQ(dh::asFloat(std::string("12.5kg")), 12.5);
  EXPECT_DOUBLE_EQ(dh::asFloat(std::string(".25")), 0.25);
  EXPECT_DOUBLE_EQ(dh::asFloat(std::string("+3")), 3.0);
  EXPECT_DOUBLE_EQ(dh::asFloat(std::string("x1")), 0.0);
  EXPECT_DOUBLE_EQ(dh::asFloat(std::int64_t{-4}), -4.0);
  EXPECT_DOUBLE_EQ(dh::asFloat(false), 0.0);
}

TEST(DataHelperTest, NumericCoercionRejectsDateTime)
{
  DataValue stamp = DateTime::fromUnix(100);
  EXPECT_THROW(dh::asInt(stamp), ArgumentError);
  EXPECT_THROW(dh::asFloat(stamp), ArgumentError);
}

TEST(DataHelperTest, AsBoolRecognisesTruthyWords)
{
  EXPECT_TRUE(dh::asBool(std::string("YES")));
  EXPECT_TRUE(dh::asBool(std::string("yes")));
  EXPECT_TRUE(dh::asBool(std::string("1")));
  EXPECT_TRUE(dh::asBool(std::string("on")));
  EXPECT_TRUE(dh::asBool(std::string(" True ")));

  EXPECT_FALSE(dh::asBool(std::string("maybe")));
  EXPECT_FALSE(dh::asBool(std::string("")));
  EXPECT_FALSE(dh::asBool(std::string("0")));
  EXPECT_FALSE(dh::asBool(DataValue{}));

  EXPECT_TRUE(dh::asBool(std::int64_t{-1}));
  EXPECT_FALSE(dh::asBool(0.0));
}

TEST(DataHelperTest, AsDateTimeOfNullAndZeroIsEpoch)
{
  DateTime fromNull = dh::asDateTime(DataValue{});
  DateTime fromZero = dh::asDateTime(std::int64_t{0});
  DateTime fromEmpty = dh::asDateTime(std::string(""));

  EXPECT_EQ(fromNull, DateTime::epoch());
  EXPECT_EQ(fromZero, DateTime::epoch());
  EXPECT_EQ(fromEmpty, DateTime::epoch());

  EXPECT_FALSE(dh::hasDateTime(fromNull));
  EXPECT_FALSE(dh::hasDateTime(fromZero));
  EXPECT_TRUE(dh::hasDateTime(DateTime::fromUnix(1)));
  EXPECT_FALSE(dh::hasDateTime(std::int64_t{1}));
}

TEST(DataHelperTest, AsDateTimeParsesLiterals)
{
  EXPECT_EQ(dh::asDateTime(std::int64_t{86400}).getTimestamp(), 86400);
  EXPECT_EQ(dh::asDateTime(std::string("86400")).getTimestamp(), 86400);
  EXPECT_EQ(dh::asDateTime(std::string("@90")).getTimestamp(), 90);
  EXPECT_EQ(dh::asDateTime(std::string("1970-01-02")).getTimestamp(), 86400);
  EXPECT_EQ(dh::asDateTime(std::string("2001-09-09 01:46:40")).getTimestamp(),
            1000000000);
  EXPECT_EQ(dh::asDateTime(std::string("2001-09-09T01:46:40Z")).getTimestamp(),
            1000000000);
  EXPECT_EQ(
    dh::asDateTime(std::string("2001-09-09 11:46:40+10:00")).getTimestamp(),
    1000000000);
}

TEST(DataHelperTest, AsDateTimeOfGarbageIsEpoch)
{
  EXPECT_EQ(dh::asDateTime(std::string("not a date")), DateTime::epoch());
  EXPECT_EQ(dh::asDateTime(std::string("2001-13-45")), DateTime::epoch());
  EXPECT_EQ(dh::asDateTime(true), DateTime::epoch());
}

TEST(DataHelperTest, AsDateTimeOutsideSupportedYearsIsEpoch)
{
  using data_helper::asDateTime;
  using data_helper::asString;

  EXPECT_TRUE(asDateTime(std::int64_t{400000000000}).isEpoch());
  EXPECT_TRUE(asDateTime(std::numeric_limits<std::int64_t>::min()).isEpoch());
  EXPECT_TRUE(asDateTime(1e300).isEpoch());
  EXPECT_TRUE(asDateTime(std::string("@400000000000")).isEpoch());
  EXPECT_TRUE(asDateTime(std::string("9999-12-31 23:00:00")).isEpoch());

  EXPECT_NO_THROW(asString(asDateTime(std::int64_t{400000000000})));
  EXPECT_EQ(asString(asDateTime(std::int64_t{400000000000})),
            "1970-01-01 00:00:00");
}

TEST(DataHelperTest, SupportedYearsFormatInEveryZone)
{
  auto latest = DateTime::parse("9999-12-30 23:59:59");
  ASSERT_TRUE(latest.has_value());
  EXPECT_TRUE(DateTime::isRepresentable(latest->getTimestamp()));
  EXPECT_FALSE(DateTime::isRepresentable(latest->getTimestamp() + 1));
  EXPECT_EQ(latest->inZone(TimeZone::fromName("+14:00")).format(),
            "9999-12-31 13:59:59");

  auto earliest = DateTime::parse("1400-01-02 00:00:00");
  ASSERT_TRUE(earliest.has_value());
  EXPECT_FALSE(DateTime::isRepresentable(earliest->getTimestamp() - 1));
  EXPECT_EQ(earliest->inZone(TimeZone::fromName("-12:00")).format(),
            "1400-01-01 12:00:00");
}

TEST(DataHelperTest, AsDateTimeConvertsZoneThroughInstant)
{
  DateTime gmt = DateTime::fromUnix(1000000000);
  DateTime sydney = dh::asDateTime(gmt, "+10:00");

  EXPECT_EQ(sydney, gmt);
  EXPECT_EQ(sydney.getTimeZone().getOffset(), std::chrono::minutes{600});
  EXPECT_EQ(sydney.format(), "2001-09-09 11:46:40");
  EXPECT_EQ(sydney.toGmtString(), "2001-09-09 01:46:40");

  EXPECT_THROW(dh::asDateTime(gmt, "Mars/Olympus"), ArgumentError);
}

TEST(DataHelperTest, TimeZoneNames)
{
  EXPECT_EQ(TimeZone::fromName("Z").getName(), "UTC");
  EXPECT_EQ(TimeZone::fromName("-0530").getOffset(), std::chrono::minutes{-330});
  EXPECT_EQ(TimeZone::fromName("+02").getOffset(), std::chrono::minutes{120});
  EXPECT_FALSE(TimeZone::tryFromName("+15:00").has_value());
  EXPECT_THROW(TimeZone::fromName("EST"), ArgumentError);
}

TEST(DataHelperTest, IsNumeric)
{
  EXPECT_TRUE(dh::isNumeric("42"));
  EXPECT_TRUE(dh::isNumeric(" -1.5e3 "));
  EXPECT_FALSE(dh::isNumeric("12abc"));
  EXPECT_FALSE(dh::isNumeric(""));
}
